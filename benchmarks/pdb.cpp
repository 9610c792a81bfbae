// Copyright The ligsite Authors.

// Microbenchmark of reading atoms, the spatial index and the analysis.
// Call it with path to a pdb file as an argument.

#include <cstdio>
#include "ligsite/analysis.hpp"
#include "ligsite/binding_site.hpp"
#include "ligsite/neighbor.hpp"
#include "ligsite/pdb.hpp"
#include <benchmark/benchmark.h>

static const char* path;

static void read_pdb_file(benchmark::State& state) {
  for (auto _ : state) {
    ligsite::ParsedStructure st = ligsite::read_pdb_file(path);
    benchmark::DoNotOptimize(st);
  }
}

static void neighbor_search_ctor(benchmark::State& state) {
  using namespace ligsite;
  ParsedStructure st = read_pdb_file(path);
  for (auto _ : state) {
    NeighborSearch ns(st.protein_atoms, 5.0);
    ns.populate();
    benchmark::DoNotOptimize(ns);
  }
}

static void neighbor_search_find(benchmark::State& state) {
  using namespace ligsite;
  ParsedStructure st = read_pdb_file(path);
  Position ref = st.protein_atoms.at(st.protein_atoms.size() / 2).pos;
  NeighborSearch ns(st.protein_atoms, 5.0);
  ns.populate();
  for (auto _ : state) {
    auto r = ns.find_atoms(ref, 4);
    benchmark::DoNotOptimize(r);
  }
}

static void neighbor_search_for_each(benchmark::State& state) {
  using namespace ligsite;
  ParsedStructure st = read_pdb_file(path);
  Position ref = st.protein_atoms.at(st.protein_atoms.size() / 2).pos;
  NeighborSearch ns(st.protein_atoms, 5.0);
  ns.populate();
  for (auto _ : state) {
    double sum = 0;
    ns.for_each(ref, 4, [&sum](const NeighborSearch::Mark&, double d) { sum += d; });
    benchmark::DoNotOptimize(sum);
  }
}

static void detect_sites(benchmark::State& state) {
  using namespace ligsite;
  ParsedStructure st = read_pdb_file(path);
  NeighborSearch ns(st.protein_atoms, 5.0);
  ns.populate();
  std::vector<Ligand> ligands = group_ligands(st.ligand_atoms);
  for (auto _ : state) {
    std::vector<BindingSite> sites = detect_binding_sites(ligands, ns, 7.5);
    benchmark::DoNotOptimize(sites);
  }
}

static void full_analysis(benchmark::State& state) {
  using namespace ligsite;
  ParsedStructure st = read_pdb_file(path);
  AnalysisParams params;
  for (auto _ : state) {
    AnalysisContext ctx;
    AnalysisResult r = analyze(st, params, ctx);
    benchmark::DoNotOptimize(r);
  }
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::printf("Call it with path to a pdb file as an argument.\n");
    return 1;
  }
  path = argv[argc-1];
  {
    ligsite::ParsedStructure st = ligsite::read_pdb_file(path);
    std::printf("PDB file: %s with %zu protein and %zu ligand atoms.\n",
                st.name.c_str(), st.protein_atoms.size(), st.ligand_atoms.size());
    if (st.protein_atoms.empty()) {
      std::printf("No protein atoms.\n");
      return 1;
    }
  }
  benchmark::RegisterBenchmark("read_pdb_file", read_pdb_file);
  benchmark::RegisterBenchmark("neighbor_search_ctor", neighbor_search_ctor);
  benchmark::RegisterBenchmark("neighbor_search_find", neighbor_search_find);
  benchmark::RegisterBenchmark("neighbor_search_for_each",
                               neighbor_search_for_each);
  benchmark::RegisterBenchmark("detect_sites", detect_sites);
  benchmark::RegisterBenchmark("full_analysis", full_analysis);
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();
}
