// Copyright The ligsite Authors.

// Microbenchmark of residue name classification.

#include "ligsite/resinfo.hpp"
#include "ligsite/hbond.hpp"
#include <benchmark/benchmark.h>
#include <stdlib.h>               // for rand

static const std::string residue_names[10] =
    { "GLY", "ASN", "ATP", "HOH", "LEU", "ZN", "NAG", "GLU", "ALA", "SER" };

static void is_excluded_residue_x10(benchmark::State& state) {
  std::string names[10];
  for (int i = 0; i != 10; ++i)
    names[i] = rand() % 1000 == 0 ? "GLN" : residue_names[i];
  for (auto _ : state) {
    int n = 0;
    for (int i = 0; i != 10; ++i)
      n += ligsite::is_excluded_residue(names[i]);
    benchmark::DoNotOptimize(n);
  }
}

static void is_hydrophobic_residue_x10(benchmark::State& state) {
  for (auto _ : state) {
    int n = 0;
    for (int i = 0; i != 10; ++i)
      n += ligsite::is_hydrophobic_residue(residue_names[i]);
    benchmark::DoNotOptimize(n);
  }
}

static void protein_donor_acceptor(benchmark::State& state) {
  ligsite::Atom atom;
  atom.name = "OD1";
  atom.residue_name = "GLU";
  atom.element = "O";
  for (auto _ : state) {
    ligsite::DonorAcceptor da = ligsite::protein_donor_acceptor(atom);
    benchmark::DoNotOptimize(da);
  }
}

BENCHMARK(is_excluded_residue_x10);
BENCHMARK(is_hydrophobic_residue_x10);
BENCHMARK(protein_donor_acceptor);
BENCHMARK_MAIN();
