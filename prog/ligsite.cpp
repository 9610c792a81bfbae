// Copyright The ligsite Authors.
//
// Finds ligand binding sites and lists interactions in each site.

#include <cstdio>
#include <string>
#include <ligsite/analysis.hpp>
#include "options.h"

namespace {

using namespace ligsite;
using std::printf;

enum OptionIndex { SiteDist=4, HydrophobicDist, HbondDist, SaltBridgeDist,
                   PiStackingDist, PiCationDist, HalogenDist, WaterBridgeDist,
                   CellSize, NoWaterBridge, SitesOnly, Summary, Progress };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] INPUT[...]"
    "\nFinds ligand binding sites in a PDB file and analyzes"
    "\nhydrophobic contacts, hydrogen bonds and water bridges."
    "\nINPUT can be gzipped; - means stdin.\n\nOptions:"},
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { SiteDist, 0, "", "site-dist", Arg::Float,
    "  --site-dist=D  \tBinding site distance in A (default 7.5)." },
  { HydrophobicDist, 0, "", "hydrophobic-dist", Arg::Float,
    "  --hydrophobic-dist=D  \tMax. hydrophobic contact distance (default 4.0)." },
  { HbondDist, 0, "", "hbond-dist", Arg::Float,
    "  --hbond-dist=D  \tMax. donor-acceptor distance (default 3.5)." },
  { SaltBridgeDist, 0, "", "saltbridge-dist", Arg::Float,
    "  --saltbridge-dist=D  \tMax. salt bridge distance (default 5.5)." },
  { PiStackingDist, 0, "", "pistacking-dist", Arg::Float,
    "  --pistacking-dist=D  \tMax. pi-stacking distance (default 4.1)." },
  { PiCationDist, 0, "", "pication-dist", Arg::Float,
    "  --pication-dist=D  \tMax. pi-cation distance (default 6.0)." },
  { HalogenDist, 0, "", "halogen-dist", Arg::Float,
    "  --halogen-dist=D  \tMax. halogen bond distance (default 6.0)." },
  { WaterBridgeDist, 0, "", "waterbridge-dist", Arg::Float,
    "  --waterbridge-dist=D  \tMax. distance to the bridging water (default 4.0)." },
  { CellSize, 0, "", "cell-size", Arg::Float,
    "  --cell-size=D  \tCell size of the spatial index (default 5.0, min. 1.0)." },
  { NoWaterBridge, 0, "", "no-waterbridge", Arg::None,
    "  --no-waterbridge  \tDo not search for water bridges." },
  { SitesOnly, 0, "", "sites", Arg::None,
    "  --sites  \tOnly list binding sites." },
  { Summary, 0, "", "summary", Arg::None,
    "  --summary  \tPrint only one line of statistics per file." },
  { Progress, 0, "", "progress", Arg::None,
    "  --progress  \tPrint progress to stderr." },
  { 0, 0, 0, 0, 0, 0 }
};

const char* yes_no(bool b) { return b ? "yes" : "no"; }

void print_summary(const AnalysisResult& r) {
  const AnalysisStats& s = r.stats;
  std::string id = r.entry_id.empty() ? "" : " " + r.entry_id;
  printf("%s:%s atoms: %zu (protein %zu, ligand %zu)  sites: %zu"
         "  hydrophobic: %zu  H-bonds: %zu  water bridges: %zu  time: %.1f ms\n",
         r.name.c_str(), id.c_str(),
         s.total_atoms, s.protein_atoms, s.ligand_atoms, s.total_sites,
         s.total_hydrophobic, s.total_hbond, s.total_waterbridge,
         s.analysis_time_ms);
}

void print_site(const BindingSite& site) {
  const Ligand& lig = site.ligand;
  printf("Site %d: %s %s %d (%s), %zu ligand atoms, %zu pocket residues\n",
         site.id, lig.name.c_str(), lig.chain.c_str(), lig.seq_num,
         ligand_kind_to_string(lig.kind), lig.atoms.size(),
         site.pocket_residues.size());
  printf("  pocket:");
  for (size_t i = 0; i != site.pocket_residues.size(); ++i) {
    if (i != 0 && i % 8 == 0)
      printf("\n         ");
    printf(" %s", site.pocket_residues[i].str().c_str());
  }
  printf("\n");
}

template<typename T>
bool print_list_header(const char* title, const InteractionList<T>& list) {
  if (!list.computed) {
    printf("  %s: not computed\n", title);
    return false;
  }
  printf("  %s: %zu\n", title, list.size());
  return !list.empty();
}

void print_interactions(const SiteInteractions& si) {
  if (print_list_header("Hydrophobic contacts", si.hydrophobic)) {
    printf("    %3s %-8s %-4s %7s  %-12s %-12s\n",
           "#", "residue", "aa", "dist", "ligand atom", "protein atom");
    for (const HydrophobicInteraction& h : si.hydrophobic.items)
      printf("    %3d %-8s %-4s %7.3f  %-4s %7d  %-4s %7d\n",
             h.index, h.residue.c_str(), h.residue_name.c_str(), h.distance,
             h.ligand_atom_name.c_str(), h.ligand_atom_serial,
             h.protein_atom_name.c_str(), h.protein_atom_serial);
  }
  if (print_list_header("Hydrogen bonds", si.hbond)) {
    printf("    %3s %-8s %-4s %7s  %-13s %-12s %-12s %s\n",
           "#", "residue", "aa", "D-A", "protein donor", "donor", "acceptor",
           "side chain");
    for (const HbondInteraction& h : si.hbond.items)
      printf("    %3d %-8s %-4s %7.3f  %-13s %-4s %7d  %-4s %7d  %s\n",
             h.index, h.residue.c_str(), h.residue_name.c_str(), h.distance_da,
             yes_no(h.protein_donor),
             h.donor_atom_name.c_str(), h.donor_atom_serial,
             h.acceptor_atom_name.c_str(), h.acceptor_atom_serial,
             yes_no(h.side_chain));
  }
  if (print_list_header("Water bridges", si.waterbridge)) {
    printf("    %3s %-8s %-4s %7s %7s  %-13s %-12s %-12s %-12s\n",
           "#", "residue", "aa", "A-W", "D-W", "protein donor",
           "donor", "acceptor", "water");
    for (const WaterBridgeInteraction& w : si.waterbridge.items)
      printf("    %3d %-8s %-4s %7.3f %7.3f  %-13s %-4s %7d  %-4s %7d  %-4s %7d\n",
             w.index, w.residue.c_str(), w.residue_name.c_str(),
             w.distance_aw, w.distance_dw, yes_no(w.protein_donor),
             w.donor_atom_name.c_str(), w.donor_atom_serial,
             w.acceptor_atom_name.c_str(), w.acceptor_atom_serial,
             w.water_atom_name.c_str(), w.water_atom_serial);
  }
  // families that are not analyzed yet have only a header
  print_list_header("Salt bridges", si.saltbridge);
  print_list_header("Pi-stacking", si.pistacking);
  print_list_header("Pi-cation", si.pication);
  print_list_header("Halogen bonds", si.halogenbond);
}

void print_progress(const ProgressUpdate& u) {
  if (u.has_site_counter())
    std::fprintf(stderr, "[%3.0f%%] %s (%d/%d)\n", u.percent,
                 status_to_string(u.status), u.current_site, u.total_sites);
  else
    std::fprintf(stderr, "[%3.0f%%] %s: %s\n", u.percent,
                 status_to_string(u.status), u.message.c_str());
}

} // anonymous namespace

int main(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.require_input_files_as_args();
  p.check_exclusive_pair(SitesOnly, Summary);
  int verbose = p.options[Verbose].count();

  AnalysisParams params;
  params.binding_site_dist = p.number_or(SiteDist, params.binding_site_dist);
  params.hydrophobic_max_dist = p.number_or(HydrophobicDist, params.hydrophobic_max_dist);
  params.hbond_max_dist = p.number_or(HbondDist, params.hbond_max_dist);
  params.saltbridge_max_dist = p.number_or(SaltBridgeDist, params.saltbridge_max_dist);
  params.pistacking_max_dist = p.number_or(PiStackingDist, params.pistacking_max_dist);
  params.pication_max_dist = p.number_or(PiCationDist, params.pication_max_dist);
  params.halogen_max_dist = p.number_or(HalogenDist, params.halogen_max_dist);
  params.waterbridge_max_dist = p.number_or(WaterBridgeDist, params.waterbridge_max_dist);
  params.grid_cell_size = p.number_or(CellSize, params.grid_cell_size);
  params.water_bridges = !p.options[NoWaterBridge];

  int failed = 0;
  for (int i = 0; i < p.nonOptionsCount(); ++i) {
    const char* input = p.nonOption(i);
    if (verbose > 0 || (p.nonOptionsCount() > 1 && !p.options[Summary]))
      printf("%sFile: %s\n", (i > 0 ? "\n" : ""), input);
    AnalysisContext ctx;
    ctx.logger.callback = Logger::to_stderr;
    ctx.logger.threshold = verbose == 0 ? 3 : verbose == 1 ? 6 : 8;
    if (p.options[Progress])
      ctx.on_progress = print_progress;
    AnalysisResult result = run_file_analysis(input, params, ctx);
    if (!result.success) {
      std::fprintf(stderr, "ERROR: %s: %s\n", input, result.error.c_str());
      if (verbose > 1)
        std::fprintf(stderr, "%s\n", result.error_trace.c_str());
      ++failed;
      continue;
    }
    print_summary(result);
    if (p.options[Summary])
      continue;
    for (size_t j = 0; j != result.binding_sites.size(); ++j) {
      printf("\n");
      print_site(result.binding_sites[j]);
      if (!p.options[SitesOnly])
        print_interactions(result.interactions[j]);
    }
  }
  return failed == 0 ? 0 : 1;
}
