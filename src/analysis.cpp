// Copyright The ligsite Authors.

#include <ligsite/analysis.hpp>
#include <algorithm>                 // for max
#include <chrono>
#include <exception>                 // for rethrow_if_nested
#include <ligsite/binding_site.hpp>  // for group_ligands, detect_binding_sites
#include <ligsite/hbond.hpp>         // for find_hbonds
#include <ligsite/hydrophobic.hpp>   // for find_hydrophobic_contacts
#include <ligsite/neighbor.hpp>      // for NeighborSearch
#include <ligsite/waterbridge.hpp>   // for find_water_bridges, populate_waters

namespace ligsite {

const char* status_to_string(AnalysisStatus status) {
  switch (status) {
    case AnalysisStatus::Idle: return "idle";
    case AnalysisStatus::Parsing: return "parsing";
    case AnalysisStatus::BuildingGrid: return "building-grid";
    case AnalysisStatus::FindingSites: return "finding-sites";
    case AnalysisStatus::AnalyzingHydrophobic: return "analyzing-hydrophobic";
    case AnalysisStatus::AnalyzingHbond: return "analyzing-hbond";
    case AnalysisStatus::AnalyzingWaterbridge: return "analyzing-waterbridge";
    case AnalysisStatus::Complete: return "complete";
    case AnalysisStatus::Error: return "error";
  }
  unreachable();
}

void AnalysisContext::report(AnalysisStatus status, double percent,
                             const std::string& message,
                             int current_site, int total_sites) {
  if (status == AnalysisStatus::Error) {
    report_error(message);
    return;
  }
  if (finished() || status < status_)
    fail(cat("Invalid analysis state transition: ", status_to_string(status_),
             " -> ", status_to_string(status)));
  if (status != status_)
    logger.debug("stage ", status_to_string(status));
  status_ = status;
  percent_ = std::max(percent_, percent);
  if (on_progress) {
    ProgressUpdate update;
    update.status = status_;
    update.percent = percent_;
    update.message = message;
    update.current_site = current_site;
    update.total_sites = total_sites;
    on_progress(update);
  }
}

void AnalysisContext::report_error(const std::string& message) {
  if (finished())
    fail(cat("Invalid analysis state transition: ", status_to_string(status_),
             " -> error"));
  status_ = AnalysisStatus::Error;
  if (on_progress) {
    ProgressUpdate update;
    update.status = status_;
    update.percent = percent_;
    update.message = message;
    on_progress(update);
  }
}

namespace {

using Clock = std::chrono::steady_clock;

// percent ranges of the per-site stages
const double hydrophobic_band[2] = {40., 20.};
const double hbond_band[2] = {60., 20.};
const double waterbridge_band[2] = {80., 15.};

void report_site(AnalysisContext& ctx, AnalysisStatus status, const double (&band)[2],
                 size_t i, size_t n, const char* what) {
  ctx.report(status, band[0] + double(i) / n * band[1],
             cat("Analyzing ", what, " for site ", i + 1, '/', n, "..."),
             int(i + 1), int(n));
}

void begin_parsing(const AnalysisParams& params, AnalysisContext& ctx) {
  ctx.report(AnalysisStatus::Parsing, 5, "Parsing PDB file...");
  params.check();
}

AnalysisResult analyze_parsed(const ParsedStructure& st, const AnalysisParams& params,
                              AnalysisContext& ctx, Clock::time_point start) {
  ctx.report(AnalysisStatus::Parsing, 10,
             cat("Read ", st.all_atoms.size(), " atoms"));
  if (st.ligand_atoms.empty())
    fail("No ligands found in PDB file");

  ctx.report(AnalysisStatus::BuildingGrid, 20, "Building spatial index...");
  NeighborSearch protein_ns(st.protein_atoms, params.grid_cell_size);
  protein_ns.populate();
  NeighborSearch water_ns(st.protein_atoms, params.grid_cell_size);
  if (params.water_bridges)
    populate_waters(water_ns);
  ctx.logger.debug("indexed ", protein_ns.size(), " protein atoms and ",
                   water_ns.size(), " water oxygens");

  ctx.report(AnalysisStatus::FindingSites, 30, "Detecting binding sites...");
  std::vector<Ligand> ligands = group_ligands(st.ligand_atoms);
  std::vector<BindingSite> sites = detect_binding_sites(ligands, protein_ns,
                                                        params.binding_site_dist);
  if (sites.empty())
    fail("No binding sites found");
  ctx.logger.note(sites.size(), " binding site(s) for ", ligands.size(), " ligand(s)");

  const size_t n = sites.size();
  std::vector<SiteInteractions> interactions(n);
  for (size_t i = 0; i != n; ++i) {
    SiteInteractions& si = interactions[i];
    si.site_id = sites[i].id;
    si.ligand = sites[i].ligand;
    si.waterbridge = InteractionList<WaterBridgeInteraction>::not_computed();
    si.saltbridge = InteractionList<SaltBridgeInteraction>::not_computed();
    si.pistacking = InteractionList<PiStackingInteraction>::not_computed();
    si.pication = InteractionList<PiCationInteraction>::not_computed();
    si.halogenbond = InteractionList<HalogenBondInteraction>::not_computed();
  }

  AnalysisResult result;
  for (size_t i = 0; i != n; ++i) {
    report_site(ctx, AnalysisStatus::AnalyzingHydrophobic, hydrophobic_band, i, n,
                "hydrophobic contacts");
    interactions[i].hydrophobic = InteractionList<HydrophobicInteraction>::from(
        find_hydrophobic_contacts(sites[i], protein_ns, params.hydrophobic_max_dist));
    result.stats.total_hydrophobic += interactions[i].hydrophobic.size();
  }
  for (size_t i = 0; i != n; ++i) {
    report_site(ctx, AnalysisStatus::AnalyzingHbond, hbond_band, i, n, "H-bonds");
    interactions[i].hbond = InteractionList<HbondInteraction>::from(
        find_hbonds(sites[i], protein_ns, params.hbond_max_dist));
    result.stats.total_hbond += interactions[i].hbond.size();
  }
  if (params.water_bridges) {
    for (size_t i = 0; i != n; ++i) {
      report_site(ctx, AnalysisStatus::AnalyzingWaterbridge, waterbridge_band, i, n,
                  "water bridges");
      interactions[i].waterbridge = InteractionList<WaterBridgeInteraction>::from(
          find_water_bridges(sites[i], protein_ns, water_ns, params.waterbridge_max_dist));
      result.stats.total_waterbridge += interactions[i].waterbridge.size();
    }
  }
  for (const SiteInteractions& si : interactions)
    ctx.logger.mesg("site ", si.site_id, " (", si.ligand.name, ' ',
                    si.ligand.residue().label(), "): ",
                    si.hydrophobic.size(), " hydrophobic, ",
                    si.hbond.size(), " H-bonds, ",
                    si.waterbridge.size(), " water bridges");

  result.success = true;
  result.name = st.name;
  result.entry_id = st.entry_id;
  result.params = params;
  for (const BindingSite& site : sites)
    result.ligands.push_back(site.ligand);
  result.stats.total_atoms = st.all_atoms.size();
  result.stats.protein_atoms = st.protein_atoms.size();
  result.stats.ligand_atoms = st.ligand_atoms.size();
  result.stats.total_ligands = ligands.size();
  result.stats.total_sites = n;
  result.binding_sites = std::move(sites);
  result.interactions = std::move(interactions);
  std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
  result.stats.analysis_time_ms = elapsed.count();
  result.timestamp = std::chrono::duration<double>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  ctx.report(AnalysisStatus::Complete, 100, "Analysis complete");
  return result;
}

void append_exception(const std::exception& e, std::string& trace) {
  trace += e.what();
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    trace += "\n  caused by: ";
    append_exception(nested, trace);
  } catch (...) {
    trace += "\n  caused by: exception of unknown type";
  }
}

// Sends the terminal error update. A failing callback must not escape
// from run_guarded, so its exception only goes to the trace.
void finish_with_error(AnalysisContext& ctx, AnalysisResult& result) {
  if (ctx.finished())
    return;
  try {
    ctx.report_error(result.error);
  } catch (const std::exception& e) {
    result.error_trace += "\nprogress callback failed: ";
    append_exception(e, result.error_trace);
  } catch (...) {
    result.error_trace += "\nprogress callback failed: unknown exception";
  }
}

template<typename Func>
AnalysisResult run_guarded(const AnalysisParams& params, AnalysisContext& ctx,
                           const Func& func) {
  AnalysisResult result;
  result.params = params;
  try {
    return func();
  } catch (const std::exception& e) {
    result.error = e.what();
    result.error_trace = cat("in stage ", status_to_string(ctx.status()), ": ");
    append_exception(e, result.error_trace);
  } catch (...) {
    result.error = "unknown exception";
    result.error_trace = cat("in stage ", status_to_string(ctx.status()),
                             ": unknown exception");
  }
  finish_with_error(ctx, result);
  return result;
}

} // anonymous namespace

AnalysisResult analyze(const ParsedStructure& st, const AnalysisParams& params,
                       AnalysisContext& ctx) {
  Clock::time_point start = Clock::now();
  if (ctx.status() == AnalysisStatus::Idle)
    begin_parsing(params, ctx);
  else
    params.check();
  return analyze_parsed(st, params, ctx, start);
}

AnalysisResult analyze_pdb_string(const std::string& text, const std::string& name,
                                  const AnalysisParams& params, AnalysisContext& ctx) {
  Clock::time_point start = Clock::now();
  begin_parsing(params, ctx);
  ParsedStructure st = read_pdb_string(text, name, ctx.logger);
  return analyze_parsed(st, params, ctx, start);
}

AnalysisResult analyze_pdb_file(const std::string& path,
                                const AnalysisParams& params, AnalysisContext& ctx) {
  Clock::time_point start = Clock::now();
  begin_parsing(params, ctx);
  ParsedStructure st = read_pdb_file(path, ctx.logger);
  return analyze_parsed(st, params, ctx, start);
}

AnalysisResult run_analysis(const std::string& text, const std::string& name,
                            const AnalysisParams& params, AnalysisContext& ctx) {
  return run_guarded(params, ctx, [&]() {
      return analyze_pdb_string(text, name, params, ctx);
  });
}

AnalysisResult run_file_analysis(const std::string& path,
                                 const AnalysisParams& params, AnalysisContext& ctx) {
  return run_guarded(params, ctx, [&]() {
      return analyze_pdb_file(path, params, ctx);
  });
}

} // namespace ligsite
