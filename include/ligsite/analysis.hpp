// Copyright The ligsite Authors.
//
// The analysis pipeline: reading atoms, building the spatial index,
// finding binding sites and analyzing interactions in each site.
// Every call uses its own AnalysisContext, so analyses can run
// in parallel in separate threads.

#ifndef LIGSITE_ANALYSIS_HPP_
#define LIGSITE_ANALYSIS_HPP_

#include <functional>
#include <string>
#include <vector>
#include "interaction.hpp"  // for SiteInteractions
#include "logger.hpp"       // for Logger
#include "model.hpp"        // for Ligand, BindingSite
#include "params.hpp"       // for AnalysisParams
#include "pdb.hpp"          // for ParsedStructure

namespace ligsite {

/// States of the pipeline, in the order in which they are entered.
/// Error can follow any state; Complete and Error are terminal.
enum class AnalysisStatus : unsigned char {
  Idle,
  Parsing,
  BuildingGrid,
  FindingSites,
  AnalyzingHydrophobic,
  AnalyzingHbond,
  AnalyzingWaterbridge,
  Complete,
  Error
};

/// Returns hyphenated name such as "building-grid".
const char* status_to_string(AnalysisStatus status);

struct ProgressUpdate {
  AnalysisStatus status = AnalysisStatus::Idle;
  double percent = 0.;       // 0-100
  std::string message;
  int current_site = 0;      // 1-based, set in the per-site stages
  int total_sites = 0;

  bool has_site_counter() const { return total_sites > 0; }
};

/// Per-invocation state: progress reporting and logging.
/// Enforces forward-only status transitions.
class AnalysisContext {
public:
  std::function<void(const ProgressUpdate&)> on_progress;
  Logger logger;

  AnalysisStatus status() const { return status_; }
  double percent() const { return percent_; }
  bool finished() const {
    return status_ == AnalysisStatus::Complete || status_ == AnalysisStatus::Error;
  }

  /// Moves to the status (or stays in it) and sends the update.
  /// Throws std::runtime_error on a backward transition or after finishing.
  void report(AnalysisStatus status, double percent, const std::string& message,
              int current_site=0, int total_sites=0);

  /// Moves to the Error state and sends the error message.
  void report_error(const std::string& message);

private:
  AnalysisStatus status_ = AnalysisStatus::Idle;
  double percent_ = 0.;
};

struct AnalysisStats {
  size_t total_atoms = 0;
  size_t protein_atoms = 0;
  size_t ligand_atoms = 0;
  size_t total_ligands = 0;     // ligand instances before the pocket search
  size_t total_sites = 0;
  size_t total_hydrophobic = 0;
  size_t total_hbond = 0;
  size_t total_waterbridge = 0;
  double analysis_time_ms = 0.;
};

struct AnalysisResult {
  bool success = false;
  std::string error;
  std::string error_trace;   // stage and nested exceptions, if failed
  std::string name;          // structure name, from the file name
  std::string entry_id;      // from HEADER, may be empty
  double timestamp = 0.;     // seconds since the epoch, at completion
  AnalysisParams params;
  std::vector<Ligand> ligands;  // the ligands of binding_sites
  std::vector<BindingSite> binding_sites;
  std::vector<SiteInteractions> interactions;  // one per binding site
  AnalysisStats stats;
};

/// Runs the pipeline on atoms that were already read.
/// Throws std::runtime_error if there are no ligands or no binding sites.
AnalysisResult analyze(const ParsedStructure& st, const AnalysisParams& params,
                       AnalysisContext& ctx);

/// Reads the PDB-format text and runs the pipeline. Throws on failure.
AnalysisResult analyze_pdb_string(const std::string& text, const std::string& name,
                                  const AnalysisParams& params, AnalysisContext& ctx);

/// Reads a file (possibly gzipped, "-" for stdin) and runs the pipeline.
AnalysisResult analyze_pdb_file(const std::string& path,
                                const AnalysisParams& params, AnalysisContext& ctx);

/// Like analyze_pdb_string(), but doesn't throw: errors are reported
/// through ctx and returned as a result with success == false.
AnalysisResult run_analysis(const std::string& text, const std::string& name,
                            const AnalysisParams& params, AnalysisContext& ctx);

/// Like analyze_pdb_file(), but doesn't throw.
AnalysisResult run_file_analysis(const std::string& path,
                                 const AnalysisParams& params, AnalysisContext& ctx);

} // namespace ligsite
#endif
