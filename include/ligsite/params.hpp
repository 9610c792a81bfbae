// Copyright The ligsite Authors.
//
// Distance cutoffs and switches of the analysis.

#ifndef LIGSITE_PARAMS_HPP_
#define LIGSITE_PARAMS_HPP_

#include <cmath>      // for isfinite
#include "fail.hpp"   // for fail
#include "util.hpp"   // for cat

namespace ligsite {

/// All distances are in Angstroms.
struct AnalysisParams {
  static constexpr double min_grid_cell_size = 1.0;

  double binding_site_dist = 7.5;
  double hydrophobic_max_dist = 4.0;
  double hbond_max_dist = 3.5;
  // reserved for interaction families that are not analyzed yet
  double saltbridge_max_dist = 5.5;
  double pistacking_max_dist = 4.1;
  double pication_max_dist = 6.0;
  double halogen_max_dist = 6.0;

  double waterbridge_max_dist = 4.0;
  /// Edge of the cubic cells in NeighborSearch, at least min_grid_cell_size.
  double grid_cell_size = 5.0;
  /// If false, water bridges are not searched and reported as not computed.
  bool water_bridges = true;

  /// Throws std::runtime_error if any distance is not a positive number
  /// or if the grid cell size is below min_grid_cell_size.
  void check() const {
    check_distance("binding site distance", binding_site_dist);
    check_distance("hydrophobic distance", hydrophobic_max_dist);
    check_distance("H-bond distance", hbond_max_dist);
    check_distance("salt bridge distance", saltbridge_max_dist);
    check_distance("pi-stacking distance", pistacking_max_dist);
    check_distance("pi-cation distance", pication_max_dist);
    check_distance("halogen bond distance", halogen_max_dist);
    check_distance("water bridge distance", waterbridge_max_dist);
    check_distance("grid cell size", grid_cell_size);
    if (grid_cell_size < min_grid_cell_size)
      fail(cat("Invalid grid cell size: ", grid_cell_size,
               " (minimum: ", min_grid_cell_size, ")"));
  }

private:
  static void check_distance(const char* what, double d) {
    if (!std::isfinite(d) || d <= 0)
      fail(cat("Invalid ", what, ": ", d));
  }
};

} // namespace ligsite
#endif
