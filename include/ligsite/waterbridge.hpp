// Copyright The ligsite Authors.
//
// Water-mediated hydrogen bonds: ligand atom - water oxygen - protein atom.

#ifndef LIGSITE_WATERBRIDGE_HPP_
#define LIGSITE_WATERBRIDGE_HPP_

#include <vector>
#include "interaction.hpp"  // for WaterBridgeInteraction
#include "model.hpp"        // for Atom, BindingSite
#include "neighbor.hpp"     // for NeighborSearch

namespace ligsite {

/// Oxygen of HOH, WAT or DOD.
bool is_water_oxygen(const Atom& atom);

/// Populates ns with water oxygens from its atom list.
inline NeighborSearch& populate_waters(NeighborSearch& ns) {
  return ns.populate(is_water_oxygen);
}

/// For each polar (N, O, S) ligand atom and each water oxygen within
/// max_dist from it, reports protein donors and acceptors within max_dist
/// from the water that complement the ligand atom. Waters themselves are
/// not bridge partners. Sorted by the sum of both distances.
std::vector<WaterBridgeInteraction> find_water_bridges(const BindingSite& site,
                                                       const NeighborSearch& protein_ns,
                                                       const NeighborSearch& water_ns,
                                                       double max_dist);

} // namespace ligsite
#endif
