// Copyright The ligsite Authors.
//
// Hydrophobic contacts between a ligand and hydrophobic residues.

#ifndef LIGSITE_HYDROPHOBIC_HPP_
#define LIGSITE_HYDROPHOBIC_HPP_

#include <vector>
#include "interaction.hpp"  // for HydrophobicInteraction
#include "model.hpp"        // for BindingSite
#include "neighbor.hpp"     // for NeighborSearch

namespace ligsite {

/// For each ligand atom and each hydrophobic residue (ALA, VAL, LEU, ILE,
/// MET, PHE, TRP, PRO, TYR) with any atom within max_dist, reports one
/// contact: the closest atom of that residue. Sorted by distance.
std::vector<HydrophobicInteraction> find_hydrophobic_contacts(const BindingSite& site,
                                                              const NeighborSearch& protein_ns,
                                                              double max_dist);

} // namespace ligsite
#endif
