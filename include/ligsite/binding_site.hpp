// Copyright The ligsite Authors.
//
// Grouping ligand atoms into ligands and finding their binding pockets.

#ifndef LIGSITE_BINDING_SITE_HPP_
#define LIGSITE_BINDING_SITE_HPP_

#include <vector>
#include "model.hpp"     // for Atom, Ligand, BindingSite
#include "neighbor.hpp"  // for NeighborSearch

namespace ligsite {

/// Groups atoms by (chain, sequence number, residue name), in the order
/// in which the residues first appear.
std::vector<Ligand> group_ligands(const std::vector<Atom>& ligand_atoms);

/// Residues of the atoms, without duplicates, sorted by chain, sequence
/// number and residue name.
std::vector<ResidueRef> residues_of(const std::vector<Atom>& atoms);

/// Finds protein atoms within max_dist from any atom of each non-water
/// ligand. Ligands that have no protein atoms nearby are skipped.
/// Sites are numbered from 1, in the order of ligands.
std::vector<BindingSite> detect_binding_sites(const std::vector<Ligand>& ligands,
                                              const NeighborSearch& protein_ns,
                                              double max_dist);

} // namespace ligsite
#endif
