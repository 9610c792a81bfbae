// Copyright The ligsite Authors.
//
// Hydrogen bonds between a ligand and protein atoms, detected from
// donor-acceptor distances only (hydrogens are not placed, angles
// are not checked).

#ifndef LIGSITE_HBOND_HPP_
#define LIGSITE_HBOND_HPP_

#include <vector>
#include "interaction.hpp"  // for HbondInteraction
#include "model.hpp"        // for Atom, BindingSite
#include "neighbor.hpp"     // for NeighborSearch

namespace ligsite {

struct DonorAcceptor {
  bool donor = false;
  bool acceptor = false;
  bool side_chain = false;

  bool any() const { return donor || acceptor; }
};

/// Backbone N is a donor, backbone O (also OT1, OT2, OXT) an acceptor.
/// Polar side-chain atoms of standard residues are tabulated,
/// water oxygens are both donors and acceptors, and other N, O and S
/// atoms are treated as both.
DonorAcceptor protein_donor_acceptor(const Atom& atom);

/// N and O are donors and acceptors, S is an acceptor.
DonorAcceptor ligand_donor_acceptor(const Atom& atom);

/// Pairs (ligand atom, protein atom) within max_dist where one atom can
/// donate and the other can accept, sorted by donor-acceptor distance.
std::vector<HbondInteraction> find_hbonds(const BindingSite& site,
                                          const NeighborSearch& protein_ns,
                                          double max_dist);

} // namespace ligsite
#endif
