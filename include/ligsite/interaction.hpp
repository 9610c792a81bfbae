// Copyright The ligsite Authors.
//
// Records of non-covalent interactions between a ligand and the protein.

#ifndef LIGSITE_INTERACTION_HPP_
#define LIGSITE_INTERACTION_HPP_

#include <algorithm>  // for stable_sort
#include <string>
#include <vector>
#include "model.hpp"  // for Atom, Ligand

namespace ligsite {

// Common fields: index is the 1-based rank after sorting by distance,
// residue is the protein residue label ("316 A"), residue_name is its
// three-letter code. Distances are rounded to 0.001 A.

struct HydrophobicInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance = 0.;
  int ligand_atom_serial = 0;
  int protein_atom_serial = 0;
  std::string ligand_atom_name;
  std::string protein_atom_name;
};

struct HbondInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance_ha = -1.;   // H-A distance; hydrogens are not placed, always -1
  double distance_da = 0.;    // donor-acceptor distance
  double donor_angle = -1.;   // not calculated, always -1
  bool protein_donor = false;
  bool side_chain = false;    // the protein atom is not in the backbone
  int donor_atom_serial = 0;
  int acceptor_atom_serial = 0;
  std::string donor_atom_name;
  std::string acceptor_atom_name;

  bool has_distance_ha() const { return distance_ha >= 0; }
  bool has_donor_angle() const { return donor_angle >= 0; }
};

struct WaterBridgeInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance_aw = 0.;    // ligand atom - water
  double distance_dw = 0.;    // protein atom - water
  double donor_angle = -1.;   // not calculated
  double water_angle = -1.;   // not calculated
  bool protein_donor = false;
  int donor_atom_serial = 0;
  int acceptor_atom_serial = 0;
  int water_atom_serial = 0;
  std::string donor_atom_name;
  std::string acceptor_atom_name;
  std::string water_atom_name;

  double total_distance() const { return distance_aw + distance_dw; }
};

// Families below are not analyzed yet. Their lists are always
// reported as not computed.

struct SaltBridgeInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance = 0.;
  int ligand_atom_serial = 0;
  int protein_atom_serial = 0;
};

enum class StackingType : unsigned char { Parallel, Perpendicular };

struct PiStackingInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance = 0.;
  StackingType type = StackingType::Parallel;
  int ligand_ring_serial = 0;
  int protein_ring_serial = 0;
};

struct PiCationInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance = 0.;
  int ligand_atom_serial = 0;
  int protein_atom_serial = 0;
};

struct HalogenBondInteraction {
  int index = 0;
  std::string residue;
  std::string residue_name;
  double distance = 0.;
  double donor_angle = -1.;
  int ligand_atom_serial = 0;
  int protein_atom_serial = 0;
};

/// Interactions of one family. computed==false means that the family
/// was not analyzed, which is different from an empty computed list.
template<typename T>
struct InteractionList {
  bool computed = false;
  std::vector<T> items;

  static InteractionList not_computed() { return InteractionList(); }
  static InteractionList from(std::vector<T>&& v) {
    InteractionList list;
    list.computed = true;
    list.items = std::move(v);
    return list;
  }
  size_t size() const { return items.size(); }
  bool empty() const { return items.empty(); }
};

struct SiteInteractions {
  int site_id = 0;
  Ligand ligand;
  InteractionList<HydrophobicInteraction> hydrophobic;
  InteractionList<HbondInteraction> hbond;
  InteractionList<WaterBridgeInteraction> waterbridge;
  InteractionList<SaltBridgeInteraction> saltbridge;
  InteractionList<PiStackingInteraction> pistacking;
  InteractionList<PiCationInteraction> pication;
  InteractionList<HalogenBondInteraction> halogenbond;
};

/// Sorts records by key (ties keep the order of discovery)
/// and sets index to 1..N.
template<typename T, typename Key>
void sort_and_renumber(std::vector<T>& v, Key key) {
  std::stable_sort(v.begin(), v.end(), [&](const T& a, const T& b) {
      return key(a) < key(b);
  });
  for (size_t i = 0; i != v.size(); ++i)
    v[i].index = int(i + 1);
}

} // namespace ligsite
#endif
