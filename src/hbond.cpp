// Copyright The ligsite Authors.

#include <ligsite/hbond.hpp>
#include <ligsite/math.hpp>   // for round3
#include <ligsite/util.hpp>   // for to_upper

namespace ligsite {

namespace {

struct PolarAtomRule {
  const char* residue;
  const char* atom;
  DonorAcceptor da;
};

const DonorAcceptor donor_sc = {true, false, true};
const DonorAcceptor acceptor_sc = {false, true, true};
const DonorAcceptor both_sc = {true, true, true};

const PolarAtomRule polar_atom_rules[] = {
  {"SER", "OG",  both_sc},
  {"THR", "OG1", both_sc},
  {"TYR", "OH",  both_sc},
  {"CYS", "SG",  both_sc},
  {"ASN", "ND2", donor_sc},
  {"ASN", "OD1", acceptor_sc},
  {"GLN", "NE2", donor_sc},
  {"GLN", "OE1", acceptor_sc},
  {"HIS", "ND1", both_sc},
  {"HIS", "NE2", both_sc},
  {"TRP", "NE1", both_sc},
  {"ARG", "NE",  donor_sc},
  {"ARG", "NH1", donor_sc},
  {"ARG", "NH2", donor_sc},
  {"LYS", "NZ",  donor_sc},
  {"ASP", "OD1", acceptor_sc},
  {"ASP", "OD2", acceptor_sc},
  {"GLU", "OE1", acceptor_sc},
  {"GLU", "OE2", acceptor_sc},
  // water oxygen
  {"HOH", "O",   {true, true, false}},
  {"WAT", "O",   {true, true, false}},
  {"DOD", "O",   {true, true, false}},
};

} // anonymous namespace

DonorAcceptor protein_donor_acceptor(const Atom& atom) {
  std::string name = to_upper(atom.name);
  std::string resname = to_upper(atom.residue_name);
  // the table goes first, because water O is not a backbone oxygen
  for (const PolarAtomRule& rule : polar_atom_rules)
    if (resname == rule.residue && name == rule.atom)
      return rule.da;
  if (name == "N")
    return {true, false, false};
  if (name == "O" || name == "OT1" || name == "OT2" || name == "OXT")
    return {false, true, false};
  std::string el = to_upper(atom.element);
  if (el == "N" || el == "O" || el == "S")
    return both_sc;
  return {};
}

DonorAcceptor ligand_donor_acceptor(const Atom& atom) {
  std::string el = to_upper(atom.element);
  if (el == "N" || el == "O")
    return {true, true, false};
  if (el == "S")
    return {false, true, false};
  return {};
}

std::vector<HbondInteraction> find_hbonds(const BindingSite& site,
                                          const NeighborSearch& protein_ns,
                                          double max_dist) {
  std::vector<HbondInteraction> hbonds;
  for (const Atom& lig_atom : site.ligand.atoms) {
    DonorAcceptor lig = ligand_donor_acceptor(lig_atom);
    if (!lig.any())
      continue;
    for (const Atom* atom : protein_ns.find_neighbors(lig_atom, max_dist)) {
      DonorAcceptor prot = protein_donor_acceptor(*atom);
      bool protein_donates = prot.donor && lig.acceptor;
      bool ligand_donates = lig.donor && prot.acceptor;
      if (!protein_donates && !ligand_donates)
        continue;
      // if both directions are possible, the protein is reported as donor
      const Atom& donor = protein_donates ? *atom : lig_atom;
      const Atom& acceptor = protein_donates ? lig_atom : *atom;
      HbondInteraction hb;
      hb.residue = atom->residue().label();
      hb.residue_name = atom->residue_name;
      hb.distance_da = round3(atom->pos.dist(lig_atom.pos));
      hb.protein_donor = protein_donates;
      hb.side_chain = prot.side_chain;
      hb.donor_atom_serial = donor.serial;
      hb.acceptor_atom_serial = acceptor.serial;
      hb.donor_atom_name = donor.name;
      hb.acceptor_atom_name = acceptor.name;
      hbonds.push_back(hb);
    }
  }
  sort_and_renumber(hbonds, [](const HbondInteraction& hb) { return hb.distance_da; });
  return hbonds;
}

} // namespace ligsite
