// Copyright The ligsite Authors.

#include <ligsite/waterbridge.hpp>
#include <ligsite/hbond.hpp>    // for protein_donor_acceptor
#include <ligsite/math.hpp>     // for round3
#include <ligsite/resinfo.hpp>  // for is_water_residue
#include <ligsite/util.hpp>     // for to_upper

namespace ligsite {

bool is_water_oxygen(const Atom& atom) {
  return is_water_residue(atom.residue_name) && to_upper(atom.element) == "O";
}

std::vector<WaterBridgeInteraction> find_water_bridges(const BindingSite& site,
                                                       const NeighborSearch& protein_ns,
                                                       const NeighborSearch& water_ns,
                                                       double max_dist) {
  std::vector<WaterBridgeInteraction> bridges;
  for (const Atom& lig_atom : site.ligand.atoms) {
    std::string el = to_upper(lig_atom.element);
    bool lig_acceptor = (el == "N" || el == "O" || el == "S");
    bool lig_donor = (el == "N" || el == "O");
    if (!lig_acceptor)
      continue;
    for (const Atom* water : water_ns.find_neighbors(lig_atom, max_dist)) {
      double dist_aw = round3(water->pos.dist(lig_atom.pos));
      for (const Atom* atom : protein_ns.find_neighbors(*water, max_dist)) {
        if (is_water_residue(atom->residue_name))
          continue;
        DonorAcceptor prot = protein_donor_acceptor(*atom);
        if (!(prot.donor && lig_acceptor) &&
            !(!prot.donor && prot.acceptor && lig_donor))
          continue;
        const Atom& donor = prot.donor ? *atom : lig_atom;
        const Atom& acceptor = prot.donor ? lig_atom : *atom;
        WaterBridgeInteraction wb;
        wb.residue = atom->residue().label();
        wb.residue_name = atom->residue_name;
        wb.distance_aw = dist_aw;
        wb.distance_dw = round3(atom->pos.dist(water->pos));
        wb.protein_donor = prot.donor;
        wb.donor_atom_serial = donor.serial;
        wb.acceptor_atom_serial = acceptor.serial;
        wb.water_atom_serial = water->serial;
        wb.donor_atom_name = donor.name;
        wb.acceptor_atom_name = acceptor.name;
        wb.water_atom_name = water->name;
        bridges.push_back(wb);
      }
    }
  }
  sort_and_renumber(bridges, [](const WaterBridgeInteraction& wb) {
      return wb.total_distance();
  });
  return bridges;
}

} // namespace ligsite
