// Copyright The ligsite Authors.

#include <ligsite/hydrophobic.hpp>
#include <map>
#include <tuple>
#include <ligsite/math.hpp>     // for round3
#include <ligsite/resinfo.hpp>  // for is_hydrophobic_residue

namespace ligsite {

std::vector<HydrophobicInteraction> find_hydrophobic_contacts(const BindingSite& site,
                                                              const NeighborSearch& protein_ns,
                                                              double max_dist) {
  using Key = std::tuple<std::string, int, std::string, int>;
  std::vector<HydrophobicInteraction> contacts;
  std::map<Key, size_t> index;
  for (const Atom& lig_atom : site.ligand.atoms)
    for (const Atom* atom : protein_ns.find_neighbors(lig_atom, max_dist)) {
      if (!is_hydrophobic_residue(atom->residue_name))
        continue;
      double dist = round3(atom->pos.dist(lig_atom.pos));
      Key key(atom->chain, atom->seq_num, atom->residue_name, lig_atom.serial);
      auto it = index.find(key);
      if (it != index.end()) {
        HydrophobicInteraction& prev = contacts[it->second];
        if (dist < prev.distance) {
          prev.distance = dist;
          prev.protein_atom_serial = atom->serial;
          prev.protein_atom_name = atom->name;
        }
        continue;
      }
      index.emplace(key, contacts.size());
      HydrophobicInteraction hc;
      hc.residue = atom->residue().label();
      hc.residue_name = atom->residue_name;
      hc.distance = dist;
      hc.ligand_atom_serial = lig_atom.serial;
      hc.protein_atom_serial = atom->serial;
      hc.ligand_atom_name = lig_atom.name;
      hc.protein_atom_name = atom->name;
      contacts.push_back(hc);
    }
  sort_and_renumber(contacts, [](const HydrophobicInteraction& hc) { return hc.distance; });
  return contacts;
}

} // namespace ligsite
