// Copyright The ligsite Authors.

#include <ligsite/binding_site.hpp>
#include <algorithm>            // for sort, unique
#include <unordered_map>
#include <unordered_set>
#include <ligsite/resinfo.hpp>  // for ligand_kind_of
#include <ligsite/util.hpp>     // for cat

namespace ligsite {

namespace {

std::string residue_key(const std::string& chain, int seq_num, const std::string& name) {
  return cat(chain, ':', seq_num, ':', name);
}

} // anonymous namespace

std::vector<Ligand> group_ligands(const std::vector<Atom>& ligand_atoms) {
  std::vector<Ligand> ligands;
  std::unordered_map<std::string, size_t> index;
  for (const Atom& atom : ligand_atoms) {
    std::string key = residue_key(atom.chain, atom.seq_num, atom.residue_name);
    auto it = index.find(key);
    if (it == index.end()) {
      it = index.emplace(key, ligands.size()).first;
      ligands.emplace_back();
      Ligand& lig = ligands.back();
      lig.chain = atom.chain;
      lig.seq_num = atom.seq_num;
      lig.name = atom.residue_name;
      lig.kind = ligand_kind_of(atom.residue_name);
    }
    ligands[it->second].atoms.push_back(atom);
  }
  return ligands;
}

std::vector<ResidueRef> residues_of(const std::vector<Atom>& atoms) {
  std::vector<ResidueRef> residues;
  residues.reserve(atoms.size());
  for (const Atom& atom : atoms)
    residues.push_back(atom.residue());
  std::sort(residues.begin(), residues.end());
  residues.erase(std::unique(residues.begin(), residues.end()), residues.end());
  return residues;
}

std::vector<BindingSite> detect_binding_sites(const std::vector<Ligand>& ligands,
                                              const NeighborSearch& protein_ns,
                                              double max_dist) {
  std::vector<BindingSite> sites;
  for (const Ligand& ligand : ligands) {
    if (ligand.is_water())
      continue;
    // the same protein atom is usually near several ligand atoms
    std::unordered_set<const Atom*> in_pocket;
    std::vector<Atom> pocket_atoms;
    for (const Atom& lig_atom : ligand.atoms)
      for (const Atom* atom : protein_ns.find_neighbors(lig_atom, max_dist))
        if (in_pocket.insert(atom).second)
          pocket_atoms.push_back(*atom);
    std::vector<ResidueRef> pocket_residues = residues_of(pocket_atoms);
    if (pocket_residues.empty())
      continue;
    sites.emplace_back();
    BindingSite& site = sites.back();
    site.id = (int) sites.size();
    site.ligand = ligand;
    site.ligand.site_id = site.id;
    site.pocket_atoms = std::move(pocket_atoms);
    site.pocket_residues = std::move(pocket_residues);
  }
  return sites;
}

} // namespace ligsite
