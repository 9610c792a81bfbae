// Copyright The ligsite Authors.
//
// Classification of residue names: solvent, ions, hydrophobic amino acids.

#ifndef LIGSITE_RESINFO_HPP_
#define LIGSITE_RESINFO_HPP_

#include <string>
#include "model.hpp"  // for LigandKind

namespace ligsite {

/// Packs up to 4 characters (uppercased) into an integer.
/// Names longer than 4 characters give -1 which doesn't match any tabulated name.
constexpr int residue_name_id(const char* s) {
  int id = 0;
  for (int i = 0; s[i] != '\0'; ++i) {
    if (i == 4)
      return -1;
    char c = s[i];
    if (c >= 'a' && c <= 'z')
      c = char(c - 'a' + 'A');
    id = (id << 8) | (unsigned char) c;
  }
  return id;
}
inline int residue_name_id(const std::string& s) { return residue_name_id(s.c_str()); }

/// HOH, WAT, DOD
bool is_water_residue(const std::string& name);

/// Common metal and halide ions, such as NA, ZN, CL.
bool is_ion_residue(const std::string& name);

/// Crystallographic solvent and ions that are never analyzed as ligands
/// (water, ions, and single-atom species such as F, BR, I, S).
bool is_excluded_residue(const std::string& name);

/// ALA, VAL, LEU, ILE, MET, PHE, TRP, PRO, TYR
bool is_hydrophobic_residue(const std::string& name);

inline LigandKind ligand_kind_of(const std::string& residue_name) {
  if (is_water_residue(residue_name))
    return LigandKind::Water;
  if (is_ion_residue(residue_name))
    return LigandKind::Ion;
  return LigandKind::SmallMolecule;
}

} // namespace ligsite
#endif
