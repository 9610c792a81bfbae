// Copyright The ligsite Authors.
//
// Data structures for atoms read from atom records, ligands and binding sites.

#ifndef LIGSITE_MODEL_HPP_
#define LIGSITE_MODEL_HPP_

#include <string>
#include <vector>
#include "math.hpp"   // for Position

namespace ligsite {

// Chain, residue sequence number and residue name.
// A lightweight key - it doesn't own atoms.
struct ResidueRef {
  std::string chain;
  int seq_num = 0;
  std::string name;

  bool operator==(const ResidueRef& o) const {
    return seq_num == o.seq_num && chain == o.chain && name == o.name;
  }
  bool operator!=(const ResidueRef& o) const { return !operator==(o); }
  // chain, sequence number, name
  bool operator<(const ResidueRef& o) const {
    if (chain != o.chain)
      return chain < o.chain;
    if (seq_num != o.seq_num)
      return seq_num < o.seq_num;
    return name < o.name;
  }
  // label used in reports, e.g. "316 A"
  std::string label() const { return std::to_string(seq_num) + " " + chain; }
  std::string str() const { return chain + "/" + name + " " + std::to_string(seq_num); }
};

struct Atom {
  int serial = 0;
  std::string name;
  std::string residue_name;
  std::string chain;
  int seq_num = 0;
  Position pos;
  std::string element;    // capitalized symbol, e.g. C, Fe
  bool het = false;       // HETATM record
  char altloc = '\0';     // 0 if not set

  bool has_altloc() const { return altloc != '\0'; }
  // altloc that is preferred when the same atom has alternative positions
  bool has_preferred_altloc() const { return altloc == '\0' || altloc == 'A'; }
  bool is_hydrogen() const { return element == "H" || element == "D"; }
  ResidueRef residue() const { return {chain, seq_num, residue_name}; }
};

enum class LigandKind : unsigned char { SmallMolecule, Ion, Water };

inline const char* ligand_kind_to_string(LigandKind kind) {
  switch (kind) {
    case LigandKind::SmallMolecule: return "small-molecule";
    case LigandKind::Ion: return "ion";
    case LigandKind::Water: return "water";
  }
  return "?";
}

// One ligand instance: the atoms of one (chain, seq_num, name) residue.
struct Ligand {
  int site_id = 0;  // 0 if it didn't form a binding site
  std::string chain;
  int seq_num = 0;
  std::string name;
  LigandKind kind = LigandKind::SmallMolecule;
  std::vector<Atom> atoms;

  ResidueRef residue() const { return {chain, seq_num, name}; }
  bool is_water() const { return kind == LigandKind::Water; }
};

struct BindingSite {
  int id = 0;
  Ligand ligand;
  std::vector<Atom> pocket_atoms;        // protein atoms near the ligand
  std::vector<ResidueRef> pocket_residues;  // sorted, unique
};

} // namespace ligsite
#endif
