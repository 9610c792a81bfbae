
#include "doctest.h"
#include "pdb_lines.h"

#include <string>
#include <vector>
#include <ligsite/pdb.hpp>

using ligsite::Atom;
using ligsite::ParsedStructure;

namespace {

std::string replace_all(std::string s, const std::string& old, const std::string& new_) {
  for (size_t pos = 0; (pos = s.find(old, pos)) != std::string::npos; pos += new_.size())
    s.replace(pos, old.size(), new_);
  return s;
}

const Atom* find_atom(const std::vector<Atom>& atoms, const std::string& name) {
  for (const Atom& a : atoms)
    if (a.name == name)
      return &a;
  return nullptr;
}

} // anonymous namespace

TEST_CASE("infer_element_from_name") {
  using ligsite::infer_element_from_name;
  CHECK_EQ(infer_element_from_name("N"), "N");
  CHECK_EQ(infer_element_from_name("C1"), "C");
  CHECK_EQ(infer_element_from_name("O12"), "O");
  // without alignment, the last two letters are taken
  CHECK_EQ(infer_element_from_name("CA"), "Ca");
  CHECK_EQ(infer_element_from_name("OD1"), "Od");
  CHECK_EQ(infer_element_from_name("H"), "H");
  CHECK_EQ(infer_element_from_name("12"), "C");
  CHECK_EQ(infer_element_from_name(""), "C");
}

TEST_CASE("infer_element_from_padded_name") {
  using ligsite::infer_element_from_padded_name;
  CHECK_EQ(infer_element_from_padded_name(" CA "), "C");
  CHECK_EQ(infer_element_from_padded_name(" OD1"), "O");
  CHECK_EQ(infer_element_from_padded_name("CA  "), "Ca");
  CHECK_EQ(infer_element_from_padded_name("FE  "), "Fe");
  CHECK_EQ(infer_element_from_padded_name("C210"), "C");
  CHECK_EQ(infer_element_from_padded_name(" HB1"), "H");
  CHECK_EQ(infer_element_from_padded_name(" HA "), "H");
  CHECK_EQ(infer_element_from_padded_name("1HG "), "H");
  CHECK_EQ(infer_element_from_padded_name("2HD1"), "H");
  CHECK_EQ(infer_element_from_padded_name("HD21"), "H");
  CHECK_EQ(infer_element_from_padded_name("DG12"), "D");
  CHECK_EQ(infer_element_from_padded_name(" D  "), "D");
  CHECK_EQ(infer_element_from_padded_name("CL12"), "Cl");
  CHECK_EQ(infer_element_from_padded_name("    "), "C");
}

TEST_CASE("hydrogens without element column are dropped") {
  // atom names in columns 13-16, blank element columns
  std::string pdb;
  pdb += atom(1, "N", "ALA", 'A', 1, 0, 0, 0, "");
  pdb += atom(2, "CB", "ALA", 'A', 1, 2, 0, 0, "");
  pdb += atom(3, "HB1", "ALA", 'A', 1, 2, 1, 0, "");
  pdb += atom(4, "HA", "ALA", 'A', 1, 1, 1, 0, "");
  pdb += atom(5, "1HG ", "LEU", 'A', 2, 3, 1, 0, "");
  pdb += atom(6, "HD21", "ASN", 'A', 3, 4, 1, 0, "");
  pdb += atom(7, "2HD1", "LEU", 'A', 2, 3, 2, 0, "");
  pdb += hetatm(8, "C1", "LIG", 'A', 101, 2, 2, 0, "");
  pdb += hetatm(9, "H11", "LIG", 'A', 101, 2, 3, 0, "");
  ParsedStructure st = ligsite::read_pdb_string(pdb, "x");
  REQUIRE_EQ(st.all_atoms.size(), 3);
  for (const Atom& a : st.all_atoms) {
    CHECK(!a.is_hydrogen());
    CHECK(a.name[0] != 'H');
  }
  CHECK_EQ(st.protein_atoms.size(), 2);
  CHECK_EQ(find_atom(st.all_atoms, "N")->element, "N");
  CHECK_EQ(find_atom(st.all_atoms, "CB")->element, "C");
  REQUIRE_EQ(st.ligand_atoms.size(), 1);
  CHECK_EQ(st.ligand_atoms[0].element, "C");
}

TEST_CASE("parse_atom_line") {
  Atom atom;
  // two-letter elements start in column 13
  std::string line = hetatm(1234, "FE  ", "HEM", 'B', 501, -1.5, 22.25, 3., "FE");
  line.pop_back();  // newline
  REQUIRE(ligsite::parse_atom_line(line.c_str(), line.size(), atom));
  CHECK(atom.het);
  CHECK_EQ(atom.serial, 1234);
  CHECK_EQ(atom.name, "FE");
  CHECK_EQ(atom.residue_name, "HEM");
  CHECK_EQ(atom.chain, "B");
  CHECK_EQ(atom.seq_num, 501);
  CHECK_EQ(atom.pos.x, -1.5);
  CHECK_EQ(atom.pos.y, 22.25);
  CHECK_EQ(atom.pos.z, 3.);
  CHECK_EQ(atom.element, "Fe");
  CHECK(!atom.has_altloc());

  // element columns missing
  std::string short_line = line.substr(0, 66);
  REQUIRE(ligsite::parse_atom_line(short_line.c_str(), short_line.size(), atom));
  CHECK_EQ(atom.element, "Fe");

  std::string hydrogen = atom_line("ATOM", 5, "HA", "ALA", 'A', 1, 0, 0, 0, "H");
  CHECK(!ligsite::parse_atom_line(hydrogen.c_str(), hydrogen.size() - 1, atom));
  std::string deuterium = atom_line("ATOM", 6, "DA", "ALA", 'A', 1, 0, 0, 0, "D");
  CHECK(!ligsite::parse_atom_line(deuterium.c_str(), deuterium.size() - 1, atom));

  // too short or another record
  CHECK(!ligsite::parse_atom_line(line.c_str(), 50, atom));
  std::string anisou = "ANISOU" + line.substr(6);
  CHECK(!ligsite::parse_atom_line(anisou.c_str(), anisou.size(), atom));
  std::string atomx = "ATOMX " + line.substr(6);
  CHECK(!ligsite::parse_atom_line(atomx.c_str(), atomx.size(), atom));

  std::string bad_x = line.substr(0, 30) + "   1.2.3" + line.substr(38);
  CHECK_THROWS_AS(ligsite::parse_atom_line(bad_x.c_str(), bad_x.size(), atom),
                  std::invalid_argument);
}

TEST_CASE("hybrid-36 numbers") {
  CHECK_EQ(ligsite::read_serial("99999"), 99999);
  CHECK_EQ(ligsite::read_serial("A0000"), 100000);
  CHECK_EQ(ligsite::read_serial("A0001"), 100001);
  CHECK_EQ(ligsite::read_serial("    7"), 7);
  CHECK_EQ(ligsite::read_seq_num("9999"), 9999);
  CHECK_EQ(ligsite::read_seq_num("A000"), 10000);
  CHECK_EQ(ligsite::read_seq_num("  -3"), -3);
  CHECK_THROWS_AS(ligsite::read_serial("A0-00"), std::invalid_argument);

  std::string line = atom_line("ATOM", 1, "CA", "GLY", 'A', 1, 1, 2, 3, "C");
  line.replace(6, 5, "A0000");
  line.replace(22, 4, "A000");
  Atom atom;
  REQUIRE(ligsite::parse_atom_line(line.c_str(), line.size() - 1, atom));
  CHECK_EQ(atom.serial, 100000);
  CHECK_EQ(atom.seq_num, 10000);
}

TEST_CASE("read_pdb_string") {
  ParsedStructure st = ligsite::read_pdb_string(small_complex(), "/data/1abc.pdb");
  CHECK_EQ(st.name, "1abc");
  CHECK_EQ(st.entry_id, "1ABC");
  CHECK_EQ(st.protein_atoms.size(), 19);
  CHECK_EQ(st.ligand_atoms.size(), 2);
  CHECK_EQ(st.all_atoms.size(), 21);
  CHECK_EQ(st.skipped_lines, 0);
  CHECK_EQ(st.ligand_atoms[0].name, "O1");
  CHECK_EQ(st.ligand_atoms[0].element, "O");
  CHECK_EQ(st.all_atoms.front().serial, 1);
  CHECK_EQ(st.all_atoms.back().serial, 22);

  SUBCASE("CRLF") {
    ParsedStructure st2 = ligsite::read_pdb_string(replace_all(small_complex(), "\n", "\r\n"),
                                                   "x");
    CHECK_EQ(st2.entry_id, "1ABC");
    CHECK_EQ(st2.all_atoms.size(), 21);
    CHECK_EQ(st2.ligand_atoms[1].element, "C");
  }
}

TEST_CASE("read_pdb_string: solvent, hydrogens and models") {
  std::string pdb;
  pdb += atom(1, "N", "GLY", 'A', 1, 0, 0, 0, "N");
  pdb += atom(2, "H", "GLY", 'A', 1, 0, 1, 0, "H");
  pdb += hetatm(3, "O", "HOH", 'A', 201, 5, 5, 5, "O");
  pdb += hetatm(4, "ZN", "ZN", 'A', 202, 6, 6, 6, "ZN");
  pdb += hetatm(5, "C1", "NAG", 'A', 301, 7, 7, 7, "C");
  pdb += hetatm(6, "H1", "NAG", 'A', 301, 7, 8, 7, "H");
  pdb += "ENDMDL\n";
  pdb += atom(7, "N", "GLY", 'A', 1, 0, 0, 0.5, "N");
  ParsedStructure st = ligsite::read_pdb_string(pdb, "x");
  CHECK_EQ(st.all_atoms.size(), 4);
  // water and ions are kept as protein context, not ligands
  CHECK_EQ(st.protein_atoms.size(), 3);
  REQUIRE_EQ(st.ligand_atoms.size(), 1);
  CHECK_EQ(st.ligand_atoms[0].residue_name, "NAG");
  CHECK(find_atom(st.all_atoms, "H") == nullptr);
  CHECK(find_atom(st.all_atoms, "H1") == nullptr);
  CHECK_EQ(find_atom(st.all_atoms, "N")->pos.z, 0.);
}

TEST_CASE("read_pdb_string: alternative conformations") {
  std::string a = atom_line("ATOM", 1, "OG", "SER", 'A', 5, 1, 0, 0, "O", 'A');
  std::string b = atom_line("ATOM", 2, "OG", "SER", 'A', 5, 2, 0, 0, "O", 'B');
  std::string c = atom_line("ATOM", 3, "OG", "SER", 'A', 5, 3, 0, 0, "O", 'C');
  std::string cb = atom(4, "CB", "SER", 'A', 5, 0, 1, 0, "C");
  for (const std::string& pdb : {a + b + cb, b + a + cb, c + b + cb, cb + b + a}) {
    ParsedStructure st = ligsite::read_pdb_string(pdb, "alt");
    CHECK_EQ(st.all_atoms.size(), 2);
    const Atom* og = find_atom(st.all_atoms, "OG");
    REQUIRE(og != nullptr);
    if (pdb == c + b + cb) {
      // neither is preferred, the first one read is kept
      CHECK_EQ(og->altloc, 'C');
    } else {
      CHECK_EQ(og->altloc, 'A');
      CHECK_EQ(og->pos.x, 1.);
    }
  }
  // the atom keeps its place in the reading order
  ParsedStructure st = ligsite::read_pdb_string(b + cb + a, "alt");
  CHECK_EQ(st.all_atoms[0].name, "OG");
  CHECK_EQ(st.all_atoms[0].serial, 1);
}

TEST_CASE("read_pdb_string: malformed lines are skipped") {
  std::string good = hetatm(2, "C1", "LIG", 'A', 1, 1, 2, 3, "C");
  std::string bad = hetatm(1, "C2", "LIG", 'A', 1, 1, 2, 3, "C");
  bad.replace(38, 8, "  12,5  ");
  std::string blank_serial = hetatm(3, "C3", "LIG", 'A', 1, 4, 5, 6, "C");
  blank_serial.replace(6, 5, "     ");
  std::vector<std::string> messages;
  ligsite::Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  ParsedStructure st = ligsite::read_pdb_string(bad + good + blank_serial, "x", logger);
  CHECK_EQ(st.skipped_lines, 2);
  REQUIRE_EQ(st.ligand_atoms.size(), 1);
  CHECK_EQ(st.ligand_atoms[0].name, "C1");
  REQUIRE_EQ(messages.size(), 2);
  CHECK(ligsite::starts_with(messages[0], "Warning: line 1 skipped"));
  CHECK(ligsite::starts_with(messages[1], "Warning: line 3 skipped"));
}

TEST_CASE("read_pdb_string: empty input") {
  ParsedStructure st = ligsite::read_pdb_string("", "empty");
  CHECK(st.all_atoms.empty());
  CHECK(st.entry_id.empty());
  st = ligsite::read_pdb_string("REMARK   1 nothing here\n", "empty");
  CHECK(st.all_atoms.empty());
}
