
#include "doctest.h"

#include <string>
#include <vector>
#include <ligsite/hbond.hpp>
#include <ligsite/hydrophobic.hpp>
#include <ligsite/waterbridge.hpp>

using namespace ligsite;

namespace {

Atom make_atom(int serial, const char* name, const char* resname, const char* chain,
               int seq, double x, double y, double z, const char* element) {
  Atom a;
  a.serial = serial;
  a.name = name;
  a.residue_name = resname;
  a.chain = chain;
  a.seq_num = seq;
  a.pos = Position(x, y, z);
  a.element = element;
  return a;
}

BindingSite make_site(std::vector<Atom> lig_atoms) {
  BindingSite site;
  site.id = 1;
  site.ligand.chain = "A";
  site.ligand.seq_num = 101;
  site.ligand.name = "LIG";
  site.ligand.site_id = 1;
  for (Atom& a : lig_atoms) {
    a.het = true;
    a.chain = "A";
    a.seq_num = 101;
    a.residue_name = "LIG";
  }
  site.ligand.atoms = std::move(lig_atoms);
  return site;
}

DonorAcceptor protein_da(const char* resname, const char* name, const char* el) {
  return protein_donor_acceptor(make_atom(1, name, resname, "A", 1, 0, 0, 0, el));
}

} // anonymous namespace

TEST_CASE("protein_donor_acceptor") {
  DonorAcceptor da = protein_da("ALA", "N", "N");
  CHECK((da.donor && !da.acceptor && !da.side_chain));
  for (const char* name : {"O", "OXT", "OT1", "OT2"}) {
    da = protein_da("GLY", name, "O");
    CHECK((!da.donor && da.acceptor && !da.side_chain));
  }
  da = protein_da("SER", "OG", "O");
  CHECK((da.donor && da.acceptor && da.side_chain));
  da = protein_da("ASN", "ND2", "N");
  CHECK((da.donor && !da.acceptor && da.side_chain));
  da = protein_da("ASN", "OD1", "O");
  CHECK((!da.donor && da.acceptor && da.side_chain));
  da = protein_da("ARG", "NH2", "N");
  CHECK((da.donor && !da.acceptor));
  da = protein_da("GLU", "OE2", "O");
  CHECK((!da.donor && da.acceptor));
  da = protein_da("HIS", "ND1", "N");
  CHECK((da.donor && da.acceptor));
  da = protein_da("LYS", "NZ", "N");
  CHECK((da.donor && !da.acceptor));
  // not tabulated: element rule
  da = protein_da("MET", "SD", "S");
  CHECK((da.donor && da.acceptor && da.side_chain));
  da = protein_da("MSE", "SE", "Se");
  CHECK(!da.any());
  da = protein_da("LEU", "CD1", "C");
  CHECK(!da.any());
  da = protein_da("HOH", "O", "O");
  CHECK((da.donor && da.acceptor && !da.side_chain));
}

TEST_CASE("ligand_donor_acceptor") {
  DonorAcceptor da = ligand_donor_acceptor(make_atom(1, "N1", "LIG", "A", 1, 0, 0, 0, "N"));
  CHECK((da.donor && da.acceptor));
  da = ligand_donor_acceptor(make_atom(1, "O2", "LIG", "A", 1, 0, 0, 0, "O"));
  CHECK((da.donor && da.acceptor));
  da = ligand_donor_acceptor(make_atom(1, "S1", "LIG", "A", 1, 0, 0, 0, "S"));
  CHECK((!da.donor && da.acceptor));
  da = ligand_donor_acceptor(make_atom(1, "C1", "LIG", "A", 1, 0, 0, 0, "C"));
  CHECK(!da.any());
  da = ligand_donor_acceptor(make_atom(1, "CL1", "LIG", "A", 1, 0, 0, 0, "Cl"));
  CHECK(!da.any());
}

TEST_CASE("sort_and_renumber") {
  std::vector<HydrophobicInteraction> v(4);
  const double dist[4] = {3.5, 3.2, 3.5, 3.0};
  for (int i = 0; i != 4; ++i) {
    v[i].distance = dist[i];
    v[i].ligand_atom_serial = i;
  }
  sort_and_renumber(v, [](const HydrophobicInteraction& h) { return h.distance; });
  CHECK_EQ(v[0].ligand_atom_serial, 3);
  CHECK_EQ(v[1].ligand_atom_serial, 1);
  // ties keep the order of discovery
  CHECK_EQ(v[2].ligand_atom_serial, 0);
  CHECK_EQ(v[3].ligand_atom_serial, 2);
  for (int i = 0; i != 4; ++i)
    CHECK_EQ(v[i].index, i + 1);
}

TEST_CASE("find_hydrophobic_contacts") {
  std::vector<Atom> protein = {
    make_atom(1, "CD2", "LEU", "A", 10, 0, 3.5, 0, "C"),
    make_atom(2, "CD1", "LEU", "A", 10, 0, 3.0, 0, "C"),
    make_atom(3, "CB", "SER", "B", 4, 0, -2.0, 0, "C"),
    make_atom(4, "CZ", "PHE", "A", 20, 5.0, 0, 0, "C"),
  };
  NeighborSearch ns(protein, 5.0);
  ns.populate();
  BindingSite site = make_site({make_atom(21, "C1", "", "", 0, 0, 0, 0, "C"),
                                make_atom(22, "C2", "", "", 0, 1.5, 0, 0, "C")});
  std::vector<HydrophobicInteraction> hc = find_hydrophobic_contacts(site, ns, 4.0);
  REQUIRE_EQ(hc.size(), 3);

  CHECK_EQ(hc[0].index, 1);
  CHECK_EQ(hc[0].residue, "10 A");
  CHECK_EQ(hc[0].residue_name, "LEU");
  CHECK_EQ(hc[0].distance, doctest::Approx(3.0));
  CHECK_EQ(hc[0].ligand_atom_name, "C1");
  // the closest atom of the residue
  CHECK_EQ(hc[0].protein_atom_name, "CD1");
  CHECK_EQ(hc[0].protein_atom_serial, 2);

  CHECK_EQ(hc[1].index, 2);
  CHECK_EQ(hc[1].ligand_atom_serial, 22);
  CHECK_EQ(hc[1].protein_atom_name, "CD1");
  CHECK_EQ(hc[1].distance, doctest::Approx(3.354));

  CHECK_EQ(hc[2].index, 3);
  CHECK_EQ(hc[2].residue, "20 A");
  CHECK_EQ(hc[2].distance, doctest::Approx(3.5));

  hc = find_hydrophobic_contacts(site, ns, 3.2);
  REQUIRE_EQ(hc.size(), 1);
  CHECK_EQ(hc[0].protein_atom_serial, 2);
}

TEST_CASE("find_hbonds") {
  std::vector<Atom> protein = {
    make_atom(1, "N", "GLY", "A", 1, 0, 2.9, 0, "N"),
    make_atom(2, "O", "GLY", "A", 1, 0, -3.1, 0, "O"),
    make_atom(3, "NZ", "LYS", "A", 5, 0, 0, 3.3, "N"),
    make_atom(4, "CG", "ASP", "A", 6, 3.0, 0, 0, "C"),
    make_atom(5, "OD1", "ASP", "A", 6, 0, 0, -3.6, "O"),
    make_atom(6, "OG", "SER", "A", 7, -2.0, 2.5, 0, "O"),
    make_atom(7, "N", "GLY", "A", 9, 20.0, 3.0, 0, "N"),
    make_atom(8, "O", "GLY", "A", 9, 20.0, -3.2, 0, "O"),
  };
  NeighborSearch ns(protein, 5.0);
  ns.populate();
  BindingSite site = make_site({make_atom(21, "O1", "", "", 0, 0, 0, 0, "O"),
                                make_atom(22, "C1", "", "", 0, -1.5, 0, 0, "C"),
                                make_atom(23, "S1", "", "", 0, 20.0, 0, 0, "S")});
  std::vector<HbondInteraction> hb = find_hbonds(site, ns, 3.5);
  REQUIRE_EQ(hb.size(), 5);
  for (int i = 0; i != 5; ++i) {
    CHECK_EQ(hb[i].index, i + 1);
    CHECK(!hb[i].has_distance_ha());
    CHECK(!hb[i].has_donor_angle());
  }
  // backbone N donates to the ligand
  CHECK_EQ(hb[0].residue, "1 A");
  CHECK_EQ(hb[0].distance_da, doctest::Approx(2.9));
  CHECK(hb[0].protein_donor);
  CHECK(!hb[0].side_chain);
  CHECK_EQ(hb[0].donor_atom_serial, 1);
  CHECK_EQ(hb[0].acceptor_atom_name, "O1");
  // sulfur of the ligand only accepts
  CHECK_EQ(hb[1].residue, "9 A");
  CHECK(hb[1].protein_donor);
  CHECK_EQ(hb[1].acceptor_atom_name, "S1");
  CHECK_EQ(hb[1].distance_da, doctest::Approx(3.0));
  // backbone O accepts from the ligand
  CHECK_EQ(hb[2].distance_da, doctest::Approx(3.1));
  CHECK(!hb[2].protein_donor);
  CHECK_EQ(hb[2].donor_atom_name, "O1");
  CHECK_EQ(hb[2].acceptor_atom_serial, 2);
  // both directions possible: reported with the protein as donor
  CHECK_EQ(hb[3].residue_name, "SER");
  CHECK_EQ(hb[3].distance_da, doctest::Approx(3.202));
  CHECK(hb[3].protein_donor);
  CHECK(hb[3].side_chain);
  CHECK_EQ(hb[4].residue_name, "LYS");
  CHECK_EQ(hb[4].donor_atom_name, "NZ");
  CHECK(hb[4].side_chain);

  CHECK(find_hbonds(site, ns, 2.5).empty());
}

TEST_CASE("find_water_bridges") {
  std::vector<Atom> protein = {
    make_atom(1, "O", "HOH", "A", 301, 2.8, 0, 0, "O"),
    make_atom(2, "OG", "SER", "A", 7, 5.6, 0, 0, "O"),
    make_atom(3, "OD1", "ASP", "A", 8, 2.8, 3.0, 0, "O"),
    make_atom(4, "CB", "ALA", "A", 9, 2.8, -2.5, 0, "C"),
    make_atom(5, "O", "HOH", "A", 302, 0, -3.0, 0, "O"),
  };
  NeighborSearch protein_ns(protein, 5.0);
  protein_ns.populate();
  NeighborSearch water_ns(protein, 5.0);
  populate_waters(water_ns);
  CHECK_EQ(water_ns.size(), 2);
  CHECK(is_water_oxygen(protein[0]));
  CHECK(!is_water_oxygen(protein[1]));

  BindingSite site = make_site({make_atom(21, "O1", "", "", 0, 0, 0, 0, "O"),
                                make_atom(22, "C1", "", "", 0, -1.5, 0, 0, "C")});
  std::vector<WaterBridgeInteraction> wb = find_water_bridges(site, protein_ns,
                                                              water_ns, 4.0);
  REQUIRE_EQ(wb.size(), 2);
  CHECK_EQ(wb[0].index, 1);
  CHECK_EQ(wb[0].residue, "7 A");
  CHECK_EQ(wb[0].residue_name, "SER");
  CHECK_EQ(wb[0].distance_aw, doctest::Approx(2.8));
  CHECK_EQ(wb[0].distance_dw, doctest::Approx(2.8));
  CHECK_EQ(wb[0].total_distance(), doctest::Approx(5.6));
  CHECK(wb[0].protein_donor);
  CHECK_EQ(wb[0].donor_atom_name, "OG");
  CHECK_EQ(wb[0].acceptor_atom_name, "O1");
  CHECK_EQ(wb[0].water_atom_serial, 1);
  CHECK_EQ(wb[1].index, 2);
  CHECK_EQ(wb[1].residue_name, "ASP");
  CHECK(!wb[1].protein_donor);
  CHECK_EQ(wb[1].donor_atom_serial, 21);
  CHECK_EQ(wb[1].acceptor_atom_serial, 3);
  CHECK_EQ(wb[1].distance_dw, doctest::Approx(3.0));

  wb = find_water_bridges(site, protein_ns, water_ns, 2.9);
  REQUIRE_EQ(wb.size(), 1);
  CHECK_EQ(wb[0].residue_name, "SER");

  // a sulfur only accepts, so the acceptor-only ASP doesn't bridge
  BindingSite s_site = make_site({make_atom(23, "S1", "", "", 0, 0, 0, 0, "S")});
  wb = find_water_bridges(s_site, protein_ns, water_ns, 4.0);
  REQUIRE_EQ(wb.size(), 1);
  CHECK_EQ(wb[0].residue_name, "SER");

  NeighborSearch no_waters(protein, 5.0);
  CHECK(find_water_bridges(site, protein_ns, no_waters, 4.0).empty());
}
