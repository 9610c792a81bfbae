// Copyright The ligsite Authors.

#include <ligsite/resinfo.hpp>

namespace ligsite {

#define ID(s) residue_name_id(s)

bool is_water_residue(const std::string& name) {
  switch (ID(name)) {
    case ID("HOH"):
    case ID("WAT"):
    case ID("DOD"):
      return true;
  }
  return false;
}

bool is_ion_residue(const std::string& name) {
  switch (ID(name)) {
    case ID("NA"): case ID("SOD"):  // sodium
    case ID("CL"): case ID("CLA"):  // chloride
    case ID("K"): case ID("POT"):   // potassium
    case ID("MG"): case ID("CA"): case ID("ZN"): case ID("FE"):
    case ID("MN"): case ID("CU"): case ID("CO"): case ID("NI"):
    case ID("CD"): case ID("BA"): case ID("SR"): case ID("BE"):
    case ID("LI"): case ID("CS"): case ID("AG"): case ID("AU"):
      return true;
  }
  return false;
}

bool is_excluded_residue(const std::string& name) {
  if (is_water_residue(name) || is_ion_residue(name))
    return true;
  switch (ID(name)) {
    case ID("FE2"): case ID("FE3"):
    case ID("HG"): case ID("AL"): case ID("GA"): case ID("IN"):
    case ID("TL"): case ID("PB"): case ID("BI"): case ID("YB"):
    case ID("EU"): case ID("SM"): case ID("GD"): case ID("TB"):
    case ID("DY"): case ID("Y"): case ID("W"): case ID("MO"):
    case ID("V"): case ID("CR"): case ID("PT"): case ID("RU"):
    case ID("RH"): case ID("PD"): case ID("OS"): case ID("IR"):
    case ID("XE"): case ID("KR"):
    // single-atom non-metals
    case ID("F"): case ID("BR"): case ID("I"): case ID("S"):
      return true;
  }
  return false;
}

bool is_hydrophobic_residue(const std::string& name) {
  switch (ID(name)) {
    case ID("ALA"): case ID("VAL"): case ID("LEU"):
    case ID("ILE"): case ID("MET"): case ID("PHE"):
    case ID("TRP"): case ID("PRO"): case ID("TYR"):
      return true;
  }
  return false;
}

#undef ID

} // namespace ligsite
