// Copyright The ligsite Authors.
//
// Reading ATOM/HETATM records from the PDB format into flat atom lists.

#ifndef LIGSITE_PDB_HPP_
#define LIGSITE_PDB_HPP_

#include <string>
#include <vector>
#include "input.hpp"   // for AnyStream
#include "logger.hpp"  // for Logger
#include "model.hpp"   // for Atom

namespace ligsite {

/// Atoms of the first model, after removing hydrogens and alternative
/// conformations. protein_atoms and ligand_atoms are disjoint,
/// all_atoms is their union in the reading order.
struct ParsedStructure {
  std::string name;      // from the file name
  std::string entry_id;  // from HEADER, may be empty
  std::vector<Atom> protein_atoms;
  std::vector<Atom> ligand_atoms;
  std::vector<Atom> all_atoms;
  int skipped_lines = 0;  // malformed ATOM/HETATM records
};

/// Element symbol guessed from atom name: the last one or two letters
/// (digits and other characters skipped), capitalized;
/// C if the name has no letters.
std::string infer_element_from_name(const std::string& name);

/// Element symbol guessed from the 4-column atom name field (columns 13-16).
/// The alignment of the name is used first: " CA " is carbon, "1HB ",
/// " HB1" and "HD21" are hydrogens. Otherwise the same as
/// infer_element_from_name().
std::string infer_element_from_padded_name(const char* name);

/// Decodes serial number (5 columns) with the hybrid-36 extension.
/// Throws std::invalid_argument if the field is not a number.
int read_serial(const char* ptr);
/// Decodes residue sequence number (4 columns) with the hybrid-36 extension.
int read_seq_num(const char* ptr);

/// Parses one ATOM/HETATM line (len excludes the line terminator).
/// Returns false if the line is not an atom record, is too short,
/// or the atom is hydrogen/deuterium.
/// Throws std::invalid_argument if a numeric field is malformed.
bool parse_atom_line(const char* line, size_t len, Atom& atom);

/// Reads the first model. Malformed atom records are skipped and
/// reported with logger.warn().
ParsedStructure read_pdb_from_stream(AnyStream& line_reader,
                                     const std::string& source,
                                     const Logger& logger);

ParsedStructure read_pdb_string(const std::string& str,
                                const std::string& name,
                                const Logger& logger={});

/// Reads a file; path "-" means stdin, the .gz suffix means gzipped file.
ParsedStructure read_pdb_file(const std::string& path, const Logger& logger={});

} // namespace ligsite
#endif
