// Copyright The ligsite Authors.

#include <ligsite/pdb.hpp>
#include <cstring>               // for memcpy, strncmp
#include <unordered_map>
#include <ligsite/atof.hpp>      // for read_checked_double
#include <ligsite/atox.hpp>      // for string_to_int, is_space, is_digit
#include <ligsite/fileutil.hpp>  // for path_basename
#include <ligsite/gz.hpp>        // for MaybeGzipped
#include <ligsite/resinfo.hpp>   // for is_excluded_residue
#include <ligsite/util.hpp>      // for alpha_up, cat

namespace ligsite {

namespace {

std::string read_string(const char* p, int field_length) {
  // left trim
  while (field_length != 0 && is_space(*p)) {
    ++p;
    --field_length;
  }
  // EOL/EOF ends the string
  for (int i = 0; i < field_length; ++i)
    if (p[i] == '\n' || p[i] == '\r' || p[i] == '\0') {
      field_length = i;
      break;
    }
  // right trim
  while (field_length != 0 && is_space(p[field_length-1]))
    --field_length;
  return std::string(p, field_length);
}

template<int N> int read_base36(const char* p) {
  int n = 0;
  for (int i = 0; i != N; ++i) {
    char c = alpha_up(p[i]);
    int digit;
    if (is_digit(c))
      digit = c - '0';
    else if (c >= 'A' && c <= 'Z')
      digit = c - 'A' + 10;
    else
      throw std::invalid_argument("not a hybrid-36 number: '" +
                                  std::string(p, N) + "'");
    n = n * 36 + digit;
  }
  return n;
}

// "Fe", "C"
std::string normalize_element(const std::string& el) {
  std::string r;
  if (!el.empty()) {
    r += alpha_up(el[0]);
    if (el.size() > 1)
      r += char(el[1] | 0x20);
  }
  return r;
}

bool is_record_type(const char* line, size_t len, const char* name) {
  size_t n = std::strlen(name);
  if (len < n || std::strncmp(line, name, n) != 0)
    return false;
  // the rest of the 6-character record name must be blank
  for (size_t i = n; i < 6 && i < len; ++i)
    if (!is_space(line[i]))
      return false;
  return true;
}

} // anonymous namespace

std::string infer_element_from_name(const std::string& name) {
  std::string letters;
  for (size_t i = name.size(); i-- != 0; ) {
    char c = name[i];
    if (!is_alpha(c))
      continue;
    letters.insert(letters.begin(), c);
    if (letters.size() == 2)
      break;
  }
  if (letters.empty())
    return "C";
  return normalize_element(letters);
}

std::string infer_element_from_padded_name(const char* name) {
  if (name[0] == ' ' || is_digit(name[0])) {
    // one-letter elements start in the second column; old versions of
    // the PDB format had hydrogen names such as "1HB "
    if (is_alpha(name[1]))
      return std::string(1, alpha_up(name[1]));
  } else if (is_digit(name[1])) {
    // "C210"
    if (is_alpha(name[0]))
      return std::string(1, alpha_up(name[0]));
  } else if (!is_space(name[3])) {
    // Hg, He, Hf, Ho, Dy (almost) never have 4-character names,
    // so HXXX is hydrogen and DXXX is deuterium.
    char first = alpha_up(name[0]);
    if (first == 'H' || first == 'D')
      return std::string(1, first);
  }
  return infer_element_from_name(read_string(name, 4));
}

int read_serial(const char* ptr) {
  if (is_alpha(ptr[0]))
    return read_base36<5>(ptr) - 16796160 + 100000;
  return string_to_int(ptr, true, 5);
}

int read_seq_num(const char* ptr) {
  // We support hybrid-36 extension, although it is never used in practice
  // as 9999 residues per chain are enough.
  if (is_alpha(ptr[0]))
    return read_base36<4>(ptr) - 466560 + 10000;
  return string_to_int(ptr, true, 4);
}

bool parse_atom_line(const char* line, size_t len, Atom& atom) {
  // the last column needed is z (47-54)
  if (len < 54)
    return false;
  bool het = is_record_type(line, len, "HETATM");
  if (!het && !is_record_type(line, len, "ATOM"))
    return false;
  atom.het = het;
  atom.serial = read_serial(line+6);
  atom.name = read_string(line+12, 4);
  atom.altloc = line[16] == ' ' ? '\0' : line[16];
  atom.residue_name = read_string(line+17, 3);
  atom.chain = read_string(line+20, 2);
  atom.seq_num = read_seq_num(line+22);
  atom.pos.x = read_checked_double(line+30, 8);
  atom.pos.y = read_checked_double(line+38, 8);
  atom.pos.z = read_checked_double(line+46, 8);
  if (len > 76 && (is_alpha(line[76]) || (len > 77 && is_alpha(line[77]))))
    atom.element = normalize_element(read_string(line+76, len > 77 ? 2 : 1));
  else
    atom.element = infer_element_from_padded_name(line+12);
  return !atom.is_hydrogen();
}

ParsedStructure read_pdb_from_stream(AnyStream& line_reader,
                                     const std::string& source,
                                     const Logger& logger) {
  const int max_line_length = 120;
  ParsedStructure st;
  st.name = path_basename(source, {".gz", ".pdb", ".ent"});
  // atoms in reading order; alternative conformations replace atoms in place
  std::vector<Atom> atoms;
  std::unordered_map<std::string, size_t> atom_index;
  char line[max_line_length+2] = {0};
  int line_num = 0;
  while (size_t len = line_reader.copy_line(line, max_line_length+1)) {
    ++line_num;
    while (len != 0 && (line[len-1] == '\n' || line[len-1] == '\r'))
      line[--len] = '\0';
    if (is_record_type(line, len, "ATOM") || is_record_type(line, len, "HETATM")) {
      Atom atom;
      try {
        if (!parse_atom_line(line, len, atom))
          continue;
      } catch (std::invalid_argument& e) {
        ++st.skipped_lines;
        logger.warn("line ", line_num, " skipped: ", e.what());
        continue;
      }
      std::string key = cat(atom.chain, ':', atom.seq_num, ':',
                            atom.residue_name, ':', atom.name);
      auto it = atom_index.find(key);
      if (it == atom_index.end()) {
        atom_index.emplace(key, atoms.size());
        atoms.push_back(std::move(atom));
      } else {
        Atom& prev = atoms[it->second];
        if (!prev.has_preferred_altloc() && atom.has_preferred_altloc())
          prev = std::move(atom);
      }
    } else if (is_record_type(line, len, "HEADER")) {
      if (len > 62)
        st.entry_id = read_string(line+62, 4);
    } else if (is_record_type(line, len, "ENDMDL") ||
               is_record_type(line, len, "END")) {
      break;
    }
  }

  st.all_atoms.reserve(atoms.size());
  for (Atom& atom : atoms) {
    // waters and ions stay with the protein as context for spatial queries
    if (atom.het && !is_excluded_residue(atom.residue_name))
      st.ligand_atoms.push_back(atom);
    else
      st.protein_atoms.push_back(atom);
    st.all_atoms.push_back(std::move(atom));
  }
  logger.debug("read ", st.all_atoms.size(), " atoms in ", line_num,
               " lines from ", source);
  return st;
}

ParsedStructure read_pdb_string(const std::string& str,
                                const std::string& name,
                                const Logger& logger) {
  MemoryStream stream(str.data(), str.size());
  return read_pdb_from_stream(stream, name, logger);
}

ParsedStructure read_pdb_file(const std::string& path, const Logger& logger) {
  MaybeGzipped input(path);
  std::unique_ptr<AnyStream> stream = input.create_stream();
  return read_pdb_from_stream(*stream, input.is_stdin() ? "stdin" : path, logger);
}

} // namespace ligsite
