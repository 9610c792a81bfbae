// Copyright The ligsite Authors.
//
// String utilities.

#ifndef LIGSITE_UTIL_HPP_
#define LIGSITE_UTIL_HPP_

#include <string>

namespace ligsite {

inline bool starts_with(const std::string& str, const std::string& prefix) {
  size_t sl = prefix.length();
  return str.length() >= sl && str.compare(0, sl, prefix) == 0;
}

// Case-insensitive version. Assumes the suffix is lowercase and ascii.
inline bool iends_with(const std::string& str, const std::string& suffix) {
  size_t sl = suffix.length();
  if (str.length() < sl)
    return false;
  for (size_t i = 0; i != sl; ++i) {
    char c = str[str.length() - sl + i];
    if (c >= 'A' && c <= 'Z')
      c |= 0x20;
    if (c != suffix[i])
      return false;
  }
  return true;
}

inline char alpha_up(char c) { return c >= 'a' && c <= 'z' ? c & ~0x20 : c; }

inline std::string to_upper(std::string str) {
  for (char& c : str)
    c = alpha_up(c);
  return str;
}

namespace impl {
inline void add_to_string(std::string&) {}

inline void append_one(std::string& out, const std::string& s) { out += s; }
inline void append_one(std::string& out, const char* s) { out += s; }
inline void append_one(std::string& out, char c) { out += c; }
template<typename T>
void append_one(std::string& out, T number) { out += std::to_string(number); }

template <typename T, typename... Args>
void add_to_string(std::string& out, const T& value, Args const&... args) {
  append_one(out, value);
  add_to_string(out, args...);
}
} // namespace impl

/// Concatenates strings, characters and numbers.
template <class... Args>
std::string cat(Args const&... args) {
  std::string out;
  impl::add_to_string(out, args...);
  return out;
}

} // namespace ligsite
#endif
