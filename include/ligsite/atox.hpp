// Copyright The ligsite Authors.
//
// Locale-independent functions that convert strings to integers,
// equivalents of standard isspace and isdigit, and a few helper functions.
// They are locale-independent (a good thing when reading numbers from files).

#ifndef LIGSITE_ATOX_HPP_
#define LIGSITE_ATOX_HPP_

#include <stdexcept>  // for invalid_argument
#include <string>

namespace ligsite {

inline bool is_space(char c) {
  return c == ' ' || (c >= '\t' && c <= '\r');
}

inline bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

inline bool is_alpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// Parses an integer from a fixed-width field (surrounding blanks allowed).
/// With checked=true, throws std::invalid_argument if the field is blank
/// or has anything but a number.
/// No checking for overflow.
inline int string_to_int(const char* p, bool checked, size_t length=0) {
  int mult = -1;
  int n = 0;
  size_t i = 0;
  auto inside = [&]() { return (length == 0 || i < length) && p[i] != '\0'; };
  while (inside() && is_space(p[i]))
    ++i;
  if (inside() && p[i] == '-') {
    mult = 1;
    ++i;
  } else if (inside() && p[i] == '+') {
    ++i;
  }
  bool has_digits = false;
  // use negative numbers because INT_MIN < -INT_MAX
  for (; inside() && is_digit(p[i]); ++i) {
    n = n * 10 - (p[i] - '0');
    has_digits = true;
  }
  if (checked) {
    while (inside() && is_space(p[i]))
      ++i;
    if (!has_digits || inside())
      throw std::invalid_argument("not an integer: '" +
                                  std::string(p, length ? length : i) + "'");
  }
  return mult * n;
}

inline int string_to_int(const std::string& str, bool checked) {
  return string_to_int(str.c_str(), checked);
}

} // namespace ligsite
#endif
