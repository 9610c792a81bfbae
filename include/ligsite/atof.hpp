// Copyright The ligsite Authors.
//
// Functions that convert string to floating-point number ignoring locale.
// Wrappers around https://github.com/fastfloat/fast_float/

#ifndef LIGSITE_ATOF_HPP_
#define LIGSITE_ATOF_HPP_

#include <string>
#include <system_error>  // for errc
#include <fast_float/fast_float.h>
#include "atox.hpp"   // for is_space

namespace ligsite {

using fast_float::from_chars_result;

inline from_chars_result fast_from_chars(const char* start, const char* end, double& d) {
  while (start < end && is_space(*start))
    ++start;
  if (start < end && *start == '+')
    ++start;
  return fast_float::from_chars(start, end, d);
}

/// Reads a real number from a fixed-width column. Blanks around the number
/// are allowed; a blank field or trailing garbage throws std::invalid_argument.
inline double read_checked_double(const char* p, int field_length) {
  const char* end = p + field_length;
  double d = 0.;
  from_chars_result result = fast_from_chars(p, end, d);
  const char* ptr = result.ptr;
  while (ptr < end && is_space(*ptr))
    ++ptr;
  if (result.ec != std::errc() || ptr != end)
    throw std::invalid_argument("not a number: '" +
                                std::string(p, field_length) + "'");
  return d;
}

} // namespace ligsite
#endif
