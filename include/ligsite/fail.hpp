// Copyright The ligsite Authors.
//
// fail(), sys_fail() and unreachable()

#ifndef LIGSITE_FAIL_HPP_
#define LIGSITE_FAIL_HPP_

#include <cerrno>     // for errno
#include <cstring>    // for strerror
#include <stdexcept>  // for runtime_error
#include <string>
#include <utility>    // for forward

#if defined(__GNUC__) || defined(__clang__)
# define LIGSITE_COLD __attribute__((cold))
#else
# define LIGSITE_COLD
#endif

namespace ligsite {

[[noreturn]]
inline void fail(const std::string& msg) { throw std::runtime_error(msg); }

template<typename T, typename... Args> [[noreturn]]
void fail(std::string&& str, T&& arg1, Args&&... args) {
  str += arg1;
  fail(std::move(str), std::forward<Args>(args)...);
}
template<typename T, typename... Args> [[noreturn]]
void fail(const std::string& str, T&& arg1, Args&&... args) {
  fail(str + arg1, std::forward<Args>(args)...);
}

// appends the errno description
[[noreturn]] LIGSITE_COLD
inline void sys_fail(const std::string& msg) {
  throw std::runtime_error(msg + ": " + std::strerror(errno));
}
[[noreturn]] LIGSITE_COLD
inline void sys_fail(const char* msg) { sys_fail(std::string(msg)); }

// unreachable() is used to silence GCC -Wreturn-type and hint the compiler
[[noreturn]] inline void unreachable() {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

} // namespace ligsite
#endif
