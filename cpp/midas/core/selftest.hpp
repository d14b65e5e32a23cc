#pragma once
/*
  Selftest helpers

  Framework-free expectations shared by the *_selftest executables. Each
  expectation prints "[ OK ]" or "[FAIL]" to stderr; the executable returns
  finish() so any failure makes ctest report it.
*/

#include "midas/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

namespace midas::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_near(double got, double exp, std::string_view msg, double rel = 1e-9) {
  if (!near(got, exp, rel)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// fn must throw midas::Error with the given code.
template <typename F>
void expect_error(F&& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected midas::Error(" << to_string(code) << "), nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  expected " << to_string(code) << ", got " << to_string(e.code()) << ": " << e.what() << "\n";
    } else {
      pass(msg);
    }
  }
}

inline int finish(std::string_view suite) {
  if (g_fail_count == 0) {
    std::cerr << "[PASS] " << suite << "\n";
    return 0;
  }
  std::cerr << "[FAILED] " << suite << ": " << g_fail_count << " failure(s)\n";
  return 1;
}

}  // namespace midas::selftest
