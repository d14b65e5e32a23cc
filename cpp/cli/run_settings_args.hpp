#pragma once
/*
  Shared flag parsing for the executables that take a RunSettings.

  Flags
  -----
  --algo midas|midas-r   (default midas-r)
  --rows <n>             (default 2)
  --buckets <n>          (default 769)
  --m-value <n>          (default 773)
  --alpha <x>            (default 0.6, midas-r only)
  --header 0|1           (default 0)
  --echo-input 0|1       (default 0)
  --precision <n>        (default 6)
  --log-level debug|info|warn|error
*/

#include "midas/core/logging.hpp"
#include "midas/core/settings.hpp"
#include "midas/io/edge_csv.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>

namespace midas::cli {

inline constexpr const char* kRunSettingsUsage =
    "  --algo midas|midas-r      detector (default midas-r)\n"
    "  --rows <n>                sketch rows (default 2)\n"
    "  --buckets <n>             buckets per row (default 769)\n"
    "  --m-value <n>             edge hash multiplier (default 773)\n"
    "  --alpha <x>               midas-r decay in (0,1] (default 0.6)\n"
    "  --header 0|1              emit a header row (default 0)\n"
    "  --echo-input 0|1          prefix scores with source,dest,time (default 0)\n"
    "  --precision <n>           decimals per score (default 6)\n"
    "  --log-level <lvl>         debug|info|warn|error (default info)\n";

inline bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

inline bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool parse_u64(const char* s, Int* out) {
  if (!s || !out) return false;
  const auto v = io::parse_uint(s);
  if (!v) return false;
  *out = *v;
  return true;
}

inline bool parse_int(const char* s, int* out) {
  Int v = 0;
  if (!parse_u64(s, &v) || v > 1000) return false;
  *out = static_cast<int>(v);
  return true;
}

inline bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

enum class FlagResult { kNotMine, kOk, kError };

// Consumes argv[i] (and its value) if it is a RunSettings flag.
inline FlagResult parse_run_settings_flag(int& i, int argc, char** argv, RunSettings* s, std::string* err) {
  const char* k = argv[i];
  const char* v = nullptr;

  auto need_value = [&]() -> bool {
    if (get_next(i, argc, argv, &v)) return true;
    if (err) *err = std::string(k) + " requires a value";
    return false;
  };
  auto bad = [&](const char* what) -> FlagResult {
    if (err) *err = std::string(k) + " " + what;
    return FlagResult::kError;
  };

  if (std::strcmp(k, "--algo") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (std::strcmp(v, "midas") == 0) s->algorithm = Algorithm::kMidas;
    else if (std::strcmp(v, "midas-r") == 0 || std::strcmp(v, "r") == 0) s->algorithm = Algorithm::kMidasR;
    else return bad("must be midas or midas-r");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--rows") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_u64(v, &s->params.sketch.rows)) return bad("must be an unsigned integer");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--buckets") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_u64(v, &s->params.sketch.buckets)) return bad("must be an unsigned integer");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--m-value") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_u64(v, &s->params.sketch.m_value)) return bad("must be an unsigned integer");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--alpha") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_double(v, &s->params.alpha)) return bad("must be a finite number");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--header") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_bool01(v, &s->output.header)) return bad("must be 0 or 1");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--echo-input") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_bool01(v, &s->output.echo_input)) return bad("must be 0 or 1");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--precision") == 0) {
    if (!need_value()) return FlagResult::kError;
    if (!parse_int(v, &s->output.precision)) return bad("must be an integer");
    return FlagResult::kOk;
  }
  if (std::strcmp(k, "--log-level") == 0) {
    if (!need_value()) return FlagResult::kError;
    LogLevel lvl = LogLevel::INFO;
    if (!parse_log_level(v, &lvl)) return bad("must be debug|info|warn|error");
    set_log_level(lvl);
    return FlagResult::kOk;
  }
  return FlagResult::kNotMine;
}

}  // namespace midas::cli
