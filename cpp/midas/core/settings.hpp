#pragma once
/*
================================================================================
Core: Detector + Pipeline Settings
FILE: cpp/midas/core/settings.hpp

Purpose:
  - Centralize every knob that changes a score (sketch shape, hash multiplier,
    decay factor) into validated objects with locked defaults.
  - Scores are only comparable across runs when these match; out.csv produced
    with one setting must never be diffed against another.

Hardening:
  - validate_or_throw() rejects shapes that would divide by zero or index out of
    range inside the sketch rows (buckets < 2, rows < 1).
  - Defaults match the published MIDAS reference values.
================================================================================
*/

#include <cstdint>
#include <string>

#include "midas/core/error.hpp"

namespace midas {

using Int = std::uint64_t;
using Float = double;

namespace defaults {
inline constexpr Int kNumRows = 2;
inline constexpr Int kNumBuckets = 769;
inline constexpr Int kMValue = 773;
inline constexpr Float kAlpha = 0.6;
} // namespace defaults

// ----------------------------- Sketch shape ----------------------------------
// Shared by both detectors.
struct SketchSettings {
  // Number of rows of buckets in every internal Count-Min sketch.
  Int rows = defaults::kNumRows;

  // Number of buckets per row.
  Int buckets = defaults::kNumBuckets;

  // Multiplier folding (source, dest) into one hash key.
  Int m_value = defaults::kMValue;

  void validate_or_throw() const {
    MIDAS_ENSURE(rows >= 1 && rows <= 64, ErrorCode::kInvalidArgument,
                 "SketchSettings: rows must be in [1,64]");
    MIDAS_ENSURE(buckets >= 2 && buckets <= (Int{1} << 28), ErrorCode::kInvalidArgument,
                 "SketchSettings: buckets must be in [2,2^28]");
  }
};

// ----------------------------- MIDAS -----------------------------------------
struct MidasParams {
  SketchSettings sketch;

  void validate_or_throw() const { sketch.validate_or_throw(); }
};

// ----------------------------- MIDAS-R ---------------------------------------
struct MidasRParams {
  SketchSettings sketch;

  // Factor used to decay current counts when time ticks ahead.
  Float alpha = defaults::kAlpha;

  void validate_or_throw() const {
    sketch.validate_or_throw();
    MIDAS_ENSURE(alpha > 0.0 && alpha <= 1.0, ErrorCode::kInvalidArgument,
                 "MidasRParams: alpha must be (0,1]");
  }
};

// ----------------------------- Algorithm -------------------------------------
enum class Algorithm : int {
  kMidas = 0,   // plain count-and-clear scorer
  kMidasR = 1   // relational scorer with decay + node sketches
};

inline const char* to_string(Algorithm a) noexcept {
  switch (a) {
    case Algorithm::kMidas:  return "midas";
    case Algorithm::kMidasR: return "midas-r";
    default:                 return "unknown";
  }
}

// ----------------------------- Score output ----------------------------------
struct ScoreOutputSettings {
  // Emit a header row ("score" or "source,dest,time,score").
  bool header = false;

  // Echo source,dest,time before the score.
  bool echo_input = false;

  // Digits after the decimal point (fixed notation).
  int precision = 6;

  void validate_or_throw() const {
    MIDAS_ENSURE(precision >= 0 && precision <= 17, ErrorCode::kInvalidArgument,
                 "ScoreOutputSettings: precision must be in [0,17]");
  }
};

// ----------------------------- RunSettings -----------------------------------
// Everything that affects one score run.
struct RunSettings {
  Algorithm algorithm = Algorithm::kMidasR;
  MidasRParams params;
  ScoreOutputSettings output;

  void validate_or_throw() const {
    params.validate_or_throw();
    output.validate_or_throw();
  }

  MidasParams midas_params() const {
    MidasParams p;
    p.sketch = params.sketch;
    return p;
  }

  static RunSettings defaults() {
    RunSettings s;
    return s;
  }
};

}  // namespace midas
