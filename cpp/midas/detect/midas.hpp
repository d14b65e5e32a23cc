#pragma once
/*
===============================================================================
Detect: MIDAS (count-and-clear edge scorer)
File: cpp/midas/detect/midas.hpp
===============================================================================
Purpose:
  - Score each arriving edge by how far its count in the current tick deviates
    from its long-run per-tick mean.
  - Two edge sketches: current (cleared whenever time advances) and total.

Contracts:
  - Timestamps must be non-decreasing and >= 1. A violating insert throws
    midas::Error(kOutOfRange / kInvalidArgument) and leaves state untouched.
  - Every score at time 1 is exactly 0.
===============================================================================
*/

#include "midas/core/settings.hpp"
#include "midas/detect/edge.hpp"
#include "midas/sketch/count_min.hpp"

#include <vector>

namespace midas {

class Midas final {
 public:
  static constexpr Int kSeedBase = 39;

  explicit Midas(const MidasParams& params = MidasParams{});

  // Record the edge and return its score.
  Float insert(const Edge& e);
  Float insert(Int source, Int dest, Int time) { return insert(Edge{source, dest, time}); }

  // Score of (source, dest) at the current tick, without recording anything.
  Float query(Int source, Int dest) const noexcept;

  Int current_time() const noexcept { return current_time_; }

  // Score a whole stream with a fresh detector.
  static std::vector<Float> iterate(const std::vector<Edge>& edges,
                                    const MidasParams& params = MidasParams{});

 private:
  Int current_time_ = 0;
  sketch::EdgeHash current_count_;
  sketch::EdgeHash total_count_;
};

}  // namespace midas
