#pragma once
/*
===============================================================================
Detect: MIDAS-R (relational edge scorer with temporal decay)
File: cpp/midas/detect/midas_r.hpp
===============================================================================
Purpose:
  - Extends MIDAS in two ways:
      * current counts decay by alpha^dt when time advances instead of being
        cleared, so bursts spread across neighbouring ticks still register;
      * source and destination nodes get their own current/total sketches, so
        a node that suddenly fans out scores high even on fresh edges.
  - Final score: log1p(max(edge, source, dest)).

Contracts:
  - Timestamps must be non-decreasing and >= 1 (violations throw, state kept).
  - insert(e) == query(e.source, e.dest) immediately afterwards.
  - Decay is applied once with the combined factor alpha^(t_new - t_old).
===============================================================================
*/

#include "midas/core/settings.hpp"
#include "midas/detect/edge.hpp"
#include "midas/sketch/count_min.hpp"

#include <vector>

namespace midas {

class MidasR final {
 public:
  static constexpr Int kSeedBase = 538;

  explicit MidasR(const MidasRParams& params = MidasRParams{});

  Float insert(const Edge& e);
  Float insert(Int source, Int dest, Int time) { return insert(Edge{source, dest, time}); }

  Float query(Int source, Int dest) const noexcept;

  Int current_time() const noexcept { return current_time_; }
  Float alpha() const noexcept { return alpha_; }

  static std::vector<Float> iterate(const std::vector<Edge>& edges,
                                    const MidasRParams& params = MidasRParams{});

 private:
  Int current_time_ = 0;
  Float alpha_;

  sketch::EdgeHash current_count_;
  sketch::EdgeHash total_count_;

  sketch::NodeHash source_score_;
  sketch::NodeHash dest_score_;
  sketch::NodeHash source_total_;
  sketch::NodeHash dest_total_;
};

}  // namespace midas
