#pragma once
/*
===============================================================================
Detect: Chi-squared anomaly statistic
File: cpp/midas/detect/anomaly.hpp
===============================================================================
Given a running total s and the count a observed in the current tick t, the
expected per-tick count is mean = s / t and the score is

    (a - mean)^2 / mean + (a - mean)^2 / (mean * (t - 1))

MIDAS-R only scores increases (a below the mean contributes 0) and floors the
second denominator at mean * 1 so t == 1 stays finite. A key with no recorded
weight scores 0.
===============================================================================
*/

#include "midas/core/settings.hpp"

#include <algorithm>

namespace midas {

inline Float counts_to_anom(Float total, Float current, Int current_time) noexcept {
  if (!(total > 0.0) || current_time == 0) return 0.0;
  const Float current_mean = total / static_cast<Float>(current_time);
  const Float diff = std::max(0.0, current - current_mean);
  const Float sqerr = diff * diff;
  return (sqerr / current_mean) +
         (sqerr / (current_mean * std::max(1.0, static_cast<Float>(current_time - 1))));
}

}  // namespace midas
