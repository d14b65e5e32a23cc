#pragma once

#include "midas/core/error.hpp"
#include "midas/core/settings.hpp"

#include <string>

namespace midas {

// Timestamps start at 1 and never go backwards.
inline void require_next_time(Int current_time, Int time) {
  MIDAS_ENSURE(time >= 1, ErrorCode::kInvalidArgument,
               "edge timestamp must be >= 1 (got 0)");
  MIDAS_ENSURE(time >= current_time, ErrorCode::kOutOfRange,
               "edge timestamp went backwards: " + std::to_string(time) +
                   " < current time " + std::to_string(current_time));
}

}  // namespace midas
