#pragma once

#include "midas/core/settings.hpp"

namespace midas {

// One streamed record: a directed edge observed at a discrete timestamp.
struct Edge {
  Int source = 0;
  Int dest = 0;
  Int time = 0;

  bool operator==(const Edge&) const = default;
};

}  // namespace midas
