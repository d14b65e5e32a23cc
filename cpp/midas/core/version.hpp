#pragma once

// Set by the build (project version); fallback keeps standalone builds working.
#ifndef MIDAS_VERSION_STRING
#define MIDAS_VERSION_STRING "0.0.0"
#endif

namespace midas {

inline constexpr const char* kVersion = MIDAS_VERSION_STRING;

}  // namespace midas
