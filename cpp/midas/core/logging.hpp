#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/midas/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL midas modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Caller controls severity; implementation routes WARN/ERROR to stderr.

Notes:
  - Score CSVs may be written to stdout ("-"), so the CLI can force all
    output to stderr with set_log_to_stderr(true).
===========================================================
*/

#include <string>
#include <string_view>

namespace midas {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Route every level to stderr (keeps stdout clean for data).
void set_log_to_stderr(bool on) noexcept;

// Parse "debug" | "info" | "warn" | "error" (case-insensitive).
// Returns false and leaves *out untouched on unknown names.
bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace midas
