/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/midas/core/logging.cpp
===========================================================
Purpose:
  - Implements the noexcept logging API.
  - Adds timestamp + level tag.

Hardening:
  - All operations wrapped so exceptions are swallowed.
  - Coarse mutex makes multi-thread output readable.
===========================================================
*/

#include "midas/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace midas {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::atomic<bool> g_all_stderr{false};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_to_stderr(bool on) noexcept {
  g_all_stderr.store(on, std::memory_order_relaxed);
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool parse_log_level(std::string_view name, LogLevel* out) noexcept {
  if (!out) return false;
  if (iequals(name, "debug")) { *out = LogLevel::DEBUG; return true; }
  if (iequals(name, "info"))  { *out = LogLevel::INFO;  return true; }
  if (iequals(name, "warn") || iequals(name, "warning")) { *out = LogLevel::WARN; return true; }
  if (iequals(name, "error")) { *out = LogLevel::ERROR; return true; }
  return false;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    const int cur = g_level.load(std::memory_order_relaxed);
    if (static_cast<int>(lvl) < cur) return;

    std::lock_guard<std::mutex> lk(g_log_mu);

    const bool to_err = (lvl >= LogLevel::WARN) || g_all_stderr.load(std::memory_order_relaxed);
    std::ostream& out = to_err ? std::cerr : std::cout;
    out << "[" << utc_timestamp() << "]"
        << "[" << level_tag(lvl) << "] "
        << msg << "\n";
    out.flush();
  } catch (...) {
    // Must never throw. Swallow everything.
  }
}

} // namespace midas
