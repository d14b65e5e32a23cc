/*
================================================================================
C ABI: midas shared library surface (Implementation)
FILE: cpp/midas/capi/midas_c.cpp

Hardening:
  - No exception crosses the ABI: every entry point catches midas::Error
    (mapped to its code) and std::exception (MIDAS_ERR_INTERNAL).
================================================================================
*/

#include "midas/capi/midas_c.h"

#include "midas/core/error.hpp"
#include "midas/core/settings.hpp"
#include "midas/core/version.hpp"
#include "midas/detect/midas.hpp"
#include "midas/detect/midas_r.hpp"
#include "midas/io/score_csv.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <new>
#include <string>

struct midas_handle {
  midas::Midas detector;
};

struct midas_r_handle {
  midas::MidasR detector;
};

namespace {

thread_local std::string g_last_error;

void set_error(const char* msg) noexcept {
  try {
    g_last_error = msg ? msg : "";
  } catch (const std::bad_alloc&) {
    g_last_error.clear();
  }
}

int invalid(const char* msg) noexcept {
  set_error(msg);
  return MIDAS_ERR_INVALID_ARGUMENT;
}

// Runs fn, translating exceptions to status codes.
template <typename F>
int guarded(F&& fn) noexcept {
  try {
    fn();
    return MIDAS_OK;
  } catch (const midas::Error& e) {
    set_error(e.what());
    return e.status();
  } catch (const std::exception& e) {
    set_error(e.what());
    return MIDAS_ERR_INTERNAL;
  }
}

midas::SketchSettings sketch_settings(uint64_t rows, uint64_t buckets, uint64_t m_value) {
  midas::SketchSettings s;
  s.rows = rows;
  s.buckets = buckets;
  s.m_value = m_value;
  return s;
}

}  // namespace

extern "C" {

const char* midas_version(void) { return midas::kVersion; }

const char* midas_last_error(void) { return g_last_error.c_str(); }

// ----------------------------- MIDAS-R ---------------------------------------

int midas_r_new(uint64_t rows, uint64_t buckets, uint64_t m_value, double alpha,
                midas_r_handle** out) {
  if (!out) return invalid("midas_r_new: out is NULL");
  *out = nullptr;
  return guarded([&] {
    midas::MidasRParams p;
    p.sketch = sketch_settings(rows, buckets, m_value);
    p.alpha = alpha;
    *out = new midas_r_handle{midas::MidasR(p)};
  });
}

int midas_r_new_default(midas_r_handle** out) {
  return midas_r_new(midas::defaults::kNumRows, midas::defaults::kNumBuckets,
                     midas::defaults::kMValue, midas::defaults::kAlpha, out);
}

void midas_r_free(midas_r_handle* h) { delete h; }

int midas_r_insert(midas_r_handle* h, uint64_t source, uint64_t dest, uint64_t time,
                   double* score_out) {
  if (!h || !score_out) return invalid("midas_r_insert: NULL argument");
  return guarded([&] { *score_out = h->detector.insert(source, dest, time); });
}

int midas_r_query(const midas_r_handle* h, uint64_t source, uint64_t dest, double* score_out) {
  if (!h || !score_out) return invalid("midas_r_query: NULL argument");
  *score_out = h->detector.query(source, dest);
  return MIDAS_OK;
}

uint64_t midas_r_current_time(const midas_r_handle* h) {
  return h ? h->detector.current_time() : 0;
}

// ----------------------------- MIDAS -----------------------------------------

int midas_new(uint64_t rows, uint64_t buckets, uint64_t m_value, midas_handle** out) {
  if (!out) return invalid("midas_new: out is NULL");
  *out = nullptr;
  return guarded([&] {
    midas::MidasParams p;
    p.sketch = sketch_settings(rows, buckets, m_value);
    *out = new midas_handle{midas::Midas(p)};
  });
}

int midas_new_default(midas_handle** out) {
  return midas_new(midas::defaults::kNumRows, midas::defaults::kNumBuckets,
                   midas::defaults::kMValue, out);
}

void midas_free(midas_handle* h) { delete h; }

int midas_insert(midas_handle* h, uint64_t source, uint64_t dest, uint64_t time,
                 double* score_out) {
  if (!h || !score_out) return invalid("midas_insert: NULL argument");
  return guarded([&] { *score_out = h->detector.insert(source, dest, time); });
}

int midas_query(const midas_handle* h, uint64_t source, uint64_t dest, double* score_out) {
  if (!h || !score_out) return invalid("midas_query: NULL argument");
  *score_out = h->detector.query(source, dest);
  return MIDAS_OK;
}

uint64_t midas_current_time(const midas_handle* h) {
  return h ? h->detector.current_time() : 0;
}

// ----------------------------- Formatting ------------------------------------

int midas_format_score(double score, int precision, char* buf, int buf_len) {
  if (precision < 0 || precision > 17 || buf_len < 0 || (!buf && buf_len > 0)) {
    set_error("midas_format_score: invalid argument");
    return -1;
  }
  int needed = -1;
  const int rc = guarded([&] {
    const std::string s = midas::io::format_score(score, precision);
    needed = static_cast<int>(s.size());
    if (buf_len > 0) {
      const std::size_t n = std::min<std::size_t>(s.size(), static_cast<std::size_t>(buf_len - 1));
      std::memcpy(buf, s.data(), n);
      buf[n] = '\0';
    }
  });
  return rc == MIDAS_OK ? needed : -1;
}

}  // extern "C"
