/*
================================================================================
C ABI: midas shared library surface
FILE: cpp/midas/capi/midas_c.h

Purpose:
  - Stable, exception-free entry points exported from libmidas so external
    harnesses can load the stripped artifact (dlopen/ctypes) and score edges.

Contract:
  - Every function returning int returns MIDAS_OK (0) or a midas::ErrorCode
    value; midas_last_error() then describes the failure (thread-local).
  - Handles are owned by the caller; free them with the matching *_free.
  - Passing NULL for a handle or out-pointer returns MIDAS_ERR_INVALID_ARGUMENT.
================================================================================
*/

#ifndef MIDAS_CAPI_MIDAS_C_H_
#define MIDAS_CAPI_MIDAS_C_H_

#include <stdint.h>

#if defined(_WIN32)
#define MIDAS_API __declspec(dllexport)
#else
#define MIDAS_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

enum {
  MIDAS_OK = 0,
  MIDAS_ERR_INVALID_ARGUMENT = 1,
  MIDAS_ERR_OUT_OF_RANGE = 2,
  MIDAS_ERR_PARSE = 3,
  MIDAS_ERR_IO = 4,
  MIDAS_ERR_INVARIANT = 5,
  MIDAS_ERR_INTERNAL = 6
};

typedef struct midas_handle midas_handle;
typedef struct midas_r_handle midas_r_handle;

MIDAS_API const char* midas_version(void);
MIDAS_API const char* midas_last_error(void);

/* MIDAS-R. alpha in (0,1]; rows >= 1; buckets >= 2. */
MIDAS_API int midas_r_new(uint64_t rows, uint64_t buckets, uint64_t m_value, double alpha,
                          midas_r_handle** out);
MIDAS_API int midas_r_new_default(midas_r_handle** out);
MIDAS_API void midas_r_free(midas_r_handle* h);
MIDAS_API int midas_r_insert(midas_r_handle* h, uint64_t source, uint64_t dest, uint64_t time,
                             double* score_out);
MIDAS_API int midas_r_query(const midas_r_handle* h, uint64_t source, uint64_t dest,
                            double* score_out);
MIDAS_API uint64_t midas_r_current_time(const midas_r_handle* h);

/* MIDAS (count-and-clear). */
MIDAS_API int midas_new(uint64_t rows, uint64_t buckets, uint64_t m_value, midas_handle** out);
MIDAS_API int midas_new_default(midas_handle** out);
MIDAS_API void midas_free(midas_handle* h);
MIDAS_API int midas_insert(midas_handle* h, uint64_t source, uint64_t dest, uint64_t time,
                           double* score_out);
MIDAS_API int midas_query(const midas_handle* h, uint64_t source, uint64_t dest, double* score_out);
MIDAS_API uint64_t midas_current_time(const midas_handle* h);

/* Formats a score exactly as the score CSV writer does (fixed, `precision`
   decimals). Writes at most buf_len bytes including the NUL terminator and
   returns the full length needed, or -1 on error. */
MIDAS_API int midas_format_score(double score, int precision, char* buf, int buf_len);

#ifdef __cplusplus
}
#endif

#endif  // MIDAS_CAPI_MIDAS_C_H_
