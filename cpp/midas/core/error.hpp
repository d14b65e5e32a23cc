#pragma once
/*
  Errors

  Every library failure is a midas::Error carrying an ErrorCode and the
  source site that raised it. The numeric codes are also the status values
  of the C ABI (midas_c.h), so they are fixed once published; from_status()
  maps a status returned by a loaded artifact back onto a code.

  MIDAS_ENSURE only builds its message when the check fails, so hot paths
  can pass concatenated strings.
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace midas {

enum class ErrorCode : int {
  kInvalidArgument = 1,  // bad settings, time 0 handed to a detector, same in/out path
  kOutOfRange      = 2,  // timestamp went backwards
  kParseError      = 3,  // malformed edge CSV
  kIoError         = 4,  // open/read/write/rename/dlopen failures
  kInvariant       = 5,  // internal contract broken by a caller (size mismatch)
  kInternal        = 6,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kOutOfRange:      return "OutOfRange";
    case ErrorCode::kParseError:      return "ParseError";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInvariant:       return "Invariant";
    case ErrorCode::kInternal:        return "Internal";
    default:                          return "Unknown";
  }
}

inline int to_status(ErrorCode c) noexcept { return static_cast<int>(c); }

// Unknown statuses collapse to kInternal.
inline ErrorCode from_status(int status) noexcept {
  if (status >= to_status(ErrorCode::kInvalidArgument) && status <= to_status(ErrorCode::kInternal)) {
    return static_cast<ErrorCode>(status);
  }
  return ErrorCode::kInternal;
}

struct SourceSite final {
  const char* file = "";
  int line = 0;
  const char* function = "";
};

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, SourceSite site = {})
      : std::runtime_error(format(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  int status() const noexcept { return to_status(code_); }
  const std::string& message() const noexcept { return message_; }
  const SourceSite& site() const noexcept { return site_; }

 private:
  static std::string format(ErrorCode code, const std::string& msg, const SourceSite& site) {
    std::ostringstream oss;
    oss << "[midas::Error code=" << to_string(code) << "(" << to_status(code) << ")] " << msg;
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.function && *site.function) oss << " (" << site.function << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  SourceSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, SourceSite site) {
  throw Error(code, std::move(message), site);
}

}  // namespace midas

#define MIDAS_SITE() (::midas::SourceSite{__FILE__, __LINE__, __func__})

#define MIDAS_THROW(CODE, MSG) ::midas::throw_error((CODE), (MSG), MIDAS_SITE())

#define MIDAS_ENSURE(EXPR, CODE, MSG)                                 \
  do {                                                                \
    if (!(EXPR)) ::midas::throw_error((CODE), (MSG), MIDAS_SITE());   \
  } while (0)
