#include "midas/io/atomic_file.hpp"

#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace midas::io {

AtomicFileWriter::AtomicFileWriter(std::string path)
    : path_(std::move(path)), tmp_path_(path_ + ".tmp") {
  MIDAS_ENSURE(!path_.empty(), ErrorCode::kInvalidArgument, "output path is empty");

  std::remove(path_.c_str());  // absent is fine
  ofs_.open(tmp_path_, std::ios::binary | std::ios::trunc);
  MIDAS_ENSURE(ofs_.is_open(), ErrorCode::kIoError, "cannot open for writing: " + tmp_path_);
}

AtomicFileWriter::~AtomicFileWriter() {
  if (committed_) return;
  ofs_.close();
  if (std::remove(tmp_path_.c_str()) == 0) {
    log(LogLevel::WARN, "discarded partial output " + tmp_path_);
  }
}

void AtomicFileWriter::commit() {
  MIDAS_ENSURE(!committed_, ErrorCode::kInvariant, "commit() called twice for " + path_);

  ofs_.flush();
  const bool ok = ofs_.good();
  ofs_.close();
  MIDAS_ENSURE(ok && !ofs_.fail(), ErrorCode::kIoError, "write failed: " + tmp_path_);

  if (std::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
    MIDAS_THROW(ErrorCode::kIoError,
                "rename " + tmp_path_ + " -> " + path_ + " failed: " + std::strerror(errno));
  }
  committed_ = true;
}

}  // namespace midas::io
