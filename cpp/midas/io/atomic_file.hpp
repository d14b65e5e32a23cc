#pragma once
/*
================================================================================
IO: Delete-on-error file writer
FILE: cpp/midas/io/atomic_file.hpp

  - Writes to "<path>.tmp"; commit() flushes and renames over <path>.
  - Destroyed without commit() (exception, early return): the temp file is
    removed and <path> is left as it was before the write started.
  - A stale <path> is removed up front so a failed run never leaves an old
    output that looks current.
================================================================================
*/

#include <fstream>
#include <string>

namespace midas::io {

class AtomicFileWriter final {
 public:
  explicit AtomicFileWriter(std::string path);
  ~AtomicFileWriter();

  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  std::ostream& stream() noexcept { return ofs_; }

  // Throws kIoError if the data could not be flushed or renamed.
  void commit();

  const std::string& path() const noexcept { return path_; }
  const std::string& temp_path() const noexcept { return tmp_path_; }

 private:
  std::string path_;
  std::string tmp_path_;
  std::ofstream ofs_;
  bool committed_ = false;
};

}  // namespace midas::io
