#pragma once
/*
================================================================================
IO: Byte-wise file comparison (diff -q)
FILE: cpp/midas/io/file_compare.hpp
================================================================================
*/

#include <cstdint>
#include <optional>
#include <string>

namespace midas::io {

struct FileCompareResult {
  bool identical = false;

  // Offset of the first differing byte (or of the shorter file's end).
  std::optional<std::uint64_t> first_diff_offset;

  std::uint64_t size_a = 0;
  std::uint64_t size_b = 0;

  // "Files <a> and <b> differ" when not identical, empty otherwise.
  std::string message;
};

// Throws kIoError if either file cannot be opened or read.
FileCompareResult compare_files(const std::string& path_a, const std::string& path_b);

}  // namespace midas::io
