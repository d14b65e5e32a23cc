#include "midas/io/file_compare.hpp"

#include "midas/core/error.hpp"

#include <array>
#include <fstream>

namespace midas::io {

namespace {

std::ifstream open_or_throw(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  MIDAS_ENSURE(ifs.is_open(), ErrorCode::kIoError, "cannot open for compare: " + path);
  return ifs;
}

}  // namespace

FileCompareResult compare_files(const std::string& path_a, const std::string& path_b) {
  std::ifstream a = open_or_throw(path_a);
  std::ifstream b = open_or_throw(path_b);

  FileCompareResult r;
  std::array<char, 64 * 1024> buf_a{};
  std::array<char, 64 * 1024> buf_b{};

  std::uint64_t offset = 0;
  for (;;) {
    a.read(buf_a.data(), static_cast<std::streamsize>(buf_a.size()));
    b.read(buf_b.data(), static_cast<std::streamsize>(buf_b.size()));
    MIDAS_ENSURE(!a.bad(), ErrorCode::kIoError, "read failed: " + path_a);
    MIDAS_ENSURE(!b.bad(), ErrorCode::kIoError, "read failed: " + path_b);

    const auto na = static_cast<std::uint64_t>(a.gcount());
    const auto nb = static_cast<std::uint64_t>(b.gcount());
    r.size_a += na;
    r.size_b += nb;

    if (!r.first_diff_offset) {
      const std::uint64_t n = (na < nb) ? na : nb;
      for (std::uint64_t i = 0; i < n; ++i) {
        if (buf_a[i] != buf_b[i]) {
          r.first_diff_offset = offset + i;
          break;
        }
      }
      if (!r.first_diff_offset && na != nb) r.first_diff_offset = offset + n;
    }
    offset += (na > nb) ? na : nb;

    if (na == 0 && nb == 0) break;
  }

  r.identical = !r.first_diff_offset;
  if (!r.identical) r.message = "Files " + path_a + " and " + path_b + " differ";
  return r;
}

}  // namespace midas::io
