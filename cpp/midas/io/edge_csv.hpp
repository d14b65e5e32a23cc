#pragma once
/*
================================================================================
IO: Edge Stream CSV Reader
FILE: cpp/midas/io/edge_csv.hpp

Input format:
  source,dest,time         (unsigned integers, one edge per line)

Hardening:
  - Optional header row: detected when the first field of line 1 is not an
    unsigned integer.
  - Blank lines skipped; trailing CR stripped; whitespace around fields trimmed.
  - Any malformed row throws midas::Error(kParseError) naming the 1-based line.
  - No sortedness check here; detectors reject decreasing timestamps.
================================================================================
*/

#include "midas/detect/edge.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace midas::io {

struct EdgeCsvReadOptions {
  char delimiter = ',';
  bool allow_header = true;
};

// Parse an unsigned decimal integer (no sign, no spaces). nullopt on failure/overflow.
std::optional<Int> parse_uint(std::string_view s) noexcept;

// Parse one non-empty data line. Throws kParseError with line_no in the message.
Edge parse_edge_line(std::string_view line, std::size_t line_no,
                     const EdgeCsvReadOptions& opt = EdgeCsvReadOptions());

std::vector<Edge> read_edges(std::istream& is,
                             const EdgeCsvReadOptions& opt = EdgeCsvReadOptions());

// "-" reads stdin. Throws kIoError if the file cannot be opened.
std::vector<Edge> read_edges_file(const std::string& path,
                                  const EdgeCsvReadOptions& opt = EdgeCsvReadOptions());

}  // namespace midas::io
