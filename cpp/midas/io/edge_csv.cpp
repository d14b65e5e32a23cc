/*
================================================================================
IO: Edge Stream CSV Reader (Implementation)
FILE: cpp/midas/io/edge_csv.cpp
================================================================================
*/

#include "midas/io/edge_csv.hpp"

#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <limits>

namespace midas::io {

namespace {

std::string_view trim(std::string_view v) {
  std::size_t b = 0;
  std::size_t e = v.size();
  while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
  return v.substr(b, e - b);
}

std::vector<std::string_view> split_fields(std::string_view line, char delim) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == delim) {
      out.push_back(trim(line.substr(start, i - start)));
      start = i + 1;
    }
  }
  return out;
}

std::string_view strip_cr(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

}  // namespace

std::optional<Int> parse_uint(std::string_view s) noexcept {
  if (s.empty()) return std::nullopt;
  Int v = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  const auto res = std::from_chars(first, last, v, 10);
  if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
  return v;
}

Edge parse_edge_line(std::string_view line, std::size_t line_no, const EdgeCsvReadOptions& opt) {
  const auto fields = split_fields(strip_cr(line), opt.delimiter);
  MIDAS_ENSURE(fields.size() == 3, ErrorCode::kParseError,
               "line " + std::to_string(line_no) + ": expected 3 fields (source,dest,time), got " +
                   std::to_string(fields.size()));

  static const char* const kNames[3] = {"source", "dest", "time"};
  Int vals[3] = {0, 0, 0};
  for (std::size_t i = 0; i < 3; ++i) {
    const auto v = parse_uint(fields[i]);
    if (!v) {
      MIDAS_THROW(ErrorCode::kParseError,
                  "line " + std::to_string(line_no) + ": " + kNames[i] +
                      " is not an unsigned integer: '" + std::string(fields[i]) + "'");
    }
    vals[i] = *v;
  }
  MIDAS_ENSURE(vals[2] >= 1, ErrorCode::kParseError,
               "line " + std::to_string(line_no) + ": time must be >= 1 (got 0)");
  return Edge{vals[0], vals[1], vals[2]};
}

std::vector<Edge> read_edges(std::istream& is, const EdgeCsvReadOptions& opt) {
  std::vector<Edge> edges;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(is, line)) {
    ++line_no;
    const std::string_view view = trim(strip_cr(line));
    if (view.empty()) continue;

    if (line_no == 1 && opt.allow_header) {
      const auto first = split_fields(view, opt.delimiter);
      if (!first.empty() && !parse_uint(first.front())) {
        log(LogLevel::DEBUG, "edge csv: skipping header '" + std::string(view) + "'");
        continue;
      }
    }

    edges.push_back(parse_edge_line(view, line_no, opt));
  }

  MIDAS_ENSURE(!is.bad(), ErrorCode::kIoError, "edge csv: stream read failure");
  return edges;
}

std::vector<Edge> read_edges_file(const std::string& path, const EdgeCsvReadOptions& opt) {
  if (path == "-") return read_edges(std::cin, opt);

  std::ifstream ifs(path, std::ios::binary);
  MIDAS_ENSURE(ifs.is_open(), ErrorCode::kIoError, "cannot open input: " + path);

  auto edges = read_edges(ifs, opt);
  log(LogLevel::DEBUG, "read " + std::to_string(edges.size()) + " edges from " + path);
  return edges;
}

}  // namespace midas::io
