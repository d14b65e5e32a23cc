/*
  IO + score pipeline selftest

  Validates:
    1) Edge CSV parsing: header detection, CRLF, blank lines, whitespace,
       malformed rows reported with their line number.
    2) Score formatting is fixed-point, locale-free, NaN -> "".
    3) Atomic writes leave nothing behind on failure.
    4) Byte comparison finds the first differing offset.
    5) run_score_file is deterministic, removes its output on input errors
       and refuses to write over its own input.
*/

#include "midas/core/selftest.hpp"
#include "midas/detect/midas_r.hpp"
#include "midas/io/atomic_file.hpp"
#include "midas/io/edge_csv.hpp"
#include "midas/io/file_compare.hpp"
#include "midas/io/score_csv.hpp"
#include "midas/pipeline/score_pipeline.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace midas {
namespace {

using namespace midas::selftest;
namespace fs = std::filesystem;

fs::path scratch_dir() {
  const fs::path d = fs::temp_directory_path() / "midas_io_selftest";
  fs::create_directories(d);
  return d;
}

void write_text(const fs::path& p, const std::string& s) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << s;
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

void test_parse_uint() {
  expect_true(io::parse_uint("42") == Int{42}, "parse_uint: plain value");
  expect_true(io::parse_uint("18446744073709551615") == std::numeric_limits<Int>::max(), "parse_uint: max u64");
  expect_true(!io::parse_uint("18446744073709551616"), "parse_uint: overflow rejected");
  expect_true(!io::parse_uint(""), "parse_uint: empty rejected");
  expect_true(!io::parse_uint("-1"), "parse_uint: sign rejected");
  expect_true(!io::parse_uint("1a"), "parse_uint: trailing junk rejected");
}

void test_read_edges() {
  std::istringstream in("source,dest,time\r\n1,2,3\r\n\r\n 4 , 5 , 6\n7,8,9");
  const auto edges = io::read_edges(in);
  expect_true(edges.size() == 3, "read_edges: header, blank line and CRLF handled");
  if (edges.size() == 3) {
    expect_true(edges[0] == Edge{1, 2, 3}, "read_edges: first row");
    expect_true(edges[1] == Edge{4, 5, 6}, "read_edges: whitespace trimmed");
    expect_true(edges[2] == Edge{7, 8, 9}, "read_edges: missing final newline");
  }

  std::istringstream no_header("1,1,1\n");
  expect_true(io::read_edges(no_header).size() == 1, "read_edges: numeric first line is data");

  std::istringstream short_row("1,2,3\n1,2\n");
  try {
    io::read_edges(short_row);
    fail("read_edges: short row must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kParseError, "read_edges: short row is ParseError");
    expect_true(e.message().find("line 2") != std::string::npos, "read_edges: error names line 2");
  }

  std::istringstream bad_value("1,2,x\n");
  expect_error([&] { io::read_edges(bad_value); }, ErrorCode::kParseError, "read_edges: non-numeric time");

  std::istringstream zero_time("1,2,1\n1,2,0\n");
  try {
    io::read_edges(zero_time);
    fail("read_edges: time 0 must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kParseError, "read_edges: time 0 is ParseError");
    expect_true(e.message().find("line 2") != std::string::npos, "read_edges: time 0 error names line 2");
  }

  expect_error([&] { io::read_edges_file((scratch_dir() / "does_not_exist.csv").string()); },
               ErrorCode::kIoError, "read_edges_file: missing file is IoError");
}

void test_format_and_write() {
  expect_eq_str(io::format_score(0.0), "0.000000", "format_score: zero");
  expect_eq_str(io::format_score(1.0 / 3.0), "0.333333", "format_score: rounding");
  expect_eq_str(io::format_score(2.5, 2), "2.50", "format_score: precision");
  expect_eq_str(io::format_score(std::numeric_limits<double>::quiet_NaN()), "", "format_score: NaN empty");

  const std::vector<Edge> edges{{1, 2, 1}, {3, 4, 2}};
  const std::vector<Float> scores{0.0, 1.25};

  ScoreOutputSettings plain;
  std::ostringstream a;
  io::write_scores(a, edges, scores, plain);
  expect_eq_str(a.str(), "0.000000\n1.250000\n", "write_scores: default layout");

  ScoreOutputSettings echo;
  echo.header = true;
  echo.echo_input = true;
  std::ostringstream b;
  io::write_scores(b, edges, scores, echo);
  expect_eq_str(b.str(), "source,dest,time,score\n1,2,1,0.000000\n3,4,2,1.250000\n",
                "write_scores: header + echo layout");

  expect_error([&] {
    std::ostringstream c;
    io::write_scores(c, std::vector<Edge>{}, scores, echo);
  }, ErrorCode::kInvariant, "write_scores: echo requires matching edges");
}

void test_atomic_writer() {
  const fs::path target = scratch_dir() / "atomic.csv";
  write_text(target, "stale\n");

  {
    io::AtomicFileWriter w(target.string());
    w.stream() << "partial";
  }
  expect_true(!fs::exists(target), "atomic: stale target removed when write not committed");
  expect_true(!fs::exists(target.string() + ".tmp"), "atomic: temp removed when write not committed");

  {
    io::AtomicFileWriter w(target.string());
    w.stream() << "done\n";
    w.commit();
  }
  expect_eq_str(read_text(target), "done\n", "atomic: committed content in place");
  expect_true(!fs::exists(target.string() + ".tmp"), "atomic: no temp after commit");
}

void test_compare() {
  const fs::path d = scratch_dir();
  write_text(d / "a.csv", "0.100000\n0.200000\n");
  write_text(d / "b.csv", "0.100000\n0.200000\n");
  write_text(d / "c.csv", "0.100000\n0.300000\n");
  write_text(d / "e.csv", "0.100000\n");

  const auto same = io::compare_files((d / "a.csv").string(), (d / "b.csv").string());
  expect_true(same.identical && same.message.empty(), "compare: identical files");

  const auto diff = io::compare_files((d / "a.csv").string(), (d / "c.csv").string());
  expect_true(!diff.identical && diff.first_diff_offset == std::uint64_t{11}, "compare: first differing byte");
  expect_true(diff.message.find("differ") != std::string::npos &&
                  diff.message.find("a.csv") != std::string::npos &&
                  diff.message.find("c.csv") != std::string::npos,
              "compare: message names both files");

  const auto shorter = io::compare_files((d / "a.csv").string(), (d / "e.csv").string());
  expect_true(!shorter.identical && shorter.first_diff_offset == std::uint64_t{9} && shorter.size_a == 18 &&
                  shorter.size_b == 9,
              "compare: prefix file differs at its end");

  expect_error([&] { io::compare_files((d / "a.csv").string(), (d / "missing.csv").string()); },
               ErrorCode::kIoError, "compare: missing file is IoError");
}

void test_run_score_file() {
  const fs::path d = scratch_dir();
  std::string in = "source,dest,time\n";
  for (int t = 1; t <= 30; ++t) {
    for (int k = 0; k < 4; ++k) in += std::to_string(k) + "," + std::to_string((t + k) % 5) + "," + std::to_string(t) + "\n";
  }
  write_text(d / "in.csv", in);

  const RunSettings s = RunSettings::defaults();
  const auto rep = pipeline::run_score_file((d / "in.csv").string(), (d / "out1.csv").string(), s, 3);
  pipeline::run_score_file((d / "in.csv").string(), (d / "out2.csv").string(), s);

  expect_true(rep.edges == 120 && rep.first_time == 1 && rep.last_time == 30, "run_score_file: report counts");
  expect_true(rep.top.size() == 3, "run_score_file: top-k collected");
  expect_true(io::compare_files((d / "out1.csv").string(), (d / "out2.csv").string()).identical,
              "run_score_file: two runs byte-identical");

  const auto edges = io::read_edges_file((d / "in.csv").string());
  const auto direct = MidasR::iterate(edges);
  std::ostringstream expect;
  io::write_scores(expect, edges, direct, s.output);
  expect_eq_str(read_text(d / "out1.csv"), expect.str(), "run_score_file: matches detector output");

  write_text(d / "bad.csv", "1,2,5\n1,2,4\n");
  write_text(d / "bad_out.csv", "stale\n");
  expect_error([&] { pipeline::run_score_file((d / "bad.csv").string(), (d / "bad_out.csv").string(), s); },
               ErrorCode::kOutOfRange, "run_score_file: decreasing time fails");
  expect_true(!fs::exists(d / "bad_out.csv"), "run_score_file: failed run leaves no output");

  const std::string small = "1,2,1\n3,4,2\n";
  write_text(d / "inplace.csv", small);
  expect_error([&] { pipeline::run_score_file((d / "inplace.csv").string(), (d / "inplace.csv").string(), s); },
               ErrorCode::kInvalidArgument, "run_score_file: output onto its own input rejected");
  expect_eq_str(read_text(d / "inplace.csv"), small, "run_score_file: input untouched when out == in");

  const fs::path alias = d / "." / "inplace.csv";
  expect_error([&] { pipeline::run_score_file((d / "inplace.csv").string(), alias.string(), s); },
               ErrorCode::kInvalidArgument, "run_score_file: aliased path to the input rejected");
  expect_true(fs::exists(d / "inplace.csv"), "run_score_file: input survives aliased output path");
}

}  // namespace
}  // namespace midas

int main() {
  midas::test_parse_uint();
  midas::test_read_edges();
  midas::test_format_and_write();
  midas::test_atomic_writer();
  midas::test_compare();
  midas::test_run_score_file();
  return midas::selftest::finish("io_selftest");
}
