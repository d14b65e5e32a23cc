/*
  C ABI + loaded-artifact selftest

  Usage: capi_selftest <path-to-packaged-artifact>

  Validates:
    1) Linked C ABI matches the C++ detectors score-for-score.
    2) Errors come back as codes + midas_last_error(), never as exceptions.
    3) The packaged (stripped) artifact still exports the ABI and, loaded with
       dlopen, reproduces the in-process scores exactly.
    4) ErrorCode <-> status mapping and the lazy MIDAS_ENSURE message.
*/

#include "midas/capi/midas_c.h"
#include "midas/core/selftest.hpp"
#include "midas/detect/midas.hpp"
#include "midas/detect/midas_r.hpp"
#include "midas/pipeline/artifact.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace midas {
namespace {

using namespace midas::selftest;

std::vector<Edge> sample_stream() {
  std::vector<Edge> edges;
  for (Int t = 1; t <= 40; ++t) {
    for (Int k = 0; k < 6; ++k) edges.push_back(Edge{(t * 13 + k) % 11, (t + k * 5) % 9, t});
    if (t == 33) {
      for (int i = 0; i < 25; ++i) edges.push_back(Edge{4, 4, t});
    }
  }
  return edges;
}

void test_linked_abi_matches_cpp() {
  const auto edges = sample_stream();
  const auto expect_r = MidasR::iterate(edges);
  const auto expect_m = Midas::iterate(edges);

  midas_r_handle* r = nullptr;
  midas_handle* m = nullptr;
  expect_true(midas_r_new_default(&r) == MIDAS_OK && r != nullptr, "abi: midas_r_new_default");
  expect_true(midas_new_default(&m) == MIDAS_OK && m != nullptr, "abi: midas_new_default");
  if (!r || !m) return;

  bool same_r = true;
  bool same_m = true;
  for (std::size_t i = 0; i < edges.size(); ++i) {
    double s = -1.0;
    same_r = same_r && midas_r_insert(r, edges[i].source, edges[i].dest, edges[i].time, &s) == MIDAS_OK &&
             s == expect_r[i];
    same_m = same_m && midas_insert(m, edges[i].source, edges[i].dest, edges[i].time, &s) == MIDAS_OK &&
             s == expect_m[i];
  }
  expect_true(same_r, "abi: midas-r scores identical to C++");
  expect_true(same_m, "abi: midas scores identical to C++");
  expect_true(midas_r_current_time(r) == 40 && midas_current_time(m) == 40, "abi: current_time");

  double q = -1.0;
  expect_true(midas_r_query(r, edges.back().source, edges.back().dest, &q) == MIDAS_OK && q == expect_r.back(),
              "abi: query equals last insert");

  midas_r_free(r);
  midas_free(m);
}

void test_abi_errors() {
  midas_r_handle* r = nullptr;
  expect_true(midas_r_new(2, 769, 773, 0.0, &r) == MIDAS_ERR_INVALID_ARGUMENT && r == nullptr,
              "abi: invalid alpha rejected");
  expect_true(std::strlen(midas_last_error()) > 0, "abi: last_error describes failure");

  expect_true(midas_r_new(2, 769, 773, 0.6, nullptr) == MIDAS_ERR_INVALID_ARGUMENT, "abi: NULL out rejected");

  expect_true(midas_r_new_default(&r) == MIDAS_OK, "abi: create for order test");
  double s = 0.0;
  expect_true(midas_r_insert(r, 1, 2, 10, &s) == MIDAS_OK, "abi: insert at t=10");
  expect_true(midas_r_insert(r, 1, 2, 9, &s) == MIDAS_ERR_OUT_OF_RANGE, "abi: decreasing time is OUT_OF_RANGE");
  expect_true(std::string(midas_last_error()).find("backwards") != std::string::npos, "abi: last_error explains order");
  expect_true(midas_r_insert(nullptr, 1, 2, 10, &s) == MIDAS_ERR_INVALID_ARGUMENT, "abi: NULL handle rejected");
  midas_r_free(r);
  midas_free(nullptr);

  char buf[32];
  expect_true(midas_format_score(1.0 / 3.0, 6, buf, sizeof(buf)) == 8 && std::string(buf) == "0.333333",
              "abi: format_score");
  expect_true(midas_format_score(123.5, 1, buf, 4) == 5 && std::string(buf) == "123", "abi: format_score truncates");
  expect_true(std::string(midas_version()).size() > 0, "abi: version");
}

void test_status_mapping() {
  expect_true(to_status(ErrorCode::kParseError) == MIDAS_ERR_PARSE, "status: ParseError matches header");
  expect_true(to_status(ErrorCode::kInternal) == MIDAS_ERR_INTERNAL, "status: Internal matches header");
  expect_true(from_status(MIDAS_ERR_OUT_OF_RANGE) == ErrorCode::kOutOfRange, "status: out-of-range round trip");
  expect_true(from_status(99) == ErrorCode::kInternal && from_status(-1) == ErrorCode::kInternal,
              "status: unknown values map to Internal");

  int built = 0;
  auto message = [&] { ++built; return std::string("not built"); };
  MIDAS_ENSURE(true, ErrorCode::kInvariant, message());
  expect_true(built == 0, "ensure: message not built when the check holds");

  try {
    MIDAS_ENSURE(false, ErrorCode::kParseError, message());
    fail("ensure: failing check must throw");
  } catch (const Error& e) {
    expect_true(built == 1 && e.status() == MIDAS_ERR_PARSE, "ensure: failing check throws with its code");
    expect_true(e.site().line > 0 && std::strstr(e.site().file, "capi_selftest") != nullptr,
                "ensure: error records the raising site");
    expect_true(std::string(e.what()).find("code=ParseError(3)] not built") != std::string::npos,
                "ensure: what() carries code and message");
  }
}

void test_loaded_artifact(const std::string& path) {
  try {
    pipeline::ArtifactScorer art(path);
    expect_eq_str(art.version(), midas_version(), "artifact: version matches linked library");

    const auto edges = sample_stream();
    RunSettings s = RunSettings::defaults();
    expect_true(art.score(edges, s) == MidasR::iterate(edges), "artifact: midas-r scores identical");

    s.algorithm = Algorithm::kMidas;
    expect_true(art.score(edges, s) == Midas::iterate(edges), "artifact: midas scores identical");

    std::vector<Edge> bad{{1, 1, 3}, {1, 1, 2}};
    expect_error([&] { art.score(bad, RunSettings::defaults()); }, ErrorCode::kOutOfRange,
                 "artifact: error code crosses the ABI");
  } catch (const std::exception& e) {
    fail(std::string("artifact: threw: ") + e.what());
  }

  expect_error([&] { pipeline::ArtifactScorer missing(path + ".missing"); }, ErrorCode::kIoError,
               "artifact: missing file is IoError");
}

}  // namespace
}  // namespace midas

int main(int argc, char** argv) {
  midas::test_linked_abi_matches_cpp();
  midas::test_abi_errors();
  midas::test_status_mapping();
  if (argc > 1) {
    midas::test_loaded_artifact(argv[1]);
  } else {
    midas::selftest::fail("artifact path argument missing");
  }
  return midas::selftest::finish("capi_selftest");
}
