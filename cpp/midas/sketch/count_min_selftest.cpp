/*
  Count-Min sketch selftest

  Validates:
    1) RNG streams are seed-deterministic (SplitMix64 reference value).
    2) Row coefficients stay inside [1, n) / [0, n).
    3) Edge/node counts are exact for a lone key, never underestimate with
       several keys, and follow clear()/lower().
    4) Invalid sketch shapes are rejected.
*/

#include "midas/core/rng.hpp"
#include "midas/core/selftest.hpp"
#include "midas/core/settings.hpp"
#include "midas/sketch/count_min.hpp"

#include <cstdint>
#include <vector>

namespace midas {
namespace {

using namespace midas::selftest;

void test_rng() {
  SplitMix64 sm(0);
  expect_true(sm.next_u64() == 0xE220A8397B1DCDAFull, "splitmix64(0) first output matches reference");

  Xoshiro256pp a(538);
  Xoshiro256pp b(538);
  Xoshiro256pp c(539);
  bool same = true;
  bool differs = false;
  for (int i = 0; i < 64; ++i) {
    const auto va = a.next_u64();
    same = same && (va == b.next_u64());
    differs = differs || (va != c.next_u64());
  }
  expect_true(same, "xoshiro256++ is deterministic per seed");
  expect_true(differs, "xoshiro256++ differs across seeds");
}

void test_row_coefficients() {
  Xoshiro256pp rng(40);
  for (Int n : {Int{2}, Int{3}, Int{769}, Int{4096}}) {
    for (int i = 0; i < 32; ++i) {
      sketch::Row r(n, rng);
      if (!(r.a() >= 1 && r.a() < n && r.b() < n && r.num_buckets() == n)) {
        fail("row coefficients out of range");
        return;
      }
      if (r.hash(773, 123456789, 987654321) >= n) {
        fail("row hash out of range");
        return;
      }
    }
  }
  pass("row coefficients and hashes within bucket range");
}

void test_edge_hash() {
  SketchSettings s;
  sketch::EdgeHash h(s, 40);
  expect_true(h.num_rows() == 2, "edge hash uses configured rows");

  for (int i = 0; i < 3; ++i) h.insert(1, 2, 1.0);
  expect_near(h.count(1, 2), 3.0, "lone edge counted exactly");

  const double other = h.count(5, 6);
  expect_true(other == 0.0 || other == 3.0, "unseen edge is 0 or a full collision");

  h.lower(0.5);
  expect_near(h.count(1, 2), 1.5, "lower() scales counts");

  h.clear();
  expect_near(h.count(1, 2), 0.0, "clear() zeroes counts");

  std::vector<std::pair<Int, Int>> keys;
  for (Int i = 0; i < 200; ++i) keys.emplace_back(i, i * 7 + 1);
  for (const auto& k : keys) h.insert(k.first, k.second, 1.0);
  bool never_under = true;
  for (const auto& k : keys) never_under = never_under && (h.count(k.first, k.second) >= 1.0);
  expect_true(never_under, "count never underestimates");
}

void test_node_hash() {
  SketchSettings s;
  sketch::NodeHash h(s, 43);
  h.insert(7, 1.0);
  h.insert(7, 2.5);
  expect_near(h.count(7), 3.5, "node weights accumulate");
  h.lower(0.6);
  expect_near(h.count(7), 2.1, "node lower() scales");
  h.clear();
  expect_near(h.count(7), 0.0, "node clear() zeroes");
}

void test_same_seed_same_layout() {
  SketchSettings s;
  sketch::EdgeHash a(s, 539);
  sketch::EdgeHash b(s, 539);
  bool same = true;
  for (std::size_t i = 0; i < a.num_rows(); ++i) {
    same = same && a.row(i).a() == b.row(i).a() && a.row(i).b() == b.row(i).b();
  }
  expect_true(same, "same seed gives identical row coefficients");
}

void test_invalid_shapes() {
  SketchSettings s;
  s.buckets = 1;
  expect_error([&] { sketch::EdgeHash h(s, 1); }, ErrorCode::kInvalidArgument, "buckets < 2 rejected");

  s = SketchSettings{};
  s.rows = 0;
  expect_error([&] { sketch::NodeHash h(s, 1); }, ErrorCode::kInvalidArgument, "rows == 0 rejected");
}

}  // namespace
}  // namespace midas

int main() {
  midas::test_rng();
  midas::test_row_coefficients();
  midas::test_edge_hash();
  midas::test_node_hash();
  midas::test_same_seed_same_layout();
  midas::test_invalid_shapes();
  return midas::selftest::finish("count_min_selftest");
}
