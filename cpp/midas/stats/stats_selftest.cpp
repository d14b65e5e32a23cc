/*
  Online stats selftest

  Validates:
    1) Welford mean / variance / stddev against hand-computed values.
    2) Non-finite scores are ignored.
    3) TopK keeps the k highest scores, descending, earlier index first on ties.
    4) summarize() on empty, single and full streams.
*/

#include "midas/core/selftest.hpp"
#include "midas/stats/online_stats.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace midas {
namespace {

using namespace midas::selftest;

void test_welford() {
  // {2,4,4,4,5,5,7,9}: mean 5, sum of squared deviations 32.
  stats::OnlineStats st;
  for (double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) st.push(x);

  expect_true(st.count() == 8, "welford: count");
  expect_near(st.mean, 5.0, "welford: mean");
  expect_near(st.sum, 40.0, "welford: sum");
  expect_near(st.variance_population(), 4.0, "welford: population variance");
  expect_near(st.stddev_population(), 2.0, "welford: population stddev");
  expect_near(st.variance_sample(), 32.0 / 7.0, "welford: sample variance");
  expect_near(st.stddev_sample(), std::sqrt(32.0 / 7.0), "welford: sample stddev");
  expect_near(st.min(), 2.0, "welford: min");
  expect_near(st.max(), 9.0, "welford: max");
}

void test_non_finite_ignored() {
  stats::OnlineStats st;
  st.push(1.0);
  st.push(std::numeric_limits<double>::quiet_NaN());
  st.push(std::numeric_limits<double>::infinity());
  st.push(3.0);

  expect_true(st.count() == 2, "non-finite: NaN and inf skipped");
  expect_near(st.mean, 2.0, "non-finite: mean over finite values");
  expect_near(st.max(), 3.0, "non-finite: max ignores inf");
}

void test_top_k() {
  stats::TopK top(3);
  top.push(0, 1.0);
  top.push(1, 3.0);
  top.push(2, 3.0);
  top.push(3, 2.0);
  top.push(4, 3.0);
  top.push(5, 2.0);
  top.push(6, std::numeric_limits<double>::quiet_NaN());

  const auto& items = top.items();
  expect_true(items.size() == 3, "topk: bounded at k");
  if (items.size() == 3) {
    expect_true(items[0].index == 1 && items[1].index == 2 && items[2].index == 4,
                "topk: ties keep the earlier index first");
    expect_near(items[2].score, 3.0, "topk: lowest kept score");
  }

  stats::TopK none(0);
  none.push(0, 10.0);
  expect_true(none.items().empty(), "topk: k == 0 keeps nothing");

  stats::TopK ascending(2);
  for (std::size_t i = 0; i < 5; ++i) ascending.push(i, static_cast<double>(i));
  expect_true(ascending.items().size() == 2 && ascending.items()[0].index == 4 &&
                  ascending.items()[1].index == 3,
              "topk: descending by score");
}

void test_summarize() {
  const auto empty = stats::summarize(stats::OnlineStats{});
  expect_true(empty.n == 0 && empty.mean == 0.0 && empty.std_sample == 0.0 && empty.min_v == 0.0 &&
                  empty.max_v == 0.0,
              "summarize: empty stream is all zeros");

  stats::OnlineStats one;
  one.push(0.25);
  const auto single = stats::summarize(one);
  expect_true(single.n == 1, "summarize: single count");
  expect_near(single.mean, 0.25, "summarize: single mean");
  expect_near(single.std_sample, 0.0, "summarize: single sample stddev is 0");

  stats::OnlineStats st;
  for (double x : {1.0, 2.0, 3.0, 4.0}) st.push(x);
  const auto row = stats::summarize(st);
  expect_true(row.n == 4, "summarize: count");
  expect_near(row.mean, 2.5, "summarize: mean");
  expect_near(row.std_sample, std::sqrt(5.0 / 3.0), "summarize: sample stddev");
  expect_near(row.min_v, 1.0, "summarize: min");
  expect_near(row.max_v, 4.0, "summarize: max");
}

}  // namespace
}  // namespace midas

int main() {
  midas::test_welford();
  midas::test_non_finite_ignored();
  midas::test_top_k();
  midas::test_summarize();
  return midas::selftest::finish("stats_selftest");
}
