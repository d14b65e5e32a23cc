/*
  Detector selftest (MIDAS + MIDAS-R)

  Single-edge streams keep every sketch collision-free, so the expected
  scores below are computed by hand from the chi-squared statistic.
*/

#include "midas/core/selftest.hpp"
#include "midas/detect/anomaly.hpp"
#include "midas/detect/midas.hpp"
#include "midas/detect/midas_r.hpp"
#include "midas/detect/scorer.hpp"

#include <cmath>
#include <vector>

namespace midas {
namespace {

using namespace midas::selftest;

void test_counts_to_anom() {
  expect_near(counts_to_anom(1.0, 1.0, 1), 0.0, "anom: first tick is 0");
  // mean 1, diff 0.6 -> 0.36 + 0.36
  expect_near(counts_to_anom(2.0, 1.6, 2), 0.72, "anom: hand-computed t=2");
  expect_near(counts_to_anom(10.0, 0.5, 5), 0.0, "anom: below-mean counts score 0");
  expect_near(counts_to_anom(0.0, 0.0, 3), 0.0, "anom: unseen key scores 0");
}

void test_midas_hand_computed() {
  Midas m;
  expect_near(m.insert(1, 2, 1), 0.0, "midas: t=1 score is 0");
  expect_near(m.insert(1, 2, 1), 0.0, "midas: t=1 repeat score is 0");
  expect_true(m.current_time() == 1, "midas: current_time tracks input");

  // total 3, current 1 at t=2: mean 1.5, diff -0.5
  expect_near(m.insert(1, 2, 2), 0.25 / 1.5 + 0.25 / 1.5, "midas: t=2 first");
  // total 4, current 2: mean 2, diff 0
  expect_near(m.insert(1, 2, 2), 0.0, "midas: t=2 second");
  // total 5, current 3: mean 2.5, diff 0.5
  expect_near(m.insert(1, 2, 2), 0.25 / 2.5 + 0.25 / 2.5, "midas: t=2 third");
}

void test_midas_r_hand_computed() {
  MidasR m;
  expect_near(m.alpha(), 0.6, "midas-r: default alpha");
  expect_near(m.insert(1, 2, 1), 0.0, "midas-r: t=1 score is 0");

  // current 0.6 + 1 = 1.6, total 2, mean 1 -> 0.36 + 0.36 for edge and both nodes
  expect_near(m.insert(1, 2, 2), std::log1p(0.72), "midas-r: decay then score at t=2");
  expect_near(m.query(1, 2), std::log1p(0.72), "midas-r: insert == query afterwards");

  // Skip two ticks: decay by 0.6^2 applied once.
  // current 1.6*0.36 + 1 = 1.576, total 3, mean 0.75, diff 0.826
  const double diff = 1.6 * 0.36 + 1.0 - 0.75;
  const double sq = diff * diff;
  expect_near(m.insert(1, 2, 4), std::log1p(sq / 0.75 + sq / (0.75 * 3.0)), "midas-r: multi-tick decay");
}

void test_time_order() {
  MidasR r;
  r.insert(1, 2, 5);
  expect_error([&] { r.insert(1, 2, 4); }, ErrorCode::kOutOfRange, "midas-r: decreasing time rejected");
  expect_true(r.current_time() == 5, "midas-r: rejected insert keeps current_time");
  const double again = r.insert(1, 2, 5);
  expect_near(again, r.query(1, 2), "midas-r: usable after rejection");

  Midas m;
  expect_error([&] { m.insert(1, 2, 0); }, ErrorCode::kInvalidArgument, "midas: time 0 rejected");
  m.insert(3, 4, 2);
  expect_error([&] { m.insert(3, 4, 1); }, ErrorCode::kOutOfRange, "midas: decreasing time rejected");
}

void test_params_validation() {
  MidasRParams p;
  p.alpha = 0.0;
  expect_error([&] { MidasR r(p); }, ErrorCode::kInvalidArgument, "alpha 0 rejected");
  p.alpha = 1.5;
  expect_error([&] { MidasR r(p); }, ErrorCode::kInvalidArgument, "alpha > 1 rejected");

  MidasParams mp;
  mp.sketch.buckets = 1;
  expect_error([&] { Midas m(mp); }, ErrorCode::kInvalidArgument, "midas: buckets 1 rejected");
}

std::vector<Edge> steady_then_burst() {
  std::vector<Edge> edges;
  for (Int t = 1; t <= 20; ++t) edges.push_back(Edge{1, 2, t});
  for (int i = 0; i < 30; ++i) edges.push_back(Edge{1, 2, 21});
  return edges;
}

void test_burst_detection() {
  const auto edges = steady_then_burst();

  const auto r = MidasR::iterate(edges);
  double steady_max = 0.0;
  for (std::size_t i = 0; i < 20; ++i) steady_max = std::max(steady_max, r[i]);
  expect_true(r.back() > steady_max + 3.0, "midas-r: burst scores well above steady state");

  const auto m = Midas::iterate(edges);
  double m_steady_max = 0.0;
  for (std::size_t i = 0; i < 20; ++i) m_steady_max = std::max(m_steady_max, m[i]);
  expect_true(m.back() > m_steady_max, "midas: burst scores above steady state");
}

void test_determinism_and_scorer() {
  std::vector<Edge> edges;
  for (Int t = 1; t <= 50; ++t) {
    for (Int k = 0; k < 5; ++k) edges.push_back(Edge{(t * 31 + k) % 17, (t * 7 + k * 3) % 13, t});
  }

  const auto a = MidasR::iterate(edges);
  const auto b = MidasR::iterate(edges);
  expect_true(a == b, "midas-r: identical streams give identical scores");

  RunSettings s = RunSettings::defaults();
  auto scorer = make_scorer(s);
  expect_true(scorer->algorithm() == Algorithm::kMidasR, "factory: default is midas-r");
  std::vector<Float> via;
  for (const auto& e : edges) via.push_back(scorer->insert(e));
  expect_true(via == a, "factory: midas-r scorer matches detector");

  s.algorithm = Algorithm::kMidas;
  auto plain = make_scorer(s);
  expect_true(plain->algorithm() == Algorithm::kMidas, "factory: midas selectable");
  std::vector<Float> via_plain;
  for (const auto& e : edges) via_plain.push_back(plain->insert(e));
  expect_true(via_plain == Midas::iterate(edges), "factory: midas scorer matches detector");

  bool finite = true;
  for (double x : a) finite = finite && std::isfinite(x) && x >= 0.0;
  expect_true(finite, "midas-r: scores finite and non-negative");
}

}  // namespace
}  // namespace midas

int main() {
  midas::test_counts_to_anom();
  midas::test_midas_hand_computed();
  midas::test_midas_r_hand_computed();
  midas::test_time_order();
  midas::test_params_validation();
  midas::test_burst_detection();
  midas::test_determinism_and_scorer();
  return midas::selftest::finish("detector_selftest");
}
