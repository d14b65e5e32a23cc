#include "midas/detect/midas_r.hpp"

#include "midas/detect/anomaly.hpp"
#include "midas/detect/time_guard.hpp"

#include <algorithm>
#include <cmath>

namespace midas {

namespace {

const MidasRParams& validated(const MidasRParams& p) {
  p.validate_or_throw();
  return p;
}

}  // namespace

MidasR::MidasR(const MidasRParams& params)
    : alpha_(validated(params).alpha),
      current_count_(params.sketch, kSeedBase + 1),
      total_count_(params.sketch, kSeedBase + 2),
      source_score_(params.sketch, kSeedBase + 3),
      dest_score_(params.sketch, kSeedBase + 4),
      source_total_(params.sketch, kSeedBase + 5),
      dest_total_(params.sketch, kSeedBase + 6) {}

Float MidasR::insert(const Edge& e) {
  require_next_time(current_time_, e.time);

  if (e.time > current_time_) {
    const Int delta = e.time - current_time_;
    const Float total_decay = std::pow(alpha_, static_cast<Float>(delta));
    current_count_.lower(total_decay);
    source_score_.lower(total_decay);
    dest_score_.lower(total_decay);

    current_time_ = e.time;
  }

  current_count_.insert(e.source, e.dest, 1.0);
  total_count_.insert(e.source, e.dest, 1.0);

  source_score_.insert(e.source, 1.0);
  dest_score_.insert(e.dest, 1.0);
  source_total_.insert(e.source, 1.0);
  dest_total_.insert(e.dest, 1.0);

  return query(e.source, e.dest);
}

Float MidasR::query(Int source, Int dest) const noexcept {
  const Float edge_score = counts_to_anom(
      total_count_.count(source, dest), current_count_.count(source, dest), current_time_);
  const Float source_score = counts_to_anom(
      source_total_.count(source), source_score_.count(source), current_time_);
  const Float dest_score = counts_to_anom(
      dest_total_.count(dest), dest_score_.count(dest), current_time_);

  return std::log1p(std::max(std::max(source_score, dest_score), edge_score));
}

std::vector<Float> MidasR::iterate(const std::vector<Edge>& edges, const MidasRParams& params) {
  MidasR m(params);
  std::vector<Float> out;
  out.reserve(edges.size());
  for (const auto& e : edges) out.push_back(m.insert(e));
  return out;
}

}  // namespace midas
