#include "midas/detect/midas.hpp"

#include "midas/detect/time_guard.hpp"

#include <string>

namespace midas {

namespace {

const MidasParams& validated(const MidasParams& p) {
  p.validate_or_throw();
  return p;
}

}  // namespace

Midas::Midas(const MidasParams& params)
    : current_count_(validated(params).sketch, kSeedBase + 1),
      total_count_(params.sketch, kSeedBase + 2) {}

Float Midas::insert(const Edge& e) {
  require_next_time(current_time_, e.time);

  if (e.time > current_time_) {
    current_count_.clear();
    current_time_ = e.time;
  }

  current_count_.insert(e.source, e.dest, 1.0);
  total_count_.insert(e.source, e.dest, 1.0);

  return query(e.source, e.dest);
}

Float Midas::query(Int source, Int dest) const noexcept {
  if (current_time_ <= 1) return 0.0;

  const Float total = total_count_.count(source, dest);
  if (!(total > 0.0)) return 0.0;

  const Float current_mean = total / static_cast<Float>(current_time_);
  const Float diff = current_count_.count(source, dest) - current_mean;
  const Float sqerr = diff * diff;

  return (sqerr / current_mean) +
         (sqerr / (current_mean * static_cast<Float>(current_time_ - 1)));
}

std::vector<Float> Midas::iterate(const std::vector<Edge>& edges, const MidasParams& params) {
  Midas m(params);
  std::vector<Float> out;
  out.reserve(edges.size());
  for (const auto& e : edges) out.push_back(m.insert(e));
  return out;
}

}  // namespace midas
