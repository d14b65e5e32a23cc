#pragma once
/*
===============================================================================
Detect: Scorer interface + factory
File: cpp/midas/detect/scorer.hpp
===============================================================================
Lets the pipeline, CLI and C ABI pick MIDAS or MIDAS-R at runtime.
===============================================================================
*/

#include "midas/core/settings.hpp"
#include "midas/detect/edge.hpp"
#include "midas/detect/midas.hpp"
#include "midas/detect/midas_r.hpp"

#include <memory>
#include <utility>

namespace midas {

// Abstract streaming edge scorer.
class IEdgeScorer {
 public:
  virtual ~IEdgeScorer() = default;
  virtual Float insert(const Edge& e) = 0;
  virtual Float query(Int source, Int dest) const = 0;
  virtual Int current_time() const = 0;
  virtual Algorithm algorithm() const = 0;
};

template <typename Detector, Algorithm A>
class DetectorScorer final : public IEdgeScorer {
 public:
  template <typename Params>
  explicit DetectorScorer(const Params& p) : d_(p) {}

  Float insert(const Edge& e) override { return d_.insert(e); }
  Float query(Int source, Int dest) const override { return d_.query(source, dest); }
  Int current_time() const override { return d_.current_time(); }
  Algorithm algorithm() const override { return A; }

 private:
  Detector d_;
};

using MidasScorer = DetectorScorer<Midas, Algorithm::kMidas>;
using MidasRScorer = DetectorScorer<MidasR, Algorithm::kMidasR>;

inline std::unique_ptr<IEdgeScorer> make_scorer(const RunSettings& s) {
  s.validate_or_throw();
  if (s.algorithm == Algorithm::kMidas) return std::make_unique<MidasScorer>(s.midas_params());
  return std::make_unique<MidasRScorer>(s.params);
}

}  // namespace midas
