#pragma once
/*
================================================================================
Pipeline: Score run (edge CSV -> detector -> score CSV)
FILE: cpp/midas/pipeline/score_pipeline.hpp

Purpose:
  - The single code path that turns an edge stream into a score file. Both the
    CLI ("score") and the artifact runner produce out.csv / test.out.csv through
    the same writer, so byte equality of the two means the loaded artifact
    computes what the library computes.

Steps (fail-fast, nothing written on failure):
  1) settings.validate_or_throw()
  2) read + parse input (kParseError names the bad line)
  3) score every edge in order (kOutOfRange on decreasing time)
  4) write via AtomicFileWriter
Any existing output file is removed before step 2.
================================================================================
*/

#include "midas/core/settings.hpp"
#include "midas/detect/edge.hpp"
#include "midas/stats/online_stats.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace midas::pipeline {

struct ScoreRunReport {
  Algorithm algorithm = Algorithm::kMidasR;
  std::size_t edges = 0;
  Int first_time = 0;
  Int last_time = 0;
  stats::OnlineStats score_stats{};
  std::vector<stats::ScoredIndex> top;
};

// Score an in-memory stream. Throws midas::Error on invalid settings or time order.
std::vector<Float> score_edges(const std::vector<Edge>& edges,
                               const RunSettings& settings,
                               ScoreRunReport* report = nullptr,
                               std::size_t top_k = 0);

// Read in_path, score, write out_path ("-" = stdin/stdout).
ScoreRunReport run_score_file(const std::string& in_path,
                              const std::string& out_path,
                              const RunSettings& settings,
                              std::size_t top_k = 0);

}  // namespace midas::pipeline
