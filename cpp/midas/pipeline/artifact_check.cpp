#include "midas/pipeline/artifact_check.hpp"

#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"
#include "midas/io/edge_csv.hpp"
#include "midas/io/score_csv.hpp"
#include "midas/pipeline/artifact.hpp"

namespace midas::pipeline {

ArtifactCheckResult run_artifact_check(const ArtifactCheckPaths& paths, const RunSettings& settings) {
  settings.validate_or_throw();
  MIDAS_ENSURE(!paths.artifact.empty() && !paths.input.empty() && !paths.expected.empty() &&
                   !paths.test_out.empty(),
               ErrorCode::kInvalidArgument, "artifact check: all four paths are required");
  MIDAS_ENSURE(paths.test_out != paths.expected, ErrorCode::kInvalidArgument,
               "artifact check: test output must not overwrite the expected file");

  ArtifactCheckResult r;

  const ArtifactScorer scorer(paths.artifact);
  r.artifact_version = scorer.version();

  const auto edges = io::read_edges_file(paths.input);
  r.edges = edges.size();

  const auto scores = scorer.score(edges, settings);
  io::write_scores_file(paths.test_out, edges, scores, settings.output);
  log(LogLevel::INFO, "artifact " + paths.artifact + " (" + r.artifact_version + ") scored " +
                          std::to_string(r.edges) + " edges -> " + paths.test_out);

  r.compare = io::compare_files(paths.expected, paths.test_out);
  r.passed = r.compare.identical;
  if (!r.passed) {
    log(LogLevel::ERROR, r.compare.message + " (first difference at byte " +
                             std::to_string(r.compare.first_diff_offset.value_or(0)) + ")");
  }
  return r;
}

}  // namespace midas::pipeline
