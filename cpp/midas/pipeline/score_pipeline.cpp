#include "midas/pipeline/score_pipeline.hpp"

#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"
#include "midas/detect/scorer.hpp"
#include "midas/io/edge_csv.hpp"
#include "midas/io/score_csv.hpp"

#include <cstdio>
#include <filesystem>
#include <sstream>

namespace midas::pipeline {

namespace {

// False when either side is a stream or does not exist yet.
bool same_file(const std::string& a, const std::string& b) {
  if (a == "-" || b == "-") return false;
  std::error_code ec;
  const bool eq = std::filesystem::equivalent(a, b, ec);
  return !ec && eq;
}

}  // namespace

std::vector<Float> score_edges(const std::vector<Edge>& edges,
                               const RunSettings& settings,
                               ScoreRunReport* report,
                               std::size_t top_k) {
  auto scorer = make_scorer(settings);

  std::vector<Float> scores;
  scores.reserve(edges.size());

  stats::OnlineStats st;
  stats::TopK top(top_k);
  for (std::size_t i = 0; i < edges.size(); ++i) {
    const Float s = scorer->insert(edges[i]);
    scores.push_back(s);
    st.push(s);
    top.push(i, s);
  }

  if (report) {
    report->algorithm = settings.algorithm;
    report->edges = edges.size();
    report->first_time = edges.empty() ? 0 : edges.front().time;
    report->last_time = scorer->current_time();
    report->score_stats = st;
    report->top = top.items();
  }
  return scores;
}

ScoreRunReport run_score_file(const std::string& in_path,
                              const std::string& out_path,
                              const RunSettings& settings,
                              std::size_t top_k) {
  settings.validate_or_throw();

  MIDAS_ENSURE(!same_file(in_path, out_path), ErrorCode::kInvalidArgument,
               "score output would overwrite its input: " + out_path);

  // A failed run must not leave an older output that looks current.
  if (out_path != "-") std::remove(out_path.c_str());

  const auto edges = io::read_edges_file(in_path);

  ScoreRunReport rep;
  const auto scores = score_edges(edges, settings, &rep, top_k);
  io::write_scores_file(out_path, edges, scores, settings.output);

  std::ostringstream msg;
  msg << "scored " << rep.edges << " edges with " << to_string(rep.algorithm)
      << " (t=" << rep.first_time << ".." << rep.last_time << ")"
      << " mean=" << rep.score_stats.mean << " max=" << rep.score_stats.max()
      << " -> " << out_path;
  log(LogLevel::INFO, msg.str());

  for (std::size_t i = 0; i < rep.top.size(); ++i) {
    const auto& t = rep.top[i];
    const Edge& e = edges[t.index];
    std::ostringstream line;
    line << "top " << (i + 1) << ": edge #" << (t.index + 1) << " " << e.source << "->" << e.dest
         << " t=" << e.time << " score=" << io::format_score(t.score, settings.output.precision);
    log(LogLevel::INFO, line.str());
  }
  return rep;
}

}  // namespace midas::pipeline
