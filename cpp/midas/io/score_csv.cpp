/*
================================================================================
IO: Score CSV Writer (Implementation)
FILE: cpp/midas/io/score_csv.cpp
================================================================================
*/

#include "midas/io/score_csv.hpp"

#include "midas/core/error.hpp"
#include "midas/io/atomic_file.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>

namespace midas::io {

std::string format_score(Float x, int precision) {
  if (std::isnan(x) || !std::isfinite(x)) return "";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string score_csv_header(const ScoreOutputSettings& opt) {
  return opt.echo_input ? "source,dest,time,score" : "score";
}

std::string score_csv_row(const Edge& e, Float score, const ScoreOutputSettings& opt) {
  if (!opt.echo_input) return format_score(score, opt.precision);

  std::ostringstream row;
  row.imbue(std::locale::classic());
  row << e.source << ',' << e.dest << ',' << e.time << ',' << format_score(score, opt.precision);
  return row.str();
}

void write_scores(std::ostream& os,
                  const std::vector<Edge>& edges,
                  const std::vector<Float>& scores,
                  const ScoreOutputSettings& opt) {
  opt.validate_or_throw();
  MIDAS_ENSURE(!opt.echo_input || edges.size() == scores.size(), ErrorCode::kInvariant,
               "write_scores: edges/scores size mismatch");

  if (opt.header) os << score_csv_header(opt) << '\n';

  const Edge none{};
  for (std::size_t i = 0; i < scores.size(); ++i) {
    const Edge& e = opt.echo_input ? edges[i] : none;
    os << score_csv_row(e, scores[i], opt) << '\n';
  }
}

void write_scores_file(const std::string& path,
                       const std::vector<Edge>& edges,
                       const std::vector<Float>& scores,
                       const ScoreOutputSettings& opt) {
  if (path == "-") {
    write_scores(std::cout, edges, scores, opt);
    std::cout.flush();
    MIDAS_ENSURE(std::cout.good(), ErrorCode::kIoError, "write to stdout failed");
    return;
  }

  AtomicFileWriter w(path);
  write_scores(w.stream(), edges, scores, opt);
  w.commit();
}

}  // namespace midas::io
