#pragma once
/*
================================================================================
IO: Score CSV Writer
FILE: cpp/midas/io/score_csv.hpp

Output format (default):
  one score per line, fixed notation, 6 decimals, '\n' line endings.

Options:
  - header:      "score" (or "source,dest,time,score" when echoing input)
  - echo_input:  prefix each score with the edge it belongs to

Hardening:
  - NaN/Inf export as empty string (not "nan"), matching the rest of the CSV
    exporters; detectors never produce them for valid streams.
  - Output is byte-stable for identical inputs (locale-independent formatting),
    so two runs can be compared with a plain byte diff.
  - File output goes through AtomicFileWriter: nothing is left at the target
    path when writing fails.
================================================================================
*/

#include "midas/core/settings.hpp"
#include "midas/detect/edge.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace midas::io {

// Fixed-notation score, or "" for non-finite values.
std::string format_score(Float x, int precision = 6);

std::string score_csv_header(const ScoreOutputSettings& opt);

std::string score_csv_row(const Edge& e, Float score, const ScoreOutputSettings& opt);

// edges may be empty when echo_input is false; otherwise sizes must match.
void write_scores(std::ostream& os,
                  const std::vector<Edge>& edges,
                  const std::vector<Float>& scores,
                  const ScoreOutputSettings& opt);

// "-" writes stdout. Throws kIoError on failure (target left absent).
void write_scores_file(const std::string& path,
                       const std::vector<Edge>& edges,
                       const std::vector<Float>& scores,
                       const ScoreOutputSettings& opt);

}  // namespace midas::io
