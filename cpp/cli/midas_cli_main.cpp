/*
================================================================================
CLI: Main Entry Point (midas_cli)
FILE: cpp/cli/midas_cli_main.cpp

Purpose:
  - Command-line access to the midas scoring library:
    * score an edge stream into a score CSV (produces out.csv)
    * byte-compare two files (diff -q)
    * print summary statistics of a scored stream

Usage:
  midas_cli <command> [options]

Commands:
  score     --in <csv|-> --out <csv|-> [--top <k>] [settings]
  compare   <a> <b>
  summary   --in <csv|-> [--top <k>] [settings]
  version
  help

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures
  - Deterministic output format
================================================================================
*/

#include "cli/run_settings_args.hpp"
#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"
#include "midas/core/settings.hpp"
#include "midas/core/version.hpp"
#include "midas/io/edge_csv.hpp"
#include "midas/io/file_compare.hpp"
#include "midas/io/score_csv.hpp"
#include "midas/pipeline/score_pipeline.hpp"

#include <cstring>
#include <iostream>
#include <string>

using namespace midas;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  DIFFERENT = 1,      // compare: files differ
  INVALID_ARGS = 2,
  INPUT_ERROR = 3,    // parse error / bad time order
  IO_ERROR = 4,
  INTERNAL_ERROR = 5
};

void print_help() {
  std::cout << R"(
midas_cli - streaming edge anomaly scoring (MIDAS / MIDAS-R)

Usage:
  midas_cli <command> [options]

Commands:
  score     Score an edge CSV (source,dest,time) into a score CSV
  compare   Byte-compare two files; exit 0 if identical, 1 if they differ
  summary   Score a stream and print count/mean/stddev/min/max + top scores
  version   Print library version
  help      Show this help message

Examples:
  midas_cli score --in in.csv --out out.csv
  midas_cli score --in in.csv --out - --algo midas --echo-input 1
  midas_cli compare out.csv test.out.csv
  midas_cli summary --in in.csv --top 5

Score settings:
)" << cli::kRunSettingsUsage << R"(
Exit Codes:
  0 - Success
  1 - Files differ (compare)
  2 - Invalid arguments
  3 - Input error (parse error, time 0, timestamps out of order)
  4 - I/O error
  5 - Internal error
)";
}

// Map a library error onto the CLI contract.
int exit_code_for(const Error& e) {
  switch (e.code()) {
    case ErrorCode::kInvalidArgument: return INVALID_ARGS;
    case ErrorCode::kOutOfRange:
    case ErrorCode::kParseError:      return INPUT_ERROR;
    case ErrorCode::kIoError:         return IO_ERROR;
    default:                          return INTERNAL_ERROR;
  }
}

struct ScoreArgs {
  std::string in_path;
  std::string out_path;
  std::size_t top_k = 10;
  RunSettings settings = RunSettings::defaults();
};

bool parse_score_args(int argc, char** argv, int first, ScoreArgs* a, std::string* err) {
  for (int i = first; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    const auto r = cli::parse_run_settings_flag(i, argc, argv, &a->settings, err);
    if (r == cli::FlagResult::kError) return false;
    if (r == cli::FlagResult::kOk) continue;

    if (std::strcmp(k, "--in") == 0) {
      if (!cli::get_next(i, argc, argv, &v)) { *err = "--in requires a value"; return false; }
      a->in_path = v;
      continue;
    }
    if (std::strcmp(k, "--out") == 0) {
      if (!cli::get_next(i, argc, argv, &v)) { *err = "--out requires a value"; return false; }
      a->out_path = v;
      continue;
    }
    if (std::strcmp(k, "--top") == 0) {
      Int n = 0;
      if (!cli::get_next(i, argc, argv, &v) || !cli::parse_u64(v, &n) || n > 100000) {
        *err = "--top requires an integer in [0,100000]";
        return false;
      }
      a->top_k = static_cast<std::size_t>(n);
      continue;
    }

    *err = std::string("unknown option: ") + k;
    return false;
  }
  return true;
}

int cmd_score(int argc, char** argv) {
  ScoreArgs a;
  a.top_k = 0;  // score logs the top entries only when --top is given
  std::string err;
  if (!parse_score_args(argc, argv, 2, &a, &err)) {
    std::cerr << "Error: " << err << "\n";
    return INVALID_ARGS;
  }
  if (a.in_path.empty() || a.out_path.empty()) {
    std::cerr << "Error: score requires --in and --out\n";
    return INVALID_ARGS;
  }
  if (a.out_path == "-") set_log_to_stderr(true);

  try {
    pipeline::run_score_file(a.in_path, a.out_path, a.settings, a.top_k);
    return SUCCESS;
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return exit_code_for(e);
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, e.what());
    return INTERNAL_ERROR;
  }
}

int cmd_compare(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "Error: compare requires exactly two paths\n";
    return INVALID_ARGS;
  }

  try {
    const auto r = io::compare_files(argv[2], argv[3]);
    if (r.identical) return SUCCESS;
    std::cout << r.message << "\n";
    return DIFFERENT;
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return exit_code_for(e);
  }
}

int cmd_summary(int argc, char** argv) {
  ScoreArgs a;
  std::string err;
  if (!parse_score_args(argc, argv, 2, &a, &err)) {
    std::cerr << "Error: " << err << "\n";
    return INVALID_ARGS;
  }
  if (a.in_path.empty()) {
    std::cerr << "Error: summary requires --in\n";
    return INVALID_ARGS;
  }
  set_log_to_stderr(true);

  try {
    const auto edges = io::read_edges_file(a.in_path);
    pipeline::ScoreRunReport rep;
    const auto scores = pipeline::score_edges(edges, a.settings, &rep, a.top_k);
    const auto row = stats::summarize(rep.score_stats);
    const int prec = a.settings.output.precision;

    std::cout << "algorithm: " << to_string(rep.algorithm) << "\n"
              << "edges:     " << rep.edges << "\n"
              << "time:      " << rep.first_time << ".." << rep.last_time << "\n"
              << "mean:      " << io::format_score(row.mean, prec) << "\n"
              << "stddev:    " << io::format_score(row.std_sample, prec) << "\n"
              << "min:       " << io::format_score(row.min_v, prec) << "\n"
              << "max:       " << io::format_score(row.max_v, prec) << "\n";

    if (!rep.top.empty()) {
      std::cout << "top:\n";
      for (const auto& t : rep.top) {
        const Edge& e = edges[t.index];
        std::cout << "  #" << (t.index + 1) << " " << e.source << "->" << e.dest << " t=" << e.time
                  << " score=" << io::format_score(scores[t.index], prec) << "\n";
      }
    }
    return SUCCESS;
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return exit_code_for(e);
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, e.what());
    return INTERNAL_ERROR;
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_help();
    return INVALID_ARGS;
  }

  const std::string cmd = argv[1];

  if (cmd == "score")   return cmd_score(argc, argv);
  if (cmd == "compare") return cmd_compare(argc, argv);
  if (cmd == "summary") return cmd_summary(argc, argv);

  if (cmd == "version") {
    std::cout << kVersion << "\n";
    return SUCCESS;
  }
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    print_help();
    return SUCCESS;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'midas_cli help' for usage information.\n";
  return INVALID_ARGS;
}
