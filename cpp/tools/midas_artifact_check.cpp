/*
  Artifact Check Runner

  Objective
  ---------
  The "test program" of the build pipeline:
    1) Loads the packaged (copied + stripped) shared library, e.g. midas.so
    2) Scores the reference input through the library's C ABI only
    3) Writes test.out.csv (deleted again if anything fails on the way)
    4) Byte-compares out.csv and test.out.csv

  Exit codes (deterministic)
  --------------------------
    0  => outputs identical
    1  => outputs differ ("Files <a> and <b> differ" on stdout)
    2  => tool error (invalid args / missing artifact / parse error / io error)

  Usage
  -----
  midas_artifact_check --lib <path> --in <in.csv> --expected <out.csv> --out <test.out.csv> [settings]
*/

#include "cli/run_settings_args.hpp"
#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"
#include "midas/pipeline/artifact_check.hpp"

#include <cstring>
#include <iostream>
#include <string>

namespace midas {
namespace {

enum class ExitCode : int {
  kIdentical = 0,
  kDiffer = 1,
  kError = 2,
};

static constexpr int kExitErrorInt = static_cast<int>(ExitCode::kError);

struct Args {
  pipeline::ArtifactCheckPaths paths;
  RunSettings settings = RunSettings::defaults();
};

static void print_usage(std::ostream& os) {
  os <<
    "midas_artifact_check --lib <path> --in <in.csv> --expected <out.csv> --out <test.out.csv> [options]\n"
    "\n"
    "Options:\n" << cli::kRunSettingsUsage;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      *help_requested = true;
      return true;
    }

    const auto r = cli::parse_run_settings_flag(i, argc, argv, &a->settings, err);
    if (r == cli::FlagResult::kError) return false;
    if (r == cli::FlagResult::kOk) continue;

    std::string* target = nullptr;
    if (std::strcmp(k, "--lib") == 0) target = &a->paths.artifact;
    else if (std::strcmp(k, "--in") == 0) target = &a->paths.input;
    else if (std::strcmp(k, "--expected") == 0) target = &a->paths.expected;
    else if (std::strcmp(k, "--out") == 0) target = &a->paths.test_out;

    if (!target) {
      *err = std::string("unknown option: ") + k;
      return false;
    }
    if (!cli::get_next(i, argc, argv, &v)) {
      *err = std::string(k) + " requires a value";
      return false;
    }
    *target = v;
  }

  if (a->paths.artifact.empty() || a->paths.input.empty() ||
      a->paths.expected.empty() || a->paths.test_out.empty()) {
    *err = "--lib, --in, --expected and --out are required";
    return false;
  }
  return true;
}

int run(int argc, char** argv) {
  Args a;
  std::string err;
  bool help = false;

  if (!parse_args(argc, argv, &a, &err, &help)) {
    std::cerr << "Error: " << err << "\n";
    print_usage(std::cerr);
    return kExitErrorInt;
  }
  if (help) {
    print_usage(std::cout);
    return static_cast<int>(ExitCode::kIdentical);
  }

  try {
    const auto r = pipeline::run_artifact_check(a.paths, a.settings);
    if (r.passed) return static_cast<int>(ExitCode::kIdentical);
    std::cout << r.compare.message << "\n";
    return static_cast<int>(ExitCode::kDiffer);
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return kExitErrorInt;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, e.what());
    return kExitErrorInt;
  }
}

}  // namespace
}  // namespace midas

int main(int argc, char** argv) {
  return midas::run(argc, argv);
}
