#pragma once
/*
================================================================================
Pipeline: Artifact check (load artifact -> score -> write -> diff)
FILE: cpp/midas/pipeline/artifact_check.hpp

Steps (fail-fast):
  1) load the packaged artifact (kIoError if missing / unloadable)
  2) read the reference input edges
  3) score through the artifact ABI, write test_out via AtomicFileWriter
  4) byte-compare expected vs test_out

Outcome:
  - passed == true iff the two files are byte-identical.
  - Any failure before step 4 throws; test_out is not left behind.
================================================================================
*/

#include "midas/core/settings.hpp"
#include "midas/io/file_compare.hpp"

#include <string>

namespace midas::pipeline {

struct ArtifactCheckPaths {
  std::string artifact;   // e.g. midas.so
  std::string input;      // in.csv
  std::string expected;   // out.csv
  std::string test_out;   // test.out.csv
};

struct ArtifactCheckResult {
  bool passed = false;
  std::size_t edges = 0;
  std::string artifact_version;
  io::FileCompareResult compare;
};

ArtifactCheckResult run_artifact_check(const ArtifactCheckPaths& paths, const RunSettings& settings);

}  // namespace midas::pipeline
