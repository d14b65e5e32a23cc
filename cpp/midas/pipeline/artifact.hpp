#pragma once
/*
================================================================================
Pipeline: Loaded-artifact scorer
FILE: cpp/midas/pipeline/artifact.hpp

Purpose:
  - Load the packaged (copied + stripped) shared library at run time and score
    through its exported C ABI only. This is the check that the artifact a
    consumer would ship still computes the same scores as the library built
    into the CLI.

Notes:
  - Stripping removes the static symbol table, not the dynamic one, so the
    midas_* exports must still resolve; a missing symbol is a kIoError naming it.
================================================================================
*/

#include "midas/capi/midas_c.h"
#include "midas/core/settings.hpp"
#include "midas/detect/edge.hpp"

#include <string>
#include <vector>

namespace midas::pipeline {

// RAII dlopen handle.
class DynamicLibrary final {
 public:
  DynamicLibrary() = default;
  ~DynamicLibrary();

  DynamicLibrary(const DynamicLibrary&) = delete;
  DynamicLibrary& operator=(const DynamicLibrary&) = delete;

  // Returns false and fills error() on failure.
  bool load(const std::string& path);
  void unload() noexcept;
  bool is_loaded() const noexcept { return handle_ != nullptr; }

  void* get_symbol(const std::string& name) const;
  const std::string& error() const noexcept { return error_; }

 private:
  void* handle_ = nullptr;
  std::string error_;
};

// Function table resolved from a loaded artifact.
struct MidasAbi {
  const char* (*version)(void) = nullptr;
  const char* (*last_error)(void) = nullptr;

  int (*r_new)(uint64_t, uint64_t, uint64_t, double, midas_r_handle**) = nullptr;
  void (*r_free)(midas_r_handle*) = nullptr;
  int (*r_insert)(midas_r_handle*, uint64_t, uint64_t, uint64_t, double*) = nullptr;

  int (*m_new)(uint64_t, uint64_t, uint64_t, midas_handle**) = nullptr;
  void (*m_free)(midas_handle*) = nullptr;
  int (*m_insert)(midas_handle*, uint64_t, uint64_t, uint64_t, double*) = nullptr;
};

// Throws kIoError if the library cannot be loaded or a symbol is missing.
class ArtifactScorer final {
 public:
  explicit ArtifactScorer(const std::string& lib_path);

  std::string version() const;

  // Score a stream through the artifact with a fresh handle.
  std::vector<Float> score(const std::vector<Edge>& edges, const RunSettings& settings) const;

 private:
  DynamicLibrary lib_;
  MidasAbi abi_;
};

}  // namespace midas::pipeline
