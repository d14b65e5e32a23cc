#include "midas/pipeline/artifact.hpp"

#include "midas/core/error.hpp"
#include "midas/core/logging.hpp"

#include <dlfcn.h>

#include <memory>

namespace midas::pipeline {

// ----------------------------- DynamicLibrary --------------------------------

DynamicLibrary::~DynamicLibrary() { unload(); }

bool DynamicLibrary::load(const std::string& path) {
  unload();
  error_.clear();

  handle_ = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle_) {
    const char* err = dlerror();
    error_ = err ? err : "Unknown dlopen error";
    return false;
  }
  return true;
}

void DynamicLibrary::unload() noexcept {
  if (handle_) {
    dlclose(handle_);
    handle_ = nullptr;
  }
}

void* DynamicLibrary::get_symbol(const std::string& name) const {
  if (!handle_) return nullptr;
  return dlsym(handle_, name.c_str());
}

// ----------------------------- ArtifactScorer --------------------------------

namespace {

template <typename Fn>
void resolve(const DynamicLibrary& lib, const char* name, Fn*& out) {
  void* sym = lib.get_symbol(name);
  MIDAS_ENSURE(sym != nullptr, ErrorCode::kIoError, std::string("artifact is missing symbol ") + name);
  out = reinterpret_cast<Fn*>(sym);
}

void check(int rc, const MidasAbi& abi, const char* what) {
  if (rc == MIDAS_OK) return;
  const char* detail = abi.last_error ? abi.last_error() : "";
  MIDAS_THROW(from_status(rc), std::string(what) + " failed: " + (detail ? detail : ""));
}

}  // namespace

ArtifactScorer::ArtifactScorer(const std::string& lib_path) {
  if (!lib_.load(lib_path)) {
    MIDAS_THROW(ErrorCode::kIoError, "cannot load artifact " + lib_path + ": " + lib_.error());
  }

  resolve(lib_, "midas_version", abi_.version);
  resolve(lib_, "midas_last_error", abi_.last_error);
  resolve(lib_, "midas_r_new", abi_.r_new);
  resolve(lib_, "midas_r_free", abi_.r_free);
  resolve(lib_, "midas_r_insert", abi_.r_insert);
  resolve(lib_, "midas_new", abi_.m_new);
  resolve(lib_, "midas_free", abi_.m_free);
  resolve(lib_, "midas_insert", abi_.m_insert);

  log(LogLevel::DEBUG, "loaded artifact " + lib_path + " (version " + version() + ")");
}

std::string ArtifactScorer::version() const {
  const char* v = abi_.version();
  return v ? v : "";
}

std::vector<Float> ArtifactScorer::score(const std::vector<Edge>& edges,
                                         const RunSettings& settings) const {
  settings.validate_or_throw();
  const SketchSettings& sk = settings.params.sketch;

  std::vector<Float> out;
  out.reserve(edges.size());

  if (settings.algorithm == Algorithm::kMidasR) {
    midas_r_handle* raw = nullptr;
    check(abi_.r_new(sk.rows, sk.buckets, sk.m_value, settings.params.alpha, &raw), abi_, "midas_r_new");
    std::unique_ptr<midas_r_handle, void (*)(midas_r_handle*)> h(raw, abi_.r_free);

    for (const auto& e : edges) {
      double s = 0.0;
      check(abi_.r_insert(h.get(), e.source, e.dest, e.time, &s), abi_, "midas_r_insert");
      out.push_back(s);
    }
  } else {
    midas_handle* raw = nullptr;
    check(abi_.m_new(sk.rows, sk.buckets, sk.m_value, &raw), abi_, "midas_new");
    std::unique_ptr<midas_handle, void (*)(midas_handle*)> h(raw, abi_.m_free);

    for (const auto& e : edges) {
      double s = 0.0;
      check(abi_.m_insert(h.get(), e.source, e.dest, e.time, &s), abi_, "midas_insert");
      out.push_back(s);
    }
  }
  return out;
}

}  // namespace midas::pipeline
