#include "runtime/backends/backend_factory.h"

#include "common/error.h"
#include "common/paths.h"
#include "runtime/backends/backend_handle.h"
#include "runtime/backends/dummy/dummy_backend.h"
#include "server/logging/logger.h"

#ifdef THREADRUNNER_HAS_LLAMA
#include "runtime/backends/llama/llama_backend.h"
#endif

#include <algorithm>
#include <cctype>

namespace threadrunner {

namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsCompiled(BackendKind kind) {
  auto kinds = BackendFactory::Compiled();
  return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

} // namespace

std::string BackendKindName(BackendKind kind) {
  switch (kind) {
  case BackendKind::kDummy:
    return "dummy";
  case BackendKind::kNative:
    return "native";
  }
  return "unknown";
}

std::optional<BackendKind> BackendFactory::Parse(const std::string &name) {
  auto lowered = ToLower(name);
  std::optional<BackendKind> kind;
  if (lowered == "dummy") {
    kind = BackendKind::kDummy;
  } else if (lowered == "native" || lowered == "llama") {
    kind = BackendKind::kNative;
  }
  if (kind && !IsCompiled(*kind)) {
    return std::nullopt;
  }
  return kind;
}

BackendKind BackendFactory::Resolve(const std::string &name) {
  if (name.empty()) {
    return DefaultKind();
  }
  auto kind = Parse(name);
  if (!kind) {
    throw Error(ErrorKind::kModelLoad,
                "Unknown backend '" + name +
                    "'. Available backends: " + CompiledNames());
  }
  return *kind;
}

std::vector<BackendKind> BackendFactory::Compiled() {
#ifdef THREADRUNNER_HAS_LLAMA
  return {BackendKind::kDummy, BackendKind::kNative};
#else
  return {BackendKind::kDummy};
#endif
}

std::string BackendFactory::CompiledNames() {
  std::string out;
  for (auto kind : Compiled()) {
    if (!out.empty()) {
      out += ", ";
    }
    out += BackendKindName(kind);
  }
  return out;
}

BackendKind BackendFactory::DefaultKind() {
#ifdef THREADRUNNER_HAS_LLAMA
  return BackendKind::kNative;
#else
  return BackendKind::kDummy;
#endif
}

std::filesystem::path
BackendFactory::ModelPathFor(BackendKind kind,
                             const std::string &override_path) {
  if (kind == BackendKind::kDummy) {
    return "/dev/null";
  }
  if (!override_path.empty()) {
    return override_path;
  }
  return DefaultModelPath();
}

std::unique_ptr<BackendHandle>
BackendFactory::Load(BackendKind kind, const std::filesystem::path &path,
                     const LlamaBackendConfig &config) {
  log::Info("backend_factory",
            "Loading " + BackendKindName(kind) + " backend",
            "model=" + path.string());
  switch (kind) {
  case BackendKind::kDummy: {
    auto backend = std::make_unique<DummyBackend>();
    backend->Load(path);
    return std::make_unique<BackendHandle>(kind, std::move(backend));
  }
  case BackendKind::kNative: {
#ifdef THREADRUNNER_HAS_LLAMA
    auto backend = std::make_unique<LlamaBackend>(config);
    backend->Load(path);
    return std::make_unique<BackendHandle>(kind, std::move(backend));
#else
    (void)config;
    throw Error(ErrorKind::kModelLoad,
                "native backend not available: binary was built without "
                "llama.cpp (THREADRUNNER_ENABLE_LLAMA=OFF)");
#endif
  }
  }
  throw Error(ErrorKind::kModelLoad, "unsupported backend kind");
}

} // namespace threadrunner
