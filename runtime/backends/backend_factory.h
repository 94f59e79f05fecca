#pragma once

#include "runtime/backends/llama/llama_backend_config.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace threadrunner {

class BackendHandle;

enum class BackendKind {
  kDummy,
  kNative,
};

std::string BackendKindName(BackendKind kind);

class BackendFactory {
public:
  // Case-insensitive; "llama" is accepted as an alias for native. Returns
  // nullopt for names that are not compiled in.
  static std::optional<BackendKind> Parse(const std::string &name);

  // Like Parse, but an empty name selects DefaultKind() and an unknown name
  // throws ModelLoad listing the available backends.
  static BackendKind Resolve(const std::string &name);

  static std::vector<BackendKind> Compiled();
  static std::string CompiledNames(); // "dummy, native"

  // The richest compiled-in kind.
  static BackendKind DefaultKind();

  // Model file for `kind`: /dev/null for dummy; `override_path` or the
  // default bundled model under the threadrunner home for native.
  static std::filesystem::path
  ModelPathFor(BackendKind kind, const std::string &override_path);

  // Constructs and loads a backend. Throws ModelLoad on any failure.
  static std::unique_ptr<BackendHandle>
  Load(BackendKind kind, const std::filesystem::path &path,
       const LlamaBackendConfig &config = {});
};

} // namespace threadrunner
