#pragma once

#include "runtime/backends/backend_factory.h"
#include "runtime/backends/model_backend.h"

#include <memory>
#include <optional>
#include <string>

namespace threadrunner {

// Owner of a loaded backend. Unload() releases the backend and empties the
// handle; the destructor does the same if the handle is still full, logging
// (not propagating) any failure. Movable across threads.
class BackendHandle {
public:
  BackendHandle(BackendKind kind, std::unique_ptr<ModelBackend> backend);
  ~BackendHandle();
  BackendHandle(const BackendHandle &) = delete;
  BackendHandle &operator=(const BackendHandle &) = delete;
  BackendHandle(BackendHandle &&) noexcept = default;
  BackendHandle &operator=(BackendHandle &&) noexcept = default;

  BackendKind kind() const { return kind_; }
  bool Loaded() const { return backend_ != nullptr; }

  // Throw Unknown when the handle was already unloaded.
  void Prompt(const std::string &text);
  std::optional<std::string> NextToken();
  void Cancel();

  void Unload();

private:
  ModelBackend &Require();

  BackendKind kind_;
  std::unique_ptr<ModelBackend> backend_;
};

} // namespace threadrunner
