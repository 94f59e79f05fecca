#include "runtime/backends/backend_handle.h"

#include "common/error.h"
#include "server/logging/logger.h"

namespace threadrunner {

BackendHandle::BackendHandle(BackendKind kind,
                             std::unique_ptr<ModelBackend> backend)
    : kind_(kind), backend_(std::move(backend)) {}

BackendHandle::~BackendHandle() {
  if (!backend_) {
    return;
  }
  try {
    Unload();
  } catch (const std::exception &e) {
    log::Error("backend", std::string("unload on drop failed: ") + e.what(),
               "backend=" + BackendKindName(kind_));
  }
}

ModelBackend &BackendHandle::Require() {
  if (!backend_) {
    throw Error(ErrorKind::kUnknown, "backend handle used after unload");
  }
  return *backend_;
}

void BackendHandle::Prompt(const std::string &text) { Require().Prompt(text); }

std::optional<std::string> BackendHandle::NextToken() {
  return Require().NextToken();
}

void BackendHandle::Cancel() { Require().Cancel(); }

void BackendHandle::Unload() {
  if (!backend_) {
    return;
  }
  auto backend = std::move(backend_);
  backend->Unload();
}

} // namespace threadrunner
