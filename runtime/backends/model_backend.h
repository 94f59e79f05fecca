#pragma once

#include <optional>
#include <string>

namespace threadrunner {

// Uniform generator interface. Loading is done by the concrete backend's
// Load() (see backend_factory.h); all failures are reported by throwing
// threadrunner::Error.
class ModelBackend {
public:
  virtual ~ModelBackend() = default;

  // Begin a new generation over `text`, cancelling any generation in
  // progress on this backend. Throws ModelLoad if no session can be created.
  virtual void Prompt(const std::string &text) = 0;

  // Next produced chunk, or nullopt at end of generation. Blocks until one
  // is available. Keeps returning nullopt until the next Prompt().
  virtual std::optional<std::string> NextToken() = 0;

  // Discard whatever is left of the current generation so the next Prompt()
  // starts clean. The default drains NextToken().
  virtual void Cancel() {
    while (NextToken()) {
    }
  }

  // Release generation and model resources. Safe to call more than once.
  virtual void Unload() = 0;
};

} // namespace threadrunner
