#pragma once

#include "runtime/backends/model_backend.h"

#include <deque>
#include <filesystem>
#include <string>
#include <vector>

namespace threadrunner {

// Deterministic backend for tests and bring-up: streams a fixed lorem seed
// followed by each prompt word with a trailing period.
class DummyBackend final : public ModelBackend {
public:
  static const std::vector<std::string> &SeedTokens();

  // The path is ignored; any value (conventionally /dev/null) loads.
  void Load(const std::filesystem::path &path);

  void Prompt(const std::string &text) override;
  std::optional<std::string> NextToken() override;
  void Unload() override;

private:
  std::deque<std::string> tokens_;
};

} // namespace threadrunner
