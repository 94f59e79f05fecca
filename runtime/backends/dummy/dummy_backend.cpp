#include "runtime/backends/dummy/dummy_backend.h"

#include <sstream>

namespace threadrunner {

const std::vector<std::string> &DummyBackend::SeedTokens() {
  static const std::vector<std::string> kSeed = {
      "lorem",   "ipsum",  "dolor",      "sit",    "amet",
      "consectetur", "adipiscing", "elit", "sed",  "do",
      "eiusmod", "tempor", "incididunt", "ut",     "labore",
      "et",      "dolore", "magna",      "aliqua", "enim",
      "ad",      "minim",  "veniam",     "quis",   "nostrud"};
  return kSeed;
}

void DummyBackend::Load(const std::filesystem::path &) {
  const auto &seed = SeedTokens();
  tokens_.assign(seed.begin(), seed.end());
}

void DummyBackend::Prompt(const std::string &text) {
  std::istringstream words(text);
  std::string word;
  while (words >> word) {
    tokens_.push_back(word + ".");
  }
}

std::optional<std::string> DummyBackend::NextToken() {
  if (tokens_.empty()) {
    return std::nullopt;
  }
  std::string token = std::move(tokens_.front());
  tokens_.pop_front();
  return token;
}

void DummyBackend::Unload() { tokens_.clear(); }

} // namespace threadrunner
