#pragma once

#include "runtime/backends/llama/llama_backend_config.h"
#include "runtime/backends/model_backend.h"
#include "runtime/token_channel.h"

#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <llama.h>

namespace threadrunner {

// Native backend over llama.cpp. Generation runs on a dedicated worker thread
// per prompt; tokens reach NextToken() through a bounded TokenChannel, so a
// slow reader applies backpressure to the worker instead of buffering the
// whole completion.
class LlamaBackend final : public ModelBackend {
public:
  explicit LlamaBackend(LlamaBackendConfig config = {});
  ~LlamaBackend() override;
  LlamaBackend(const LlamaBackend &) = delete;
  LlamaBackend &operator=(const LlamaBackend &) = delete;

  // Throws ModelLoad when the file is missing or llama.cpp rejects it.
  void Load(const std::filesystem::path &model_path);

  void Prompt(const std::string &text) override;
  std::optional<std::string> NextToken() override;
  void Cancel() override { StopGeneration(); }
  void Unload() override;

  bool IsLoaded() const { return model_ != nullptr; }
  const LlamaBackendConfig &config() const { return config_; }

  // Wraps `user` in the model's built-in chat template, or the Zephyr layout
  // when the model carries none (or llama.cpp does not support it).
  // `used_model_template` reports which layout was produced; the built-in
  // template already emits BOS, so the tokenizer must not add another.
  std::string FormatChatPrompt(const std::string &user,
                               bool *used_model_template = nullptr) const;

  static std::string ZephyrPrompt(const std::string &system,
                                  const std::string &user);

  // Length of the longest prefix of `text` that does not end inside a
  // multi-byte UTF-8 sequence.
  static std::size_t CompleteUtf8Prefix(const std::string &text);

private:
  // Signals the worker, closes its channel, joins it and frees the session.
  // Join failures are logged; an already finished generation is a success.
  void StopGeneration();

  llama_model *model_{nullptr};
  const llama_vocab *vocab_{nullptr};
  LlamaBackendConfig config_;

  // Active generation.
  llama_context *session_{nullptr};
  std::shared_ptr<TokenChannel> channel_;
  std::thread worker_;
  std::promise<void> stop_;
  bool stop_sent_{true};
  bool finished_{true};
};

} // namespace threadrunner
