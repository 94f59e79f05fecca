#include "runtime/backends/llama/llama_backend.h"

#include "common/error.h"
#include "server/logging/logger.h"

#include <llama.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace threadrunner {

namespace {

constexpr const char *kSystemPrompt = "You are a helpful assistant.";

std::mutex g_llama_init_mutex;
int g_llama_init_refcount = 0;

void LlamaBackendAcquire() {
  std::lock_guard<std::mutex> lock(g_llama_init_mutex);
  if (g_llama_init_refcount++ == 0) {
    llama_backend_init();
  }
}

void LlamaBackendRelease() {
  std::lock_guard<std::mutex> lock(g_llama_init_mutex);
  if (--g_llama_init_refcount == 0) {
    llama_backend_free();
  }
}

struct SamplerDeleter {
  void operator()(llama_sampler *sampler) const { llama_sampler_free(sampler); }
};
using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

SamplerPtr MakeSampler(const LlamaBackendConfig &config) {
  auto params = llama_sampler_chain_default_params();
  SamplerPtr chain(llama_sampler_chain_init(params));
  if (config.temperature <= 0.0f) {
    llama_sampler_chain_add(chain.get(), llama_sampler_init_greedy());
    return chain;
  }
  if (config.top_k > 0) {
    llama_sampler_chain_add(chain.get(), llama_sampler_init_top_k(config.top_k));
  }
  if (config.top_p < 1.0f) {
    llama_sampler_chain_add(chain.get(),
                            llama_sampler_init_top_p(config.top_p, 1));
  }
  llama_sampler_chain_add(chain.get(),
                          llama_sampler_init_temp(config.temperature));
  llama_sampler_chain_add(chain.get(), llama_sampler_init_dist(config.seed));
  return chain;
}

// `add_special` is false when the text already carries the model's own BOS
// from its chat template.
std::vector<llama_token> Tokenize(const llama_vocab *vocab,
                                  const std::string &text, bool add_special) {
  std::vector<llama_token> tokens(text.size() + 8);
  int n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                         tokens.data(), static_cast<int32_t>(tokens.size()),
                         add_special, /*parse_special=*/true);
  if (n < 0) {
    tokens.resize(static_cast<std::size_t>(-n));
    n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                       tokens.data(), static_cast<int32_t>(tokens.size()),
                       add_special, true);
  }
  tokens.resize(static_cast<std::size_t>(std::max(n, 0)));
  return tokens;
}

std::string TokenToPiece(const llama_vocab *vocab, llama_token token) {
  std::string buf;
  buf.resize(16);
  int written = llama_token_to_piece(vocab, token, buf.data(),
                                     static_cast<int32_t>(buf.size()), 0,
                                     false);
  if (written < 0) {
    buf.resize(static_cast<std::size_t>(-written));
    if (llama_token_to_piece(vocab, token, buf.data(),
                             static_cast<int32_t>(buf.size()), 0, false) < 0) {
      return {};
    }
  } else {
    buf.resize(static_cast<std::size_t>(written));
  }
  return buf;
}

// Body of the per-prompt worker thread. Never throws; always leaves the
// terminal marker (unless the reader is gone) and closes the channel.
void RunGeneration(llama_context *ctx, const llama_vocab *vocab,
                   std::string formatted, bool add_special,
                   LlamaBackendConfig config,
                   std::shared_ptr<TokenChannel> channel,
                   std::shared_future<void> stop) {
  auto stop_requested = [&stop] {
    return stop.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  };
  int produced = 0;
  try {
    auto tokens = Tokenize(vocab, formatted, add_special);
    const int n_ctx = static_cast<int>(llama_n_ctx(ctx));
    const int n_prompt = static_cast<int>(tokens.size());
    if (tokens.empty()) {
      log::Error("llama_worker", "prompt tokenized to nothing");
    } else if (n_prompt >= n_ctx) {
      log::Error("llama_worker", "prompt does not fit the context window",
                 "prompt_tokens=" + std::to_string(n_prompt) +
                     " n_ctx=" + std::to_string(n_ctx));
    } else {
      auto sampler = MakeSampler(config);
      const int chunk = std::max<int>(1, config.batch_size);
      bool ok = true;
      for (int i = 0; i < n_prompt && ok; i += chunk) {
        int n = std::min(chunk, n_prompt - i);
        if (llama_decode(ctx, llama_batch_get_one(tokens.data() + i, n)) != 0) {
          log::Error("llama_worker", "llama_decode failed for prompt");
          ok = false;
        }
      }
      int n_past = n_prompt;
      std::string pending;
      while (ok && produced < config.max_tokens && !stop_requested()) {
        llama_token token = llama_sampler_sample(sampler.get(), ctx, -1);
        if (llama_vocab_is_eog(vocab, token)) {
          break;
        }
        ++produced;
        pending += TokenToPiece(vocab, token);
        std::size_t complete = LlamaBackend::CompleteUtf8Prefix(pending);
        if (complete > 0) {
          if (!channel->Send(pending.substr(0, complete))) {
            ok = false; // reader closed the channel
            break;
          }
          pending.erase(0, complete);
        }
        if (n_past + 1 >= n_ctx) {
          log::Warn("llama_worker", "context window exhausted");
          break;
        }
        if (llama_decode(ctx, llama_batch_get_one(&token, 1)) != 0) {
          log::Error("llama_worker", "llama_decode failed while generating");
          break;
        }
        ++n_past;
      }
      if (ok && !pending.empty()) {
        channel->Send(pending);
      }
    }
  } catch (const std::exception &e) {
    log::Error("llama_worker", std::string("generation failed: ") + e.what());
  }
  channel->Send(std::nullopt);
  channel->Close();
  log::Debug("llama_worker", "generation finished",
             "tokens=" + std::to_string(produced));
}

} // namespace

LlamaBackend::LlamaBackend(LlamaBackendConfig config)
    : config_(std::move(config)) {
  LlamaBackendAcquire();
}

LlamaBackend::~LlamaBackend() {
  Unload();
  LlamaBackendRelease();
}

void LlamaBackend::Load(const std::filesystem::path &model_path) {
  Unload();
  std::error_code ec;
  if (!std::filesystem::exists(model_path, ec)) {
    throw Error(ErrorKind::kModelLoad,
                "model path does not exist: " + model_path.string());
  }
  llama_model_params model_params = llama_model_default_params();
  model_params.n_gpu_layers = config_.gpu_layers;
  model_ =
      llama_model_load_from_file(model_path.string().c_str(), model_params);
  if (!model_) {
    throw Error(ErrorKind::kModelLoad,
                "failed to load model from " + model_path.string());
  }
  vocab_ = llama_model_get_vocab(model_);
  if (!vocab_) {
    llama_model_free(model_);
    model_ = nullptr;
    throw Error(ErrorKind::kModelLoad, "failed to obtain vocabulary");
  }
  log::Info("llama_backend", "model loaded", "path=" + model_path.string());
}

std::string LlamaBackend::ZephyrPrompt(const std::string &system,
                                       const std::string &user) {
  return "<|system|>\n" + system + "</s>\n<|user|>\n" + user +
         "</s>\n<|assistant|>\n";
}

std::string LlamaBackend::FormatChatPrompt(const std::string &user,
                                           bool *used_model_template) const {
  if (used_model_template != nullptr) {
    *used_model_template = false;
  }
  const char *tmpl = model_ ? llama_model_chat_template(model_, nullptr)
                            : nullptr;
  if (tmpl != nullptr) {
    std::vector<llama_chat_message> chat = {{"system", kSystemPrompt},
                                            {"user", user.c_str()}};
    std::vector<char> buf(user.size() * 2 + 512);
    int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(),
                                          /*add_ass=*/true, buf.data(),
                                          static_cast<int32_t>(buf.size()));
    if (n > static_cast<int32_t>(buf.size())) {
      buf.resize(static_cast<std::size_t>(n));
      n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true,
                                    buf.data(),
                                    static_cast<int32_t>(buf.size()));
    }
    if (n >= 0) {
      if (used_model_template != nullptr) {
        *used_model_template = true;
      }
      return std::string(buf.data(), static_cast<std::size_t>(n));
    }
    log::Warn("llama_backend",
              "unsupported chat template; using Zephyr layout");
  }
  return ZephyrPrompt(kSystemPrompt, user);
}

std::size_t LlamaBackend::CompleteUtf8Prefix(const std::string &text) {
  const std::size_t n = text.size();
  std::size_t i = n;
  for (int back = 0; i > 0 && back < 4; ++back) {
    --i;
    auto c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) == 0x80) {
      continue; // continuation byte
    }
    std::size_t need = 1;
    if ((c & 0xE0) == 0xC0) {
      need = 2;
    } else if ((c & 0xF0) == 0xE0) {
      need = 3;
    } else if ((c & 0xF8) == 0xF0) {
      need = 4;
    }
    return (n - i >= need) ? n : i;
  }
  return n;
}

void LlamaBackend::Prompt(const std::string &text) {
  StopGeneration();
  if (!model_) {
    throw Error(ErrorKind::kModelLoad, "no model loaded");
  }
  bool templated = false;
  auto formatted = FormatChatPrompt(text, &templated);

  llama_context_params ctx_params = llama_context_default_params();
  ctx_params.n_ctx = static_cast<uint32_t>(config_.ctx_size);
  ctx_params.n_batch = static_cast<uint32_t>(std::max(1, config_.batch_size));
  session_ = llama_init_from_model(model_, ctx_params);
  if (!session_) {
    throw Error(ErrorKind::kModelLoad, "failed to create generation session");
  }

  channel_ = std::make_shared<TokenChannel>(
      static_cast<std::size_t>(std::max(1, config_.channel_capacity)));
  stop_ = std::promise<void>();
  stop_sent_ = false;
  finished_ = false;
  try {
    worker_ = std::thread(RunGeneration, session_, vocab_, std::move(formatted),
                          !templated, config_, channel_,
                          stop_.get_future().share());
  } catch (const std::system_error &e) {
    StopGeneration();
    throw Error(ErrorKind::kModelLoad,
                std::string("failed to start generation worker: ") + e.what());
  }
}

std::optional<std::string> LlamaBackend::NextToken() {
  if (finished_ || !channel_) {
    return std::nullopt;
  }
  std::optional<std::string> message;
  if (!channel_->Receive(&message)) {
    log::Debug("llama_backend", "token channel closed without end marker");
    message.reset();
  }
  if (!message) {
    finished_ = true;
    StopGeneration();
  }
  return message;
}

void LlamaBackend::StopGeneration() {
  if (!stop_sent_) {
    stop_.set_value();
    stop_sent_ = true;
  }
  if (channel_) {
    channel_->Close();
  }
  if (worker_.joinable()) {
    try {
      worker_.join();
    } catch (const std::system_error &e) {
      log::Warn("llama_backend",
                std::string("failed to join generation worker: ") + e.what());
    }
  }
  channel_.reset();
  if (session_) {
    llama_free(session_);
    session_ = nullptr;
  }
  finished_ = true;
}

void LlamaBackend::Unload() {
  StopGeneration();
  if (model_) {
    llama_model_free(model_);
    model_ = nullptr;
    vocab_ = nullptr;
    log::Info("llama_backend", "model unloaded");
  }
}

} // namespace threadrunner
