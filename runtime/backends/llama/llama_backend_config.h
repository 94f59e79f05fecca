#pragma once

#include <cstdint>

namespace threadrunner {

struct LlamaBackendConfig {
  int32_t ctx_size = 2048;
  int32_t batch_size = 512;
  int gpu_layers = 0;
  // Upper bound on generated tokens per prompt.
  int max_tokens = 1024;
  float temperature = 0.8f;
  int32_t top_k = 40;
  float top_p = 0.95f;
  uint32_t seed = 0xFFFFFFFFu; // LLAMA_DEFAULT_SEED: random per session
  // Bounded token channel between the worker and the reader.
  int channel_capacity = 16;
};

} // namespace threadrunner
