#include <catch2/catch_test_macros.hpp>

#ifdef THREADRUNNER_HAS_LLAMA

#include "common/error.h"
#include "runtime/backends/llama/llama_backend.h"

#include <cstdlib>

using namespace threadrunner;

TEST_CASE("Zephyr layout wraps system and user turns", "[llama]") {
  REQUIRE(LlamaBackend::ZephyrPrompt("You are a helpful assistant.", "hi") ==
          "<|system|>\nYou are a helpful assistant.</s>\n<|user|>\nhi</s>\n"
          "<|assistant|>\n");
}

TEST_CASE("Without a model the chat prompt falls back to Zephyr", "[llama]") {
  LlamaBackend backend;
  REQUIRE_FALSE(backend.IsLoaded());
  REQUIRE(backend.FormatChatPrompt("hello") ==
          LlamaBackend::ZephyrPrompt("You are a helpful assistant.", "hello"));

  bool templated = true;
  REQUIRE(backend.FormatChatPrompt("hello", &templated) ==
          LlamaBackend::ZephyrPrompt("You are a helpful assistant.", "hello"));
  REQUIRE_FALSE(templated);
}

TEST_CASE("UTF-8 holdback keeps incomplete sequences", "[llama]") {
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("") == 0);
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("abc") == 3);
  // "é" is C3 A9.
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("ab\xC3") == 2);
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("ab\xC3\xA9") == 4);
  // U+1F600 is F0 9F 98 80.
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("x\xF0\x9F\x98") == 1);
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("x\xF0\x9F\x98\x80") == 5);
  // Stray continuation bytes cannot be completed; pass them through.
  REQUIRE(LlamaBackend::CompleteUtf8Prefix("\x80\x80") == 2);
}

TEST_CASE("Loading a missing model is a ModelLoad error", "[llama]") {
  LlamaBackend backend;
  try {
    backend.Load("/nonexistent/threadrunner/model.gguf");
    FAIL("expected ModelLoad");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::kModelLoad);
  }
  REQUIRE_FALSE(backend.IsLoaded());
}

TEST_CASE("Prompting without a model is a ModelLoad error", "[llama]") {
  LlamaBackend backend;
  REQUIRE_THROWS_AS(backend.Prompt("hi"), Error);
  REQUIRE_FALSE(backend.NextToken().has_value());
  REQUIRE_NOTHROW(backend.Unload());
}

// Runs only when a real model is available.
TEST_CASE("Native backend streams a bounded completion", "[llama][model]") {
  const char *path = std::getenv("THREADRUNNER_TEST_MODEL");
  if (path == nullptr) {
    SKIP("THREADRUNNER_TEST_MODEL not set");
  }
  LlamaBackendConfig config;
  config.max_tokens = 8;
  config.ctx_size = 512;
  LlamaBackend backend(config);
  backend.Load(path);
  backend.Prompt("Say hello.");
  int count = 0;
  while (backend.NextToken()) {
    ++count;
  }
  REQUIRE(count <= 8);
  REQUIRE_FALSE(backend.NextToken().has_value());

  // A new prompt preempts an unfinished one.
  backend.Prompt("Count to one hundred.");
  REQUIRE(backend.NextToken().has_value());
  backend.Prompt("Stop.");
  while (backend.NextToken()) {
  }
  backend.Unload();
  REQUIRE_FALSE(backend.IsLoaded());
}

#endif // THREADRUNNER_HAS_LLAMA
