#include <catch2/catch_test_macros.hpp>

#include "common/error.h"
#include "runtime/backends/backend_factory.h"
#include "runtime/backends/backend_handle.h"

using namespace threadrunner;

TEST_CASE("Backend names parse case-insensitively", "[backend_factory]") {
  REQUIRE(BackendFactory::Parse("dummy") == BackendKind::kDummy);
  REQUIRE(BackendFactory::Parse("DUMMY") == BackendKind::kDummy);
  REQUIRE_FALSE(BackendFactory::Parse("cuda").has_value());
  REQUIRE_FALSE(BackendFactory::Parse("").has_value());
#ifdef THREADRUNNER_HAS_LLAMA
  REQUIRE(BackendFactory::Parse("Native") == BackendKind::kNative);
  REQUIRE(BackendFactory::Parse("llama") == BackendKind::kNative);
#else
  REQUIRE_FALSE(BackendFactory::Parse("native").has_value());
#endif
}

TEST_CASE("Default kind is the richest compiled backend", "[backend_factory]") {
#ifdef THREADRUNNER_HAS_LLAMA
  REQUIRE(BackendFactory::DefaultKind() == BackendKind::kNative);
  REQUIRE(BackendFactory::CompiledNames() == "dummy, native");
#else
  REQUIRE(BackendFactory::DefaultKind() == BackendKind::kDummy);
  REQUIRE(BackendFactory::CompiledNames() == "dummy");
#endif
  REQUIRE(BackendFactory::Resolve("") == BackendFactory::DefaultKind());
}

TEST_CASE("Unknown backend names are ModelLoad errors", "[backend_factory]") {
  try {
    BackendFactory::Resolve("tpu");
    FAIL("expected ModelLoad");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::kModelLoad);
    std::string what = e.what();
    REQUIRE(what.find("Unknown backend 'tpu'") != std::string::npos);
    REQUIRE(what.find("dummy") != std::string::npos);
  }
}

TEST_CASE("Model path selection per backend", "[backend_factory]") {
  REQUIRE(BackendFactory::ModelPathFor(BackendKind::kDummy, "/x.gguf") ==
          std::filesystem::path("/dev/null"));
  REQUIRE(BackendFactory::ModelPathFor(BackendKind::kNative, "/x.gguf") ==
          std::filesystem::path("/x.gguf"));
  REQUIRE(BackendFactory::ModelPathFor(BackendKind::kNative, "")
              .filename()
              .string() == "tinyllama-1.1b-chat-v1.0.Q4_K_M.gguf");
}

TEST_CASE("Factory loads a working dummy backend", "[backend_factory]") {
  auto handle = BackendFactory::Load(BackendKind::kDummy, "/dev/null");
  REQUIRE(handle);
  REQUIRE(handle->kind() == BackendKind::kDummy);
  REQUIRE(handle->Loaded());
  handle->Prompt("hi");
  REQUIRE(handle->NextToken() == std::optional<std::string>("lorem"));
}

TEST_CASE("Native load failures are ModelLoad errors", "[backend_factory]") {
  try {
    BackendFactory::Load(BackendKind::kNative, "/nonexistent/model.gguf");
    FAIL("expected ModelLoad");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::kModelLoad);
  }
}
