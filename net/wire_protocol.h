#pragma once

#include "common/error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace threadrunner {

inline constexpr std::uint8_t kProtocolVersion = 1;

struct PromptRequest {
  std::uint8_t v{kProtocolVersion};
  std::string prompt;
  // Always true today; the daemon streams regardless.
  bool stream{true};
};

struct TokenResponse {
  std::optional<std::string> token; // nullopt encodes as JSON null
  bool eos{false};
};

struct ErrorResponse {
  std::string error;
  ErrorKind error_type{ErrorKind::kUnknown};
};

using Response = std::variant<TokenResponse, ErrorResponse>;

// Serialize to a compact JSON object. Invalid UTF-8 in strings is replaced
// with U+FFFD rather than failing.
std::string EncodeRequest(const PromptRequest &request);
std::string EncodeResponse(const TokenResponse &response);
std::string EncodeResponse(const ErrorResponse &response);

// Parse a request frame. Throws Protocol on malformed JSON, missing or
// mistyped fields, or a version outside 0..255. The version is not checked
// against kProtocolVersion here; see CheckProtocolVersion.
PromptRequest DecodeRequest(const std::string &payload);

// Throws Protocol when `request.v` is not a supported version.
void CheckProtocolVersion(const PromptRequest &request);

// Parse a response frame. A frame carrying "error_type" is an ErrorResponse;
// anything else must be a TokenResponse. Throws Protocol otherwise.
Response DecodeResponse(const std::string &payload);

bool operator==(const PromptRequest &a, const PromptRequest &b);
bool operator==(const TokenResponse &a, const TokenResponse &b);
bool operator==(const ErrorResponse &a, const ErrorResponse &b);

} // namespace threadrunner
