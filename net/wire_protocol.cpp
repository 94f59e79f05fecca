#include "net/wire_protocol.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace threadrunner {

namespace {

std::string Dump(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json Parse(const std::string &payload) {
  try {
    auto j = json::parse(payload);
    if (!j.is_object()) {
      throw Error(ErrorKind::kProtocol, "expected a JSON object");
    }
    return j;
  } catch (const json::parse_error &e) {
    throw Error(ErrorKind::kProtocol,
                std::string("malformed JSON: ") + e.what());
  }
}

const json &Field(const json &j, const char *name) {
  auto it = j.find(name);
  if (it == j.end()) {
    throw Error(ErrorKind::kProtocol,
                std::string("missing field '") + name + "'");
  }
  return *it;
}

[[noreturn]] void WrongType(const char *name, const char *expected) {
  throw Error(ErrorKind::kProtocol,
              std::string("field '") + name + "' must be " + expected);
}

} // namespace

std::string EncodeRequest(const PromptRequest &request) {
  json j;
  j["v"] = request.v;
  j["prompt"] = request.prompt;
  j["stream"] = request.stream;
  return Dump(j);
}

std::string EncodeResponse(const TokenResponse &response) {
  json j;
  if (response.token) {
    j["token"] = *response.token;
  } else {
    j["token"] = nullptr;
  }
  j["eos"] = response.eos;
  return Dump(j);
}

std::string EncodeResponse(const ErrorResponse &response) {
  json j;
  j["error"] = response.error;
  j["error_type"] = ErrorKindName(response.error_type);
  return Dump(j);
}

PromptRequest DecodeRequest(const std::string &payload) {
  auto j = Parse(payload);
  PromptRequest request;

  const auto &v = Field(j, "v");
  if (!v.is_number_unsigned() || v.get<std::uint64_t>() > 255) {
    WrongType("v", "an unsigned byte");
  }
  request.v = static_cast<std::uint8_t>(v.get<std::uint64_t>());

  const auto &prompt = Field(j, "prompt");
  if (!prompt.is_string()) {
    WrongType("prompt", "a string");
  }
  request.prompt = prompt.get<std::string>();

  const auto &stream = Field(j, "stream");
  if (!stream.is_boolean()) {
    WrongType("stream", "a boolean");
  }
  request.stream = stream.get<bool>();
  return request;
}

void CheckProtocolVersion(const PromptRequest &request) {
  if (request.v != kProtocolVersion) {
    throw Error(ErrorKind::kProtocol,
                "unsupported protocol version " +
                    std::to_string(static_cast<int>(request.v)) +
                    " (daemon speaks " +
                    std::to_string(static_cast<int>(kProtocolVersion)) + ")");
  }
}

Response DecodeResponse(const std::string &payload) {
  auto j = Parse(payload);

  if (j.contains("error_type")) {
    const auto &type = j["error_type"];
    if (!type.is_string()) {
      WrongType("error_type", "a string");
    }
    ErrorResponse err;
    err.error_type =
        ParseErrorKind(type.get<std::string>()).value_or(ErrorKind::kUnknown);
    auto message = j.find("error");
    if (message != j.end() && message->is_string()) {
      err.error = message->get<std::string>();
    }
    return err;
  }

  TokenResponse response;
  const auto &eos = Field(j, "eos");
  if (!eos.is_boolean()) {
    WrongType("eos", "a boolean");
  }
  response.eos = eos.get<bool>();
  auto token = j.find("token");
  if (token != j.end() && !token->is_null()) {
    if (!token->is_string()) {
      WrongType("token", "a string or null");
    }
    response.token = token->get<std::string>();
  }
  return response;
}

bool operator==(const PromptRequest &a, const PromptRequest &b) {
  return a.v == b.v && a.prompt == b.prompt && a.stream == b.stream;
}

bool operator==(const TokenResponse &a, const TokenResponse &b) {
  return a.token == b.token && a.eos == b.eos;
}

bool operator==(const ErrorResponse &a, const ErrorResponse &b) {
  return a.error == b.error && a.error_type == b.error_type;
}

} // namespace threadrunner
