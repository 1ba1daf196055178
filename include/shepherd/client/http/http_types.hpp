#pragma once

#include "shepherd/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shepherd::http {

// Verbs spoken to the sandbox API and to runners.
enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  DELETE,
};

// Codes the controller branches on. Others arrive as their raw value.
enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,
  NotFound = 404,
  Conflict = 409,
  InternalServerError = 500,
  ServiceUnavailable = 503,
};

using HttpHeaders =
    std::unordered_map<std::string, std::string, StringHash, StringEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  HttpHeaders headers;
  std::vector<uint8_t> body;

  // POST with a JSON body and its Content-Type set.
  [[nodiscard]] static auto json(std::string path, std::string_view body)
      -> HttpRequest;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;

  // Request line, headers and body as sent on the wire. Host defaults to
  // localhost and Content-Length is added when missing.
  [[nodiscard]] auto serialize() const -> std::vector<uint8_t>;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<uint8_t> body;

  [[nodiscard]] auto code() const noexcept -> int {
    return static_cast<int>(status);
  }
  [[nodiscard]] auto is_success() const noexcept -> bool {
    return code() >= 200 && code() < 300;
  }
  [[nodiscard]] auto body_as_string() const -> std::string_view;
};

}  // namespace shepherd::http

template <>
struct std::formatter<shepherd::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(shepherd::http::HttpMethod method, auto& ctx) const {
    using enum shepherd::http::HttpMethod;
    std::string_view name = "UNKNOWN";
    switch (method) {
      case GET: name = "GET"; break;
      case POST: name = "POST"; break;
      case DELETE: name = "DELETE"; break;
    }
    return std::formatter<std::string_view>::format(name, ctx);
  }
};

template <>
struct std::formatter<shepherd::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(shepherd::http::HttpStatus status, auto& ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
