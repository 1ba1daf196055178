#pragma once

#include "shepherd/client/http/http_client.hpp"
#include "shepherd/client/http/http_types.hpp"
#include "shepherd/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace shepherd::http {

struct Endpoint {
  std::string host;
  uint16_t port{0};

  auto operator==(const Endpoint&) const -> bool = default;
};

// Splits "host", "host:port" or "http://host:port/..." into an endpoint.
// IPv6 literals are accepted bare ("fd00::1") or bracketed ("[fd00::1]:80").
// A missing port falls back to `default_port`.
[[nodiscard]] auto parse_endpoint(std::string_view address,
                                  uint16_t default_port) -> Result<Endpoint>;

// "host:port", with IPv6 hosts bracketed.
[[nodiscard]] auto host_header(const Endpoint& endpoint) -> std::string;

// One request/response exchange with a remote endpoint.
class Transport {
public:
  virtual ~Transport() = default;

  [[nodiscard]] virtual auto send(const Endpoint& endpoint, HttpRequest req)
      -> Result<HttpResponse> = 0;
};

// Opens a fresh connection per request.
class TcpTransport final : public Transport {
public:
  explicit TcpTransport(HttpClientConfig config = {}) : config_(config) {}

  [[nodiscard]] auto send(const Endpoint& endpoint, HttpRequest req)
      -> Result<HttpResponse> override;

private:
  HttpClientConfig config_;
};

}  // namespace shepherd::http
