#pragma once

#include "shepherd/client/http/http_types.hpp"
#include "shepherd/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

namespace shepherd::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds read_timeout{30000};
  std::size_t max_response_size{10 * 1024 * 1024};  // 10MB
};

// Blocking HTTP/1.1 client over a single TCP connection. Every socket wait is
// bounded by the configured timeouts.
class HttpClient {
public:
  HttpClient(int fd, std::string host, HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;
  HttpClient(HttpClient&&) noexcept;
  auto operator=(HttpClient&&) noexcept -> HttpClient&;

  [[nodiscard]] static auto connect_tcp(std::string_view host, uint16_t port,
                                        HttpClientConfig config = {})
      -> Result<std::unique_ptr<HttpClient>>;

  [[nodiscard]] auto request(HttpRequest req) -> Result<HttpResponse>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace shepherd::http
