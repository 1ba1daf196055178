#pragma once

#include "shepherd/client/http/http_types.hpp"

#include <llhttp.h>

#include <memory>
#include <optional>
#include <span>

namespace shepherd::http {

// Incremental HTTP/1.1 response parser over llhttp. Feed bytes as they
// arrive; a complete response is returned once the message ends.
class HttpResponseParser {
public:
  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  [[nodiscard]] auto parse(std::span<const uint8_t> data)
      -> std::optional<HttpResponse>;

  // Signals end of stream. Completes responses whose body is delimited by
  // connection close.
  [[nodiscard]] auto finish() -> std::optional<HttpResponse>;

  [[nodiscard]] auto failed() const noexcept -> bool;

  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace shepherd::http
