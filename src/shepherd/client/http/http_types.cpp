#include "shepherd/client/http/http_types.hpp"

#include <format>
#include <iterator>
#include <utility>

namespace shepherd::http {

auto HttpRequest::json(std::string path, std::string_view body)
    -> HttpRequest {
  return HttpRequest{
      .method = HttpMethod::POST,
      .path = std::move(path),
      .headers = {{"Content-Type", "application/json"}},
      .body = std::vector<uint8_t>(body.begin(), body.end()),
  };
}

auto HttpRequest::header(std::string_view key) const
    -> std::optional<std::string> {
  if (auto it = headers.find(key); it != headers.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto HttpRequest::serialize() const -> std::vector<uint8_t> {
  std::vector<uint8_t> out;
  out.reserve(256 + body.size());
  auto sink = std::back_inserter(out);

  std::format_to(sink, "{} {} HTTP/1.1\r\n", method, path);
  for (const auto& [key, value] : headers) {
    std::format_to(sink, "{}: {}\r\n", key, value);
  }
  if (!headers.contains("Host")) {
    std::format_to(sink, "Host: localhost\r\n");
  }
  // A bodiless POST still carries an explicit zero length.
  if (!headers.contains("Content-Length") &&
      (!body.empty() || method == HttpMethod::POST)) {
    std::format_to(sink, "Content-Length: {}\r\n", body.size());
  }
  std::format_to(sink, "\r\n");

  out.insert(out.end(), body.begin(), body.end());
  return out;
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char*>(body.data()), body.size()};
}

}  // namespace shepherd::http
