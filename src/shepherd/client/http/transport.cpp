#include "shepherd/client/http/transport.hpp"

#include "shepherd/util/log.hpp"

#include <charconv>
#include <format>

namespace shepherd::http {

auto parse_endpoint(std::string_view address, uint16_t default_port)
    -> Result<Endpoint> {
  if (auto pos = address.find("://"); pos != std::string_view::npos) {
    address.remove_prefix(pos + 3);
  }
  if (auto pos = address.find('/'); pos != std::string_view::npos) {
    address = address.substr(0, pos);
  }
  if (address.empty()) {
    return fail(Error::InvalidArgument);
  }

  Endpoint ep;
  std::string_view port_str;
  if (address.front() == '[') {
    // Bracketed IPv6 literal, optionally followed by ":port".
    auto close = address.find(']');
    if (close == std::string_view::npos || close == 1) {
      log::warn("Invalid IPv6 address: {}", address);
      return fail(Error::InvalidArgument);
    }
    ep.host = std::string(address.substr(1, close - 1));
    auto rest = address.substr(close + 1);
    if (rest.empty()) {
      ep.port = default_port;
      return ep;
    }
    if (rest.front() != ':') {
      log::warn("Invalid IPv6 address: {}", address);
      return fail(Error::InvalidArgument);
    }
    port_str = rest.substr(1);
  } else {
    auto colon = address.find(':');
    // No port, or a bare IPv6 literal that cannot carry one.
    if (colon == std::string_view::npos ||
        address.find(':', colon + 1) != std::string_view::npos) {
      ep.host = std::string(address);
      ep.port = default_port;
      return ep;
    }
    if (colon == 0) {
      log::warn("Missing host in address: {}", address);
      return fail(Error::InvalidArgument);
    }
    ep.host = std::string(address.substr(0, colon));
    port_str = address.substr(colon + 1);
  }

  uint16_t port = 0;
  auto [ptr, ec] =
      std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
  if (ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
      port == 0) {
    log::warn("Invalid port in address: {}", address);
    return fail(Error::InvalidArgument);
  }
  ep.port = port;
  return ep;
}

auto host_header(const Endpoint& endpoint) -> std::string {
  if (endpoint.host.find(':') != std::string::npos) {
    return std::format("[{}]:{}", endpoint.host, endpoint.port);
  }
  return std::format("{}:{}", endpoint.host, endpoint.port);
}

auto TcpTransport::send(const Endpoint& endpoint, HttpRequest req)
    -> Result<HttpResponse> {
  auto client = HttpClient::connect_tcp(endpoint.host, endpoint.port, config_);
  if (!client) {
    return fail(client.error());
  }
  if (!req.headers.contains("Host")) {
    req.headers["Host"] = host_header(endpoint);
  }
  return (*client)->request(std::move(req));
}

}  // namespace shepherd::http
