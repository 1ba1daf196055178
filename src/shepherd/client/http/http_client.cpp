#include "shepherd/client/http/http_client.hpp"
#include "shepherd/client/http/http_parser.hpp"

#include "shepherd/util/log.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace shepherd::http {

namespace {

// Waits for `events` on fd. Returns Timeout when the deadline passes first.
auto wait_for(int fd, short events, std::chrono::milliseconds timeout)
    -> Result<void> {
  pollfd pfd{.fd = fd, .events = events, .revents = 0};
  while (true) {
    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret > 0) {
      return ok();
    }
    if (ret == 0) {
      return fail(Error::Timeout);
    }
    if (errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      return fail(Error::ConnectionFailed);
    }
  }
}

}  // namespace

struct HttpClient::Impl {
  int fd{-1};
  std::string host;
  HttpClientConfig config;

  Impl(int socket_fd, std::string h, HttpClientConfig cfg)
      : fd(socket_fd), host(std::move(h)), config(cfg) {}

  ~Impl() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  auto write_all(std::span<const uint8_t> data) -> Result<void> {
    std::size_t written = 0;
    while (written < data.size()) {
      ssize_t n = ::send(fd, data.data() + written, data.size() - written,
                         MSG_NOSIGNAL);
      if (n > 0) {
        written += static_cast<std::size_t>(n);
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        if (auto r = wait_for(fd, POLLOUT, config.read_timeout); !r) {
          return r;
        }
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      log::error("Failed to write request to {}: {}", host,
                 std::strerror(errno));
      return fail(Error::ConnectionFailed);
    }
    return ok();
  }
};

HttpClient::HttpClient(int fd, std::string host, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(fd, std::move(host), config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
auto HttpClient::operator=(HttpClient&&) noexcept -> HttpClient& = default;

auto HttpClient::connect_tcp(std::string_view host, uint16_t port,
                             HttpClientConfig config)
    -> Result<std::unique_ptr<HttpClient>> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  std::string host_str(host);
  std::string port_str = std::to_string(port);

  int ret = ::getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result);
  if (ret != 0 || result == nullptr) {
    log::error("Failed to resolve {}:{} - {}", host, port, gai_strerror(ret));
    return fail(Error::ConnectionFailed);
  }

  auto addr_guard = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(
      result, freeaddrinfo);

  int fd = ::socket(result->ai_family, SOCK_STREAM | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    log::error("Failed to create socket: {}", std::strerror(errno));
    return fail(Error::ConnectionFailed);
  }
  auto client = std::make_unique<HttpClient>(fd, host_str, config);

  if (::connect(fd, result->ai_addr, result->ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      log::error("Failed to connect to {}:{} - {}", host, port,
                 std::strerror(errno));
      return fail(Error::ConnectionFailed);
    }
    if (auto r = wait_for(fd, POLLOUT, config.connect_timeout); !r) {
      log::error("Connect to {}:{} timed out after {}ms", host, port,
                 config.connect_timeout.count());
      return fail(r.error());
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
        so_error != 0) {
      log::error("Failed to connect to {}:{} - {}", host, port,
                 std::strerror(so_error != 0 ? so_error : errno));
      return fail(Error::ConnectionFailed);
    }
  }

  return client;
}

auto HttpClient::request(HttpRequest req) -> Result<HttpResponse> {
  if (!is_connected()) {
    return fail(Error::ConnectionFailed);
  }

  if (!req.headers.contains("Host")) {
    req.headers["Host"] = impl_->host;
  }
  if (!req.headers.contains("Connection")) {
    req.headers["Connection"] = "close";
  }

  auto request_data = req.serialize();
  if (auto r = impl_->write_all(request_data); !r) {
    close();
    return fail(r.error());
  }

  HttpResponseParser parser;
  std::vector<uint8_t> buffer(8192);
  std::size_t total_read = 0;

  while (total_read < impl_->config.max_response_size) {
    if (auto r = wait_for(impl_->fd, POLLIN, impl_->config.read_timeout); !r) {
      log::error("Timed out reading response from {}", impl_->host);
      close();
      return fail(r.error());
    }

    ssize_t n = ::recv(impl_->fd, buffer.data(), buffer.size(), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      log::error("Failed to read response from {}: {}", impl_->host,
                 std::strerror(errno));
      close();
      return fail(Error::ConnectionFailed);
    }

    if (n == 0) {
      auto response = parser.finish();
      close();
      if (!response) {
        log::error("Connection to {} closed before a full response",
                   impl_->host);
        return fail(Error::ParseError);
      }
      return std::move(*response);
    }

    total_read += static_cast<std::size_t>(n);

    auto response =
        parser.parse(std::span{buffer.data(), static_cast<std::size_t>(n)});
    if (response) {
      close();
      return std::move(*response);
    }
    if (parser.failed()) {
      close();
      return fail(Error::ParseError);
    }
  }

  log::error("Response from {} exceeds {} bytes", impl_->host,
             impl_->config.max_response_size);
  close();
  return fail(Error::ParseError);
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_ && impl_->fd >= 0;
}

auto HttpClient::close() -> void {
  if (impl_ && impl_->fd >= 0) {
    ::close(impl_->fd);
    impl_->fd = -1;
  }
}

}  // namespace shepherd::http
