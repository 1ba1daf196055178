#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace shepherd {

enum class Error : int {
  Success,

  // Record store and child objects.
  NotFound,
  AlreadyExists,
  Conflict,

  // Input and configuration.
  InvalidArgument,
  ParseError,
  FileNotFound,

  // Remote calls to the sandbox API and runners.
  Timeout,
  ConnectionFailed,
  ApiError,
  AssignmentFailed,

  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,

  Unknown,
};

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "shepherd";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
      case Error::Success: return "success";
      case Error::NotFound: return "not found";
      case Error::AlreadyExists: return "already exists";
      case Error::Conflict: return "stale resource version";
      case Error::InvalidArgument: return "invalid argument";
      case Error::ParseError: return "malformed document";
      case Error::FileNotFound: return "file not found";
      case Error::Timeout: return "timed out";
      case Error::ConnectionFailed: return "connection failed";
      case Error::ApiError: return "remote API returned an error";
      case Error::AssignmentFailed: return "runner did not accept the task";
      case Error::DatabaseError: return "database error";
      case Error::DatabaseOpenFailed: return "failed to open database";
      case Error::DatabaseQueryFailed: return "database query failed";
      case Error::Unknown: break;
    }
    return "unknown error";
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace shepherd

template <>
struct std::is_error_code_enum<shepherd::Error> : std::true_type {};

namespace shepherd {

[[nodiscard]] inline auto is_error(const std::error_code& ec, Error e) -> bool {
  return ec == make_error_code(e);
}

// Heterogeneous lookup for string-keyed maps such as HTTP headers.
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace shepherd
