#pragma once

#include "shepherd/core/error.hpp"

#include <cstddef>
#include <string>

namespace shepherd {

inline constexpr std::size_t kTokenBytes = 32;

// Hex-encoded bearer token drawn from the OpenSSL CSPRNG.
[[nodiscard]] auto generate_token(std::size_t bytes = kTokenBytes)
    -> Result<std::string>;

}  // namespace shepherd
