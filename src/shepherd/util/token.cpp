#include "shepherd/util/token.hpp"

#include "shepherd/util/log.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <format>
#include <iterator>
#include <vector>

namespace shepherd {

auto generate_token(std::size_t bytes) -> Result<std::string> {
  if (bytes == 0) {
    return fail(Error::InvalidArgument);
  }

  std::vector<unsigned char> raw(bytes);
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    log::error("RAND_bytes failed: {}", ERR_get_error());
    return fail(Error::Unknown);
  }

  std::string token;
  token.reserve(bytes * 2);
  for (auto b : raw) {
    std::format_to(std::back_inserter(token), "{:02x}", b);
  }
  return token;
}

}  // namespace shepherd
