#include "shepherd/client/sandbox/sandbox_client.hpp"

#include "shepherd/model/codec.hpp"
#include "shepherd/util/log.hpp"

#include <cctype>
#include <format>
#include <iterator>

namespace shepherd::sandbox {

namespace {

auto url_encode(std::string_view input) -> std::string {
  std::string result;
  result.reserve(input.size() * 3);
  for (char c : input) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      result += c;
    } else {
      std::format_to(std::back_inserter(result), "%{:02X}",
                     static_cast<unsigned char>(c));
    }
  }
  return result;
}

}  // namespace

HttpSandboxClient::HttpSandboxClient(std::shared_ptr<http::Transport> transport,
                                     SandboxClientConfig config)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      endpoint_{config_.host, config_.port} {}

auto HttpSandboxClient::claims_path() const -> std::string {
  return std::format("/{}/claims", config_.api_version);
}

auto HttpSandboxClient::claim_path(const ClaimName& name) const
    -> std::string {
  return std::format("/{}/claims/{}", config_.api_version,
                     url_encode(name.value()));
}

auto HttpSandboxClient::create_claim(const ClaimSpec& spec) -> Result<void> {
  auto body = codec::encode_claim_spec(spec);
  auto req = http::HttpRequest::json(claims_path(), body);

  auto response = transport_->send(endpoint_, std::move(req));
  if (!response) {
    log::error("Failed to reach sandbox API for claim {}: {}", spec.name,
               response.error().message());
    return fail(response.error());
  }

  if (response->status == http::HttpStatus::Conflict) {
    return fail(Error::AlreadyExists);
  }
  if (!response->is_success()) {
    log::error("Failed to create sandbox claim {}: status={} body={}",
               spec.name, response->status, response->body_as_string());
    return fail(Error::ApiError);
  }
  return ok();
}

auto HttpSandboxClient::get_claim(const ClaimName& name)
    -> Result<SandboxClaim> {
  http::HttpRequest req{
      .method = http::HttpMethod::GET,
      .path = claim_path(name),
      .headers = {{"Accept", "application/json"}},
      .body = {},
  };

  auto response = transport_->send(endpoint_, std::move(req));
  if (!response) {
    log::error("Failed to reach sandbox API for claim {}: {}", name,
               response.error().message());
    return fail(response.error());
  }

  if (response->status == http::HttpStatus::NotFound) {
    return fail(Error::NotFound);
  }
  if (!response->is_success()) {
    log::error("Failed to get sandbox claim {}: status={}", name,
               response->status);
    return fail(Error::ApiError);
  }
  return codec::decode_claim(response->body_as_string());
}

auto HttpSandboxClient::delete_claim(const ClaimName& name) -> Result<void> {
  http::HttpRequest req{
      .method = http::HttpMethod::DELETE,
      .path = claim_path(name),
      .headers = {},
      .body = {},
  };

  auto response = transport_->send(endpoint_, std::move(req));
  if (!response) {
    log::error("Failed to reach sandbox API for claim {}: {}", name,
               response.error().message());
    return fail(response.error());
  }

  if (response->status == http::HttpStatus::NotFound) {
    return fail(Error::NotFound);
  }
  if (!response->is_success()) {
    log::error("Failed to delete sandbox claim {}: status={}", name,
               response->status);
    return fail(Error::ApiError);
  }
  return ok();
}

}  // namespace shepherd::sandbox
