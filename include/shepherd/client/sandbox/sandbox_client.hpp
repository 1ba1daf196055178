#pragma once

#include "shepherd/client/http/transport.hpp"
#include "shepherd/core/error.hpp"
#include "shepherd/model/claim.hpp"
#include "shepherd/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace shepherd::sandbox {

// Sandbox Orchestration System as seen by the controller.
class SandboxOrchestrator {
public:
  virtual ~SandboxOrchestrator() = default;

  // AlreadyExists if a claim with that name exists.
  [[nodiscard]] virtual auto create_claim(const ClaimSpec& spec)
      -> Result<void> = 0;

  // NotFound when absent.
  [[nodiscard]] virtual auto get_claim(const ClaimName& name)
      -> Result<SandboxClaim> = 0;

  // NotFound when absent.
  [[nodiscard]] virtual auto delete_claim(const ClaimName& name)
      -> Result<void> = 0;
};

struct SandboxClientConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{8090};
  std::string api_version{"v1alpha1"};
};

// JSON-over-HTTP client for the claim API.
class HttpSandboxClient final : public SandboxOrchestrator {
public:
  HttpSandboxClient(std::shared_ptr<http::Transport> transport,
                    SandboxClientConfig config = {});

  [[nodiscard]] auto create_claim(const ClaimSpec& spec)
      -> Result<void> override;
  [[nodiscard]] auto get_claim(const ClaimName& name)
      -> Result<SandboxClaim> override;
  [[nodiscard]] auto delete_claim(const ClaimName& name)
      -> Result<void> override;

private:
  [[nodiscard]] auto claims_path() const -> std::string;
  [[nodiscard]] auto claim_path(const ClaimName& name) const -> std::string;

  std::shared_ptr<http::Transport> transport_;
  SandboxClientConfig config_;
  http::Endpoint endpoint_;
};

}  // namespace shepherd::sandbox
