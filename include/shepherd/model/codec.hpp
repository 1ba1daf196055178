#pragma once

#include "shepherd/core/error.hpp"
#include "shepherd/model/claim.hpp"
#include "shepherd/model/task.hpp"

#include <string>
#include <string_view>

namespace shepherd::codec {

// JSON forms used by the record store and the sandbox API.

[[nodiscard]] auto encode_spec(const TaskSpec& spec) -> std::string;
[[nodiscard]] auto decode_spec(std::string_view json) -> Result<TaskSpec>;

[[nodiscard]] auto encode_status(const TaskStatus& status) -> std::string;
[[nodiscard]] auto decode_status(std::string_view json) -> Result<TaskStatus>;

[[nodiscard]] auto encode_claim_spec(const ClaimSpec& spec) -> std::string;
[[nodiscard]] auto decode_claim(std::string_view json) -> Result<SandboxClaim>;

}  // namespace shepherd::codec
