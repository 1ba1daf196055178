#pragma once

#include "shepherd/core/error.hpp"
#include "shepherd/model/claim.hpp"
#include "shepherd/model/task.hpp"

#include <cstddef>
#include <string>

namespace shepherd {

// Longest name the orchestration system accepts for a claim.
inline constexpr std::size_t kMaxClaimNameLength = 63;

// Derives the claim for a task. Same record, same claim: the name is the task
// id, so a retried create is absorbed as AlreadyExists.
//
// Returns InvalidArgument when the record cannot yield a valid claim;
// `invalid_reason` receives the human readable cause.
[[nodiscard]] auto build_claim(const TaskRecord& record,
                               std::string* invalid_reason = nullptr)
    -> Result<ClaimSpec>;

}  // namespace shepherd
