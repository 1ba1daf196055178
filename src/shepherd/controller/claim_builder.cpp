#include "shepherd/controller/claim_builder.hpp"

#include <format>

namespace shepherd {

namespace {

auto invalid(std::string* out, std::string message)
    -> std::unexpected<std::error_code> {
  if (out) {
    *out = std::move(message);
  }
  return fail(Error::InvalidArgument);
}

}  // namespace

auto build_claim(const TaskRecord& record, std::string* invalid_reason)
    -> Result<ClaimSpec> {
  if (record.id.empty()) {
    return invalid(invalid_reason, "task id is empty");
  }
  if (record.id.size() > kMaxClaimNameLength) {
    return invalid(invalid_reason,
                   std::format("task id exceeds {} characters",
                               kMaxClaimNameLength));
  }
  if (record.spec.runner.sandbox_template.empty()) {
    return invalid(invalid_reason, "sandbox template name is empty");
  }

  ClaimSpec spec;
  spec.name = claim_name_for(record.id);
  spec.owner = record.id;
  spec.template_name = record.spec.runner.sandbox_template;
  spec.resources = record.spec.runner.resources;
  spec.labels.emplace(std::string(kTaskLabel), record.id.str());
  return spec;
}

}  // namespace shepherd
