#include "shepherd/model/codec.hpp"

#include "shepherd/model/state_strings.hpp"
#include "shepherd/util/log.hpp"

#include <nlohmann/json.hpp>

namespace shepherd::codec {

using json = nlohmann::json;

namespace {

auto put_time(json& j, std::string_view key,
              const std::optional<TimePoint>& tp) -> void {
  if (tp) {
    j[std::string(key)] = to_unix_millis(*tp);
  }
}

auto get_time(const json& j, std::string_view key)
    -> std::optional<TimePoint> {
  auto it = j.find(std::string(key));
  if (it == j.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return from_unix_millis(it->get<std::int64_t>());
}

auto resources_to_json(const ResourceOverrides& r) -> json {
  json out = json::object();
  auto list = [](const ResourceList& l) {
    json j = json::object();
    if (!l.cpu.empty())
      j["cpu"] = l.cpu;
    if (!l.memory.empty())
      j["memory"] = l.memory;
    return j;
  };
  if (!r.requests.empty())
    out["requests"] = list(r.requests);
  if (!r.limits.empty())
    out["limits"] = list(r.limits);
  return out;
}

auto resources_from_json(const json& j) -> ResourceOverrides {
  ResourceOverrides r;
  auto list = [](const json& l) {
    ResourceList out;
    out.cpu = l.value("cpu", "");
    out.memory = l.value("memory", "");
    return out;
  };
  if (auto it = j.find("requests"); it != j.end() && it->is_object())
    r.requests = list(*it);
  if (auto it = j.find("limits"); it != j.end() && it->is_object())
    r.limits = list(*it);
  return r;
}

auto condition_to_json(const Condition& c) -> json {
  return json{
      {"status", std::string(condition_status_name(c.status))},
      {"reason", std::string(reason_name(c.reason))},
      {"message", c.message},
      {"lastTransitionTime", to_unix_millis(c.last_transition)},
  };
}

auto condition_from_json(const json& j) -> Result<Condition> {
  Condition c;
  c.status = parse_condition_status(j.value("status", "Unknown"));
  auto reason = parse_reason(j.value("reason", ""));
  if (!reason) {
    log::warn("Unknown condition reason in stored status: {}",
              j.value("reason", ""));
    return fail(Error::ParseError);
  }
  c.reason = *reason;
  c.message = j.value("message", "");
  c.last_transition =
      from_unix_millis(j.value("lastTransitionTime", std::int64_t{0}));
  return c;
}

}  // namespace

auto encode_spec(const TaskSpec& spec) -> std::string {
  json j;
  j["repo"] = {{"url", spec.repo.url}, {"ref", spec.repo.ref}};
  j["task"] = {
      {"description", spec.task.description},
      {"context", spec.task.context},
      {"contextEncoding", spec.task.context_encoding},
      {"sourceURL", spec.task.source_url},
      {"sourceType", spec.task.source_type},
      {"sourceID", spec.task.source_id},
  };
  j["callback"] = {{"url", spec.callback.url}};
  j["runner"] = {
      {"sandboxTemplateName", spec.runner.sandbox_template},
      {"timeoutSeconds", spec.runner.timeout.count()},
      {"serviceAccountName", spec.runner.service_account},
      {"resources", resources_to_json(spec.runner.resources)},
  };
  return j.dump();
}

auto decode_spec(std::string_view text) -> Result<TaskSpec> {
  try {
    auto j = json::parse(text);
    TaskSpec spec;
    if (auto it = j.find("repo"); it != j.end()) {
      spec.repo.url = it->value("url", "");
      spec.repo.ref = it->value("ref", "");
    }
    if (auto it = j.find("task"); it != j.end()) {
      spec.task.description = it->value("description", "");
      spec.task.context = it->value("context", "");
      spec.task.context_encoding = it->value("contextEncoding", "");
      spec.task.source_url = it->value("sourceURL", "");
      spec.task.source_type = it->value("sourceType", "");
      spec.task.source_id = it->value("sourceID", "");
    }
    if (auto it = j.find("callback"); it != j.end()) {
      spec.callback.url = it->value("url", "");
    }
    if (auto it = j.find("runner"); it != j.end()) {
      spec.runner.sandbox_template = it->value("sandboxTemplateName", "");
      spec.runner.timeout =
          std::chrono::seconds(it->value("timeoutSeconds", std::int64_t{0}));
      spec.runner.service_account = it->value("serviceAccountName", "");
      if (auto res = it->find("resources"); res != it->end()) {
        spec.runner.resources = resources_from_json(*res);
      }
    }
    return spec;
  } catch (const json::exception& e) {
    log::error("Failed to decode task spec: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto encode_status(const TaskStatus& status) -> std::string {
  json j = json::object();
  if (status.succeeded) {
    j["conditions"] = json::array({condition_to_json(*status.succeeded)});
    j["conditions"][0]["type"] = "Succeeded";
  }
  put_time(j, "startTime", status.start_time);
  put_time(j, "completionTime", status.completion_time);
  put_time(j, "graceDeadline", status.grace_deadline);
  if (!status.claim_name.empty())
    j["sandboxClaimName"] = status.claim_name;
  if (!status.secret_name.empty())
    j["tokenSecretName"] = status.secret_name;
  if (status.assigned)
    j["assigned"] = true;
  if (status.cleaned_up)
    j["cleanedUp"] = true;

  json result = json::object();
  if (!status.result.pr_url.empty())
    result["prUrl"] = status.result.pr_url;
  if (!status.result.error.empty())
    result["error"] = status.result.error;
  if (!result.empty())
    j["result"] = std::move(result);
  return j.dump();
}

auto decode_status(std::string_view text) -> Result<TaskStatus> {
  try {
    auto j = json::parse(text);
    TaskStatus status;
    if (auto it = j.find("conditions"); it != j.end() && it->is_array()) {
      for (const auto& c : *it) {
        if (c.value("type", "") != "Succeeded") {
          continue;
        }
        auto cond = condition_from_json(c);
        if (!cond) {
          return fail(cond.error());
        }
        status.succeeded = std::move(*cond);
      }
    }
    status.start_time = get_time(j, "startTime");
    status.completion_time = get_time(j, "completionTime");
    status.grace_deadline = get_time(j, "graceDeadline");
    status.claim_name = j.value("sandboxClaimName", "");
    status.secret_name = j.value("tokenSecretName", "");
    status.assigned = j.value("assigned", false);
    status.cleaned_up = j.value("cleanedUp", false);
    if (auto it = j.find("result"); it != j.end() && it->is_object()) {
      status.result.pr_url = it->value("prUrl", "");
      status.result.error = it->value("error", "");
    }
    return status;
  } catch (const json::exception& e) {
    log::error("Failed to decode task status: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto encode_claim_spec(const ClaimSpec& spec) -> std::string {
  json j;
  j["name"] = spec.name.str();
  j["owner"] = spec.owner.str();
  j["templateRef"] = {{"name", spec.template_name}};
  j["labels"] = spec.labels;
  j["resources"] = resources_to_json(spec.resources);
  return j.dump();
}

auto decode_claim(std::string_view text) -> Result<SandboxClaim> {
  try {
    auto j = json::parse(text);
    SandboxClaim claim;
    claim.spec.name = ClaimName{j.value("name", "")};
    claim.spec.owner = TaskId{j.value("owner", "")};
    if (auto it = j.find("templateRef"); it != j.end() && it->is_object()) {
      claim.spec.template_name = it->value("name", "");
    }
    if (auto it = j.find("labels"); it != j.end() && it->is_object()) {
      claim.spec.labels = it->get<std::map<std::string, std::string>>();
    }
    if (auto it = j.find("resources"); it != j.end() && it->is_object()) {
      claim.spec.resources = resources_from_json(*it);
    }
    claim.created_at = get_time(j, "createdAt").value_or(TimePoint{});

    if (auto st = j.find("status"); st != j.end() && st->is_object()) {
      if (auto conds = st->find("conditions");
          conds != st->end() && conds->is_array()) {
        for (const auto& c : *conds) {
          if (c.value("type", "") != "Ready") {
            continue;
          }
          claim.ready = ReadinessCondition{
              .status = parse_condition_status(c.value("status", "Unknown")),
              .reason = c.value("reason", ""),
              .message = c.value("message", ""),
          };
        }
      }
      if (auto sb = st->find("sandbox"); sb != st->end() && sb->is_object()) {
        claim.sandbox_name = sb->value("name", "");
        claim.service_fqdn = sb->value("serviceFQDN", "");
      }
    }

    if (claim.spec.name.empty()) {
      log::error("Sandbox claim payload has no name");
      return fail(Error::ParseError);
    }
    return claim;
  } catch (const json::exception& e) {
    log::error("Failed to decode sandbox claim: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace shepherd::codec
