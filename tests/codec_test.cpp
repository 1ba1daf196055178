#include "shepherd/model/codec.hpp"
#include "shepherd/model/state_strings.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <format>

using namespace shepherd;
using namespace std::chrono_literals;

TEST(CodecTest, StatusKeepsConditionAndTimes) {
  TaskStatus status;
  status.succeeded = Condition{
      .status = ConditionStatus::False,
      .reason = Reason::TimedOut,
      .message = "Task exceeded timeout of 60s",
      .last_transition = from_unix_millis(1'700'000'060'000),
  };
  status.start_time = from_unix_millis(1'700'000'000'000);
  status.completion_time = from_unix_millis(1'700'000'060'000);
  status.claim_name = "task-1";
  status.secret_name = "task-1-token";
  status.assigned = true;
  status.cleaned_up = true;
  status.result.error = "Task exceeded timeout of 60s";

  auto decoded = codec::decode_status(codec::encode_status(status));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, status);
}

TEST(CodecTest, EmptyStatusStaysEmpty) {
  auto text = codec::encode_status(TaskStatus{});
  EXPECT_EQ(text, "{}");

  auto decoded = codec::decode_status(text);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->succeeded.has_value());
  EXPECT_FALSE(decoded->start_time.has_value());
  EXPECT_FALSE(decoded->assigned);
}

TEST(CodecTest, UnknownReasonIsParseError) {
  auto decoded = codec::decode_status(
      R"({"conditions":[{"type":"Succeeded","status":"False",)"
      R"("reason":"Exploded"}]})");

  ASSERT_FALSE(decoded.has_value());
  EXPECT_TRUE(is_error(decoded.error(), Error::ParseError));
}

TEST(CodecTest, OtherConditionTypesAreIgnored) {
  auto decoded = codec::decode_status(
      R"({"conditions":[{"type":"Progressing","reason":"Whatever"}]})");

  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->succeeded.has_value());
}

TEST(CodecTest, SpecDefaultsMissingFields) {
  auto decoded = codec::decode_spec(
      R"({"runner":{"sandboxTemplateName":"python"}})");

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->runner.sandbox_template, "python");
  EXPECT_EQ(decoded->runner.timeout, 0s);
  EXPECT_TRUE(decoded->repo.url.empty());
  EXPECT_TRUE(decoded->runner.resources.empty());
}

TEST(CodecTest, SpecKeepsResources) {
  TaskSpec spec;
  spec.repo = {.url = "https://github.com/acme/widgets", .ref = "main"};
  spec.runner.sandbox_template = "python";
  spec.runner.timeout = 600s;
  spec.runner.resources.limits.memory = "4Gi";

  auto decoded = codec::decode_spec(codec::encode_spec(spec));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, spec);
}

TEST(CodecTest, MalformedSpecIsParseError) {
  auto decoded = codec::decode_spec("{not json");

  ASSERT_FALSE(decoded.has_value());
  EXPECT_TRUE(is_error(decoded.error(), Error::ParseError));
}

TEST(CodecTest, ClaimReadsReadinessAndAddress) {
  auto decoded = codec::decode_claim(R"({
    "name": "task-1",
    "owner": "task-1",
    "templateRef": {"name": "python"},
    "labels": {"shepherd.io/task": "task-1"},
    "status": {
      "conditions": [
        {"type": "Ready", "status": "False", "reason": "SandboxExpired",
         "message": "lifetime reached"}
      ],
      "sandbox": {"name": "task-1-abc", "serviceFQDN": "task-1.ns.svc"}
    }
  })");

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->spec.name.str(), "task-1");
  EXPECT_EQ(decoded->spec.template_name, "python");
  EXPECT_EQ(decoded->spec.labels.at(std::string{kTaskLabel}), "task-1");
  ASSERT_TRUE(decoded->ready.has_value());
  EXPECT_EQ(decoded->ready->status, ConditionStatus::False);
  EXPECT_EQ(decoded->ready->reason, kReasonSandboxExpired);
  EXPECT_EQ(decoded->sandbox_name, "task-1-abc");
  EXPECT_EQ(decoded->service_fqdn, "task-1.ns.svc");
}

TEST(CodecTest, ClaimWithoutNameIsParseError) {
  auto decoded = codec::decode_claim(R"({"templateRef":{"name":"python"}})");

  ASSERT_FALSE(decoded.has_value());
  EXPECT_TRUE(is_error(decoded.error(), Error::ParseError));
}

TEST(StateStringsTest, ReasonNamesRoundTrip) {
  for (auto reason : {Reason::Pending, Reason::Running, Reason::Succeeded,
                      Reason::Failed, Reason::TimedOut, Reason::Cancelled}) {
    EXPECT_EQ(parse_reason(reason_name(reason)), reason);
  }
  EXPECT_FALSE(parse_reason("Exploded").has_value());
  EXPECT_EQ(parse_condition_status("Maybe"), ConditionStatus::Unknown);
  EXPECT_EQ(std::format("{}", Reason::TimedOut), "TimedOut");
}
