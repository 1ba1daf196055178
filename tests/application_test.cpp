#include "shepherd/app/application.hpp"
#include "shepherd/controller/controller.hpp"
#include "shepherd/controller/leader_election.hpp"
#include "shepherd/storage/sqlite_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace shepherd;
using namespace shepherd::test;

namespace {

// Nothing listens on port 1, so remote calls fail fast and are retried.
constexpr std::string_view kConfig = R"(
storage:
  db_file: ":memory:"
controller:
  workers: 2
  backoff_base_ms: 50
assignment:
  api_url: http://127.0.0.1:1
sandbox:
  host: 127.0.0.1
  port: 1
  connect_timeout_ms: 200
  read_timeout_ms: 200
leader_election:
  enabled: false
)";

}  // namespace

TEST(ApplicationTest, LoadsConfigString) {
  Application app;
  ASSERT_TRUE(app.load_config_string(kConfig).has_value());

  EXPECT_EQ(app.config().storage.db_file, ":memory:");
  EXPECT_EQ(app.config().controller.workers, 2);
  EXPECT_FALSE(app.config().leader_election.enabled);
}

TEST(ApplicationTest, InvalidConfigIsRejected) {
  Application app;
  auto loaded = app.load_config_string("controller:\n  workers: 0\n");

  ASSERT_FALSE(loaded.has_value());
  EXPECT_TRUE(is_error(loaded.error(), Error::InvalidArgument));
}

TEST(ApplicationTest, InitValidatesProgrammaticConfig) {
  SystemConfig config;
  config.storage.db_file = ":memory:";
  config.assignment.path = "";
  Application app(config);

  auto started = app.start();

  ASSERT_FALSE(started.has_value());
  EXPECT_TRUE(is_error(started.error(), Error::InvalidArgument));
  EXPECT_FALSE(app.is_running());
  EXPECT_EQ(app.store(), nullptr);
}

TEST(ApplicationTest, StartsControllerWithoutElection) {
  Application app;
  ASSERT_TRUE(app.load_config_string(kConfig).has_value());
  ASSERT_TRUE(app.start().has_value());

  EXPECT_TRUE(app.is_running());
  EXPECT_EQ(app.leader_elector(), nullptr);
  ASSERT_NE(app.controller(), nullptr);
  EXPECT_TRUE(app.controller()->is_running());

  app.stop();
  EXPECT_FALSE(app.is_running());
  EXPECT_FALSE(app.controller()->is_running());
}

TEST(ApplicationTest, NewTaskIsMarkedPending) {
  Application app;
  ASSERT_TRUE(app.load_config_string(kConfig).has_value());
  ASSERT_TRUE(app.start().has_value());

  auto* store = app.store();
  ASSERT_NE(store, nullptr);
  ASSERT_TRUE(store->create(make_task("wired-1")).has_value());

  EXPECT_TRUE(wait_until([&] {
    auto record = store->get(task_id("wired-1"));
    return record && has_reason(record->status, Reason::Pending);
  }));

  app.stop();
}

TEST(ApplicationTest, ElectedInstanceStartsController) {
  Application app;
  ASSERT_TRUE(app.load_config_string(kConfig).has_value());
  app.config().leader_election.enabled = true;
  app.config().leader_election.identity = "app-test";
  ASSERT_TRUE(app.start().has_value());

  ASSERT_NE(app.leader_elector(), nullptr);
  EXPECT_TRUE(wait_until([&] { return app.leader_elector()->is_leader(); }));
  EXPECT_TRUE(wait_until([&] { return app.controller()->is_running(); }));

  app.stop();
  EXPECT_FALSE(app.controller()->is_running());
}
