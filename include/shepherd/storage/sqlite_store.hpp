#pragma once

#include "shepherd/core/error.hpp"
#include "shepherd/storage/lease_store.hpp"
#include "shepherd/storage/secret_store.hpp"
#include "shepherd/storage/task_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace shepherd {

// Task records, token secrets and leader leases in one SQLite database.
// A single connection is shared; every call is serialized on mutex_.
class SqliteStore final : public TaskStore,
                          public SecretStore,
                          public LeaseStore {
public:
  explicit SqliteStore(std::string_view db_path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  // TaskStore
  [[nodiscard]] auto create(TaskRecord record) -> Result<TaskRecord> override;
  [[nodiscard]] auto get(const TaskId& id) -> Result<TaskRecord> override;
  [[nodiscard]] auto list() -> Result<std::vector<TaskRecord>> override;
  [[nodiscard]] auto update_status(const TaskId& id,
                                   std::uint64_t expected_version,
                                   const TaskStatus& status)
      -> Result<TaskRecord> override;
  [[nodiscard]] auto request_deletion(const TaskId& id, TimePoint now)
      -> Result<void> override;
  [[nodiscard]] auto purge(const TaskId& id, std::uint64_t expected_version)
      -> Result<void> override;
  auto subscribe(TaskChangeFn fn) -> std::size_t override;
  auto unsubscribe(std::size_t handle) -> void override;

  // SecretStore
  [[nodiscard]] auto put(const TokenSecret& secret) -> Result<void> override;
  [[nodiscard]] auto get(const SecretName& name)
      -> Result<TokenSecret> override;
  [[nodiscard]] auto remove(const SecretName& name) -> Result<void> override;

  // LeaseStore
  [[nodiscard]] auto try_acquire(std::string_view name,
                                 std::string_view holder,
                                 std::chrono::milliseconds duration,
                                 TimePoint now) -> Result<bool> override;
  [[nodiscard]] auto release(std::string_view name, std::string_view holder)
      -> Result<void> override;
  [[nodiscard]] auto get_lease(std::string_view name)
      -> Result<Lease> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto get_locked(const TaskId& id) -> Result<TaskRecord>;
  [[nodiscard]] auto exists_locked(const TaskId& id) -> Result<bool>;
  auto notify(const TaskId& id) -> void;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
  std::mutex mutex_;

  std::mutex subscribers_mutex_;
  std::vector<std::pair<std::size_t, TaskChangeFn>> subscribers_;
  std::size_t next_subscriber_{1};
};

}  // namespace shepherd
