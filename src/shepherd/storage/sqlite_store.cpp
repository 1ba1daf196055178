#include "shepherd/storage/sqlite_store.hpp"

#include "shepherd/model/codec.hpp"
#include "shepherd/util/log.hpp"

#include <sqlite3.h>

namespace shepherd {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

// Columns: id, version, created_at, spec, status, deletion_requested_at
constexpr auto kSelectTask = R"(
    SELECT id, version, created_at, spec, status, deletion_requested_at
    FROM tasks WHERE id = ?;
  )";

auto read_task_row(sqlite3_stmt* stmt) -> Result<TaskRecord> {
  TaskRecord record;
  record.id = TaskId{col_text(stmt, 0)};
  record.version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
  record.created_at = from_unix_millis(sqlite3_column_int64(stmt, 2));

  auto spec = codec::decode_spec(col_text(stmt, 3));
  if (!spec) {
    return fail(spec.error());
  }
  record.spec = std::move(*spec);

  auto status = codec::decode_status(col_text(stmt, 4));
  if (!status) {
    return fail(status.error());
  }
  record.status = std::move(*status);

  if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
    record.deletion_requested_at =
        from_unix_millis(sqlite3_column_int64(stmt, 5));
  }
  return record;
}

}  // namespace

auto SqliteStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteStore::Statement::~Statement() {
  reset();
}

auto SqliteStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto SqliteStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    log::error("Database is not open: {}", db_path_);
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

SqliteStore::SqliteStore(std::string_view db_path) : db_path_(db_path) {
}

SqliteStore::~SqliteStore() {
  close();
}

auto SqliteStore::open() -> Result<void> {
  std::lock_guard lock(mutex_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  sqlite3_busy_timeout(db_.get(), 5000);

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto SqliteStore::close() -> void {
  std::lock_guard lock(mutex_);
  db_.reset();
}

auto SqliteStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      version INTEGER NOT NULL DEFAULT 1,
      created_at INTEGER NOT NULL,
      spec TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT '{}',
      deletion_requested_at INTEGER
    );

    CREATE TABLE IF NOT EXISTS secrets (
      name TEXT PRIMARY KEY,
      owner TEXT NOT NULL,
      token TEXT NOT NULL,
      created_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_secrets_owner ON secrets(owner);

    CREATE TABLE IF NOT EXISTS leases (
      name TEXT PRIMARY KEY,
      holder TEXT NOT NULL,
      renewed_at INTEGER NOT NULL,
      expires_at INTEGER NOT NULL
    );
  )";

  return execute(sql);
}

auto SqliteStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStore::subscribe(TaskChangeFn fn) -> std::size_t {
  std::lock_guard lock(subscribers_mutex_);
  auto handle = next_subscriber_++;
  subscribers_.emplace_back(handle, std::move(fn));
  return handle;
}

auto SqliteStore::unsubscribe(std::size_t handle) -> void {
  std::lock_guard lock(subscribers_mutex_);
  std::erase_if(subscribers_,
                [handle](const auto& entry) { return entry.first == handle; });
}

// Runs outside mutex_ so subscribers may read the store.
auto SqliteStore::notify(const TaskId& id) -> void {
  std::lock_guard lock(subscribers_mutex_);
  for (auto& [handle, fn] : subscribers_) {
    fn(id);
  }
}

auto SqliteStore::create(TaskRecord record) -> Result<TaskRecord> {
  {
    std::lock_guard lock(mutex_);
    constexpr auto sql = R"(
      INSERT INTO tasks (id, version, created_at, spec, status)
      VALUES (?, 1, ?, ?, ?);
    )";

    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    auto spec = codec::encode_spec(record.spec);
    auto status = codec::encode_status(record.status);
    bind_text(stmt.get(), 1, record.id.value());
    sqlite3_bind_int64(stmt.get(), 2, to_unix_millis(record.created_at));
    bind_text(stmt.get(), 3, spec);
    bind_text(stmt.get(), 4, status);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT) {
      return fail(Error::AlreadyExists);
    }
    if (rc != SQLITE_DONE) {
      log::error("Failed to create task {}: {}", record.id,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }
    record.version = 1;
    record.deletion_requested_at.reset();
  }
  notify(record.id);
  return record;
}

auto SqliteStore::get_locked(const TaskId& id) -> Result<TaskRecord> {
  auto result = prepare(kSelectTask);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to read task {}: {}", id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return read_task_row(stmt.get());
}

auto SqliteStore::exists_locked(const TaskId& id) -> Result<bool> {
  auto result = prepare("SELECT 1 FROM tasks WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  return fail(Error::DatabaseQueryFailed);
}

auto SqliteStore::get(const TaskId& id) -> Result<TaskRecord> {
  std::lock_guard lock(mutex_);
  return get_locked(id);
}

auto SqliteStore::list() -> Result<std::vector<TaskRecord>> {
  std::lock_guard lock(mutex_);
  constexpr auto sql = R"(
    SELECT id, version, created_at, spec, status, deletion_requested_at
    FROM tasks ORDER BY created_at, id;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<TaskRecord> records;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto record = read_task_row(stmt.get());
    if (!record) {
      log::warn("Skipping undecodable task record {}", col_text(stmt.get(), 0));
      continue;
    }
    records.push_back(std::move(*record));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to list tasks: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return records;
}

auto SqliteStore::update_status(const TaskId& id,
                                std::uint64_t expected_version,
                                const TaskStatus& status)
    -> Result<TaskRecord> {
  Result<TaskRecord> updated;
  {
    std::lock_guard lock(mutex_);
    constexpr auto sql = R"(
      UPDATE tasks SET status = ?, version = version + 1
      WHERE id = ? AND version = ?;
    )";

    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    auto encoded = codec::encode_status(status);
    bind_text(stmt.get(), 1, encoded);
    bind_text(stmt.get(), 2, id.value());
    sqlite3_bind_int64(stmt.get(), 3,
                       static_cast<sqlite3_int64>(expected_version));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Failed to update task {}: {}", id, sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }

    if (sqlite3_changes(db_.get()) == 0) {
      auto exists = exists_locked(id);
      if (!exists)
        return std::unexpected(exists.error());
      return fail(*exists ? Error::Conflict : Error::NotFound);
    }

    updated = get_locked(id);
  }
  if (updated) {
    notify(id);
  }
  return updated;
}

auto SqliteStore::request_deletion(const TaskId& id, TimePoint now)
    -> Result<void> {
  {
    std::lock_guard lock(mutex_);
    constexpr auto sql = R"(
      UPDATE tasks
      SET deletion_requested_at = COALESCE(deletion_requested_at, ?),
          version = version + 1
      WHERE id = ?;
    )";

    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    sqlite3_bind_int64(stmt.get(), 1, to_unix_millis(now));
    bind_text(stmt.get(), 2, id.value());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Failed to mark task {} for deletion: {}", id,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }
    if (sqlite3_changes(db_.get()) == 0) {
      return fail(Error::NotFound);
    }
  }
  notify(id);
  return ok();
}

auto SqliteStore::purge(const TaskId& id, std::uint64_t expected_version)
    -> Result<void> {
  std::lock_guard lock(mutex_);
  auto result = prepare("DELETE FROM tasks WHERE id = ? AND version = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  sqlite3_bind_int64(stmt.get(), 2,
                     static_cast<sqlite3_int64>(expected_version));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to purge task {}: {}", id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  if (sqlite3_changes(db_.get()) == 0) {
    auto exists = exists_locked(id);
    if (!exists)
      return std::unexpected(exists.error());
    return fail(*exists ? Error::Conflict : Error::NotFound);
  }
  return ok();
}

auto SqliteStore::put(const TokenSecret& secret) -> Result<void> {
  std::lock_guard lock(mutex_);
  constexpr auto sql = R"(
    INSERT INTO secrets (name, owner, token, created_at)
    VALUES (?, ?, ?, ?)
    ON CONFLICT(name) DO UPDATE SET
      owner = excluded.owner,
      token = excluded.token,
      created_at = excluded.created_at;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, secret.name.value());
  bind_text(stmt.get(), 2, secret.owner.value());
  bind_text(stmt.get(), 3, secret.token);
  sqlite3_bind_int64(stmt.get(), 4, to_unix_millis(secret.created_at));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to store secret {}: {}", secret.name,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStore::get(const SecretName& name) -> Result<TokenSecret> {
  std::lock_guard lock(mutex_);
  auto result = prepare(
      "SELECT name, owner, token, created_at FROM secrets WHERE name = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, name.value());

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }

  return TokenSecret{
      .name = SecretName{col_text(stmt.get(), 0)},
      .owner = TaskId{col_text(stmt.get(), 1)},
      .token = col_text(stmt.get(), 2),
      .created_at = from_unix_millis(sqlite3_column_int64(stmt.get(), 3)),
  };
}

auto SqliteStore::remove(const SecretName& name) -> Result<void> {
  std::lock_guard lock(mutex_);
  auto result = prepare("DELETE FROM secrets WHERE name = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, name.value());

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to delete secret {}: {}", name,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  if (sqlite3_changes(db_.get()) == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto SqliteStore::try_acquire(std::string_view name, std::string_view holder,
                              std::chrono::milliseconds duration,
                              TimePoint now) -> Result<bool> {
  std::lock_guard lock(mutex_);
  // The upsert only overwrites our own lease or an expired one.
  constexpr auto sql = R"(
    INSERT INTO leases (name, holder, renewed_at, expires_at)
    VALUES (?1, ?2, ?3, ?4)
    ON CONFLICT(name) DO UPDATE SET
      holder = excluded.holder,
      renewed_at = excluded.renewed_at,
      expires_at = excluded.expires_at
    WHERE leases.holder = excluded.holder OR leases.expires_at <= ?3;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto now_ms = to_unix_millis(now);
  bind_text(stmt.get(), 1, name);
  bind_text(stmt.get(), 2, holder);
  sqlite3_bind_int64(stmt.get(), 3, now_ms);
  sqlite3_bind_int64(stmt.get(), 4, now_ms + duration.count());

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to acquire lease {}: {}", name,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::release(std::string_view name, std::string_view holder)
    -> Result<void> {
  std::lock_guard lock(mutex_);
  auto result = prepare("DELETE FROM leases WHERE name = ? AND holder = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, name);
  bind_text(stmt.get(), 2, holder);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to release lease {}: {}", name,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStore::get_lease(std::string_view name) -> Result<Lease> {
  std::lock_guard lock(mutex_);
  auto result = prepare(
      "SELECT name, holder, renewed_at, expires_at FROM leases WHERE name = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, name);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return Lease{
      .name = col_text(stmt.get(), 0),
      .holder = col_text(stmt.get(), 1),
      .renewed_at = from_unix_millis(sqlite3_column_int64(stmt.get(), 2)),
      .expires_at = from_unix_millis(sqlite3_column_int64(stmt.get(), 3)),
  };
}

}  // namespace shepherd
