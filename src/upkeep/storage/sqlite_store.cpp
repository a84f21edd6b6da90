#include "upkeep/storage/sqlite_store.hpp"

#include "upkeep/util/log.hpp"

#include <sqlite3.h>

namespace upkeep {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  auto n = sqlite3_column_bytes(stmt, col);
  return p ? std::string(p, static_cast<std::size_t>(n)) : std::string{};
}

auto bind(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

}  // namespace

auto escape_like(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size() + 8);
  for (char c : text) {
    if (c == '\\' || c == '%' || c == '_') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

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

SqliteStore::SqliteStore(std::string_view db_path) : db_path_(db_path) {
}

SqliteStore::~SqliteStore() {
  close();
}

auto SqliteStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", db_path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 2000);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  // Prefix scans must not match keys that differ only in case.
  if (auto r = execute("PRAGMA case_sensitive_like=ON;"); !r) {
    log::warn("Failed to enable case-sensitive LIKE: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::debug("Database opened: {}", db_path_);
  return ok();
}

auto SqliteStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto SqliteStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS options (
      name TEXT PRIMARY KEY,
      value TEXT NOT NULL
    );
  )";
  return execute(sql);
}

auto SqliteStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto SqliteStore::ensure_open() const -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  return ok();
}

auto SqliteStore::get(std::string_view key)
    -> Result<std::optional<std::string>> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared = prepare("SELECT value FROM options WHERE name = ?;");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind(stmt.get(), 1, key);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return std::optional<std::string>{col_text(stmt.get(), 0)};
  }
  if (rc == SQLITE_DONE) {
    return std::optional<std::string>{};
  }
  log::error("Failed to read option {}: {}", key, sqlite3_errmsg(db_.get()));
  return fail(Error::DatabaseQueryFailed);
}

auto SqliteStore::put(std::string_view key, std::string_view value)
    -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return r;

  constexpr auto sql = R"(
    INSERT INTO options (name, value) VALUES (?, ?)
    ON CONFLICT(name) DO UPDATE SET value = excluded.value;
  )";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind(stmt.get(), 1, key);
  bind(stmt.get(), 2, value);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to write option {}: {}", key, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStore::remove(std::string_view key) -> Result<bool> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared = prepare("DELETE FROM options WHERE name = ?;");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind(stmt.get(), 1, key);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to delete option {}: {}", key,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::remove_pair(std::string_view key1, std::string_view key2)
    -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared = prepare("DELETE FROM options WHERE name IN (?, ?);");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind(stmt.get(), 1, key1);
  bind(stmt.get(), 2, key2);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to delete option pair {}: {}", key1,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

auto SqliteStore::insert_pair_if_absent(std::string_view key1,
                                        std::string_view value1,
                                        std::string_view key2,
                                        std::string_view value2)
    -> Result<int> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared =
      prepare("INSERT OR IGNORE INTO options (name, value) VALUES (?, ?), (?, ?);");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind(stmt.get(), 1, key1);
  bind(stmt.get(), 2, value1);
  bind(stmt.get(), 3, key2);
  bind(stmt.get(), 4, value2);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to insert option pair {}: {}", key1,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return sqlite3_changes(db_.get());
}

auto SqliteStore::remove_prefix(std::string_view prefix)
    -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared =
      prepare("DELETE FROM options WHERE name LIKE ? ESCAPE '\\';");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  auto pattern = escape_like(prefix) + "%";
  bind(stmt.get(), 1, pattern);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to delete options by prefix {}: {}", prefix,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

auto SqliteStore::scan_prefix(std::string_view prefix)
    -> Result<std::vector<Entry>> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared = prepare(
      "SELECT name, value FROM options WHERE name LIKE ? ESCAPE '\\' "
      "ORDER BY name;");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  auto pattern = escape_like(prefix) + "%";
  bind(stmt.get(), 1, pattern);

  std::vector<Entry> rows;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    rows.emplace_back(col_text(stmt.get(), 0), col_text(stmt.get(), 1));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to scan options by prefix {}: {}", prefix,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return rows;
}

auto SqliteStore::count_prefix(std::string_view prefix)
    -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r)
    return std::unexpected(r.error());

  auto prepared =
      prepare("SELECT COUNT(*) FROM options WHERE name LIKE ? ESCAPE '\\';");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  auto pattern = escape_like(prefix) + "%";
  bind(stmt.get(), 1, pattern);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    log::error("Failed to count options by prefix {}: {}", prefix,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace upkeep
