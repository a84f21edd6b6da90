#pragma once

#include "upkeep/core/error.hpp"
#include "upkeep/storage/kv_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace upkeep {

// KvStore over a single SQLite `options` table. The primary key on `name`
// is what makes insert_pair_if_absent a usable mutual-exclusion primitive.
class SqliteStore final : public KvStore {
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
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<std::string>> override;
  [[nodiscard]] auto put(std::string_view key, std::string_view value)
      -> Result<void> override;
  [[nodiscard]] auto remove(std::string_view key) -> Result<bool> override;
  [[nodiscard]] auto remove_pair(std::string_view key1, std::string_view key2)
      -> Result<std::size_t> override;
  [[nodiscard]] auto insert_pair_if_absent(std::string_view key1,
                                           std::string_view value1,
                                           std::string_view key2,
                                           std::string_view value2)
      -> Result<int> override;
  [[nodiscard]] auto remove_prefix(std::string_view prefix)
      -> Result<std::size_t> override;
  [[nodiscard]] auto scan_prefix(std::string_view prefix)
      -> Result<std::vector<Entry>> override;
  [[nodiscard]] auto count_prefix(std::string_view prefix)
      -> Result<std::size_t> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto ensure_open() const -> Result<void>;

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
  // One connection shared by every caller in the process.
  std::mutex mu_;
};

// Escapes `\`, `%` and `_` so the prefix can be used in `LIKE ? ESCAPE '\'`.
[[nodiscard]] auto escape_like(std::string_view text) -> std::string;

}  // namespace upkeep
