#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace ratekeeper {

/**
 * @brief Prepared statement (owns sqlite3_stmt*)
 *
 * Bind indexes are 1-based, column indexes 0-based (SQLite convention).
 * Errors throw TableMissingError for "no such table", BackendError otherwise.
 */
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, std::string_view sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    SqliteStatement& bind(int index, int64_t value);
    SqliteStatement& bind(int index, std::string_view value);
    SqliteStatement& bind_null(int index);

    /**
     * @brief Advance the cursor
     * @return true if a row is available, false when done
     */
    bool step();

    /**
     * @brief Run to completion, discarding rows
     */
    void run();

    [[nodiscard]] int64_t column_int64(int col) const;
    [[nodiscard]] std::string column_text(int col) const;
    [[nodiscard]] bool column_is_null(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @brief SQLite connection (owns sqlite3*)
 *
 * Opened with SQLITE_OPEN_FULLMUTEX and a busy timeout so several stores,
 * threads or processes can share one database file. Multi-statement work
 * (transactions) must hold lock() for its whole duration.
 */
class SqliteConnection {
public:
    struct Options {
        std::string path = ":memory:";
        int busy_timeout_ms = 5000;
        bool enable_wal = true;     // Ignored for :memory:
    };

    /**
     * @brief Open (or create) a database
     * @throws BackendError if the database cannot be opened
     */
    explicit SqliteConnection(Options options);

    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    /**
     * @brief Execute one or more statements without results
     */
    void execute(const std::string& sql);

    [[nodiscard]] SqliteStatement prepare(std::string_view sql);

    /**
     * @brief Rows modified by the most recent INSERT/UPDATE/DELETE
     */
    [[nodiscard]] int64_t changes() const;

    [[nodiscard]] bool table_exists(std::string_view table_name);

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    [[nodiscard]] bool is_memory() const { return options_.path == ":memory:"; }
    [[nodiscard]] const std::string& path() const { return options_.path; }

    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    void close();

private:
    Options options_;
    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
};

/**
 * @brief BEGIN IMMEDIATE ... COMMIT scope; rolls back unless committed
 */
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteConnection& conn);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteConnection& conn_;
    bool finished_ = false;
};

/**
 * @brief Throw the error for a failed sqlite3 call
 *
 * "no such table: X" becomes TableMissingError("X"), everything else
 * BackendError carrying the SQLite message.
 */
[[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, std::string_view context);

} // namespace ratekeeper
