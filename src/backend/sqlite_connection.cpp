#include "backend/sqlite_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace ratekeeper {

namespace {

constexpr std::string_view kNoSuchTable = "no such table: ";

} // anonymous namespace

void throw_sqlite_error(sqlite3* db, int rc, std::string_view context) {
    const std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

    const auto pos = message.find(kNoSuchTable);
    if (pos != std::string::npos) {
        std::string table = message.substr(pos + kNoSuchTable.size());
        // "main.rate_limits" -> "rate_limits"
        const auto dot = table.find('.');
        if (dot != std::string::npos) table = table.substr(dot + 1);
        throw TableMissingError(table);
    }

    throw BackendError(std::format("SQLite {} failed ({}): {}", context, rc, message));
}

// ============================================================================
// SqliteStatement
// ============================================================================

SqliteStatement::SqliteStatement(sqlite3* db, std::string_view sql)
    : db_(db), stmt_(nullptr) {
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                                      &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw_sqlite_error(db_, rc, "prepare");
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, int64_t value) {
    const int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, std::string_view value) {
    const int rc = sqlite3_bind_text(stmt_, index, value.data(),
                                     static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind_null(int index) {
    const int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "bind");
    return *this;
}

bool SqliteStatement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db_, rc, "step");
}

void SqliteStatement::run() {
    while (step()) {}
}

int64_t SqliteStatement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::string SqliteStatement::column_text(int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool SqliteStatement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(Options options)
    : options_(std::move(options)) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(options_.path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw BackendError(std::format("Failed to open SQLite database '{}': {}",
                                       options_.path, message));
    }

    sqlite3_busy_timeout(db_, options_.busy_timeout_ms);

    if (options_.enable_wal && !is_memory()) {
        execute("PRAGMA journal_mode = WAL");
    }

    utils::log::debug(std::format("SQLite database opened: {}", options_.path));
}

SqliteConnection::~SqliteConnection() {
    close();
}

void SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        throw BackendError("SQLite connection is closed");
    }
    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        sqlite3_free(errmsg);
        throw_sqlite_error(db_, rc, "exec");
    }
}

SqliteStatement SqliteConnection::prepare(std::string_view sql) {
    if (!db_) {
        throw BackendError("SQLite connection is closed");
    }
    return SqliteStatement(db_, sql);
}

int64_t SqliteConnection::changes() const {
    return db_ ? static_cast<int64_t>(sqlite3_changes(db_)) : 0;
}

bool SqliteConnection::table_exists(std::string_view table_name) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind(1, table_name);
    return stmt.step();
}

void SqliteConnection::close() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (db_) {
        const int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            utils::log::warn(std::format("SQLite close returned {}: {}",
                                         rc, sqlite3_errstr(rc)));
        }
        db_ = nullptr;
        utils::log::debug(std::format("SQLite database closed: {}", options_.path));
    }
}

// ============================================================================
// SqliteTransaction
// ============================================================================

SqliteTransaction::SqliteTransaction(SqliteConnection& conn)
    : conn_(conn) {
    conn_.execute("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction() {
    if (finished_) return;
    try {
        conn_.execute("ROLLBACK");
    } catch (const std::exception& e) {
        utils::log::warn(std::format("SQLite rollback failed: {}", e.what()));
    }
}

void SqliteTransaction::commit() {
    conn_.execute("COMMIT");
    finished_ = true;
}

} // namespace ratekeeper
