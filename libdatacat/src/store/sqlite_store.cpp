//
// Created by Giuseppe Francione on 07/10/26.
//

#include <sqlite3.h>
#include "../../include/sqlite_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <string>
#include <utility>

namespace datacat {

namespace {

std::string errmsg(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "out of memory";
}

void exec_all(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : errmsg(db);
        sqlite3_free(err);
        throw StoreError("SQLite exec failed: " + msg);
    }
}

} // namespace

// --- Statement ---

Statement::Statement(sqlite3* db, const std::string_view sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError("SQLite prepare failed: " + errmsg(db_) + " [" + std::string(sql) + "]");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void Statement::check(const int rc, const char* what) const {
    if (rc != SQLITE_OK) {
        throw StoreError(std::string("SQLite ") + what + " failed: " + errmsg(db_));
    }
}

Statement& Statement::bind(const int index, const std::int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind");
    return *this;
}

Statement& Statement::bind(const int index, const std::string_view value) {
    // a null pointer would bind SQL NULL instead of ''
    const char* text = value.data() ? value.data() : "";
    check(sqlite3_bind_text(stmt_, index, text, static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "bind");
    return *this;
}

Statement& Statement::bind_opt(const int index, const std::optional<std::int64_t>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind_opt(const int index, const std::optional<std::string>& value) {
    return value ? bind(index, std::string_view(*value)) : bind_null(index);
}

Statement& Statement::bind_null(const int index) {
    check(sqlite3_bind_null(stmt_, index), "bind");
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError("SQLite step failed: " + errmsg(db_));
}

void Statement::run() {
    if (step()) {
        throw StoreError("SQLite statement returned unexpected rows");
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::column_int64(const int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::column_text(const int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    if (!text) return {};
    return {reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, col))};
}

bool Statement::column_is_null(const int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<std::int64_t> Statement::column_opt_int64(const int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_int64(col);
}

std::optional<std::string> Statement::column_opt_text(const int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_text(col);
}

// --- SqliteStore ---

SqliteStore::SqliteStore(const std::filesystem::path& path) : path_(path) {
    const int rc = sqlite3_open_v2(
        path.string().c_str(),
        &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        const std::string msg = errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw OpenError("Failed to open store " + path.string() + ": " + msg);
    }

    // a file that is not a database only fails on first access
    try {
        exec_all(db_, "PRAGMA journal_mode=WAL;");
        exec_all(db_, "PRAGMA synchronous=NORMAL;");
        exec_all(db_, "PRAGMA foreign_keys=ON;");
        exec_all(db_, "PRAGMA busy_timeout=5000;");
    } catch (const StoreError& e) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw OpenError("Failed to open store " + path.string() + ": " + e.what());
    }
    Logger::log(LogLevel::Debug, "Opened store " + path.string(), "store");
}

SqliteStore::~SqliteStore() {
    close();
}

sqlite3* SqliteStore::handle() const {
    if (!db_) throw StoreError("store " + path_.string() + " is closed");
    return db_;
}

void SqliteStore::exec(const std::string_view sql) {
    exec_all(handle(), std::string(sql));
}

Statement SqliteStore::prepare(const std::string_view sql) const {
    return Statement(handle(), sql);
}

std::int64_t SqliteStore::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(handle());
}

void SqliteStore::close() {
    if (!db_) return;
    if (sqlite3_close(db_) != SQLITE_OK) {
        Logger::log(LogLevel::Warning, "Closing store with pending statements: " + errmsg(db_), "store");
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

// --- Transaction ---

Transaction::Transaction(SqliteStore& store) : store_(store) {
    store_.exec("BEGIN IMMEDIATE;");
    active_ = true;
}

Transaction::~Transaction() {
    if (!active_) return;
    try {
        rollback();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Rollback failed: ") + e.what(), "store");
    }
}

void Transaction::commit() {
    store_.exec("COMMIT;");
    active_ = false;
}

void Transaction::rollback() {
    active_ = false;
    store_.exec("ROLLBACK;");
}

} // namespace datacat
