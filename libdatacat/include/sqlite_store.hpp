//
// Created by Giuseppe Francione on 07/10/26.
//

/**
 * @file sqlite_store.hpp
 * @brief Thin RAII layer over the SQLite C API used by every store component.
 */

#ifndef DATACAT_SQLITE_STORE_HPP
#define DATACAT_SQLITE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace datacat {

/**
 * @brief Owning wrapper of a prepared statement.
 *
 * Bind indexes are 1-based, column indexes 0-based, as in the C API.
 * Every failing call throws StoreError carrying sqlite3_errmsg().
 */
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, std::string_view value);
    /// Binds NULL for std::nullopt.
    Statement& bind_opt(int index, const std::optional<std::int64_t>& value);
    Statement& bind_opt(int index, const std::optional<std::string>& value);
    Statement& bind_null(int index);

    /**
     * @brief Advance the statement.
     * @return true if a row is available, false when done.
     */
    bool step();

    /// Step a statement that returns no rows.
    void run();

    void reset();

    [[nodiscard]] std::int64_t column_int64(int col) const;
    [[nodiscard]] std::string column_text(int col) const;
    [[nodiscard]] bool column_is_null(int col) const;
    [[nodiscard]] std::optional<std::int64_t> column_opt_int64(int col) const;
    [[nodiscard]] std::optional<std::string> column_opt_text(int col) const;

private:
    void check(int rc, const char* what) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owning wrapper of one SQLite connection.
 *
 * @details The connection is opened in serialized mode with WAL journaling,
 * foreign keys and a busy timeout, so that reader threads may share it
 * while a sync pass writes.
 */
class SqliteStore {
public:
    /**
     * @brief Open (or create) the database file.
     * @throws OpenError if the file cannot be opened or is not a database.
     */
    explicit SqliteStore(const std::filesystem::path& path);
    ~SqliteStore();

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    /// Execute one or more statements without results.
    void exec(std::string_view sql);

    [[nodiscard]] Statement prepare(std::string_view sql) const;

    [[nodiscard]] std::int64_t last_insert_rowid() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Close the connection; further calls throw StoreError.
    void close();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

private:
    [[nodiscard]] sqlite3* handle() const;

    std::filesystem::path path_;
    sqlite3* db_ = nullptr;
};

/**
 * @brief Scoped write transaction (BEGIN IMMEDIATE).
 *
 * Rolls back on destruction unless commit() was called.
 */
class Transaction {
public:
    explicit Transaction(SqliteStore& store);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

private:
    SqliteStore& store_;
    bool active_ = false;
};

} // namespace datacat

#endif // DATACAT_SQLITE_STORE_HPP
