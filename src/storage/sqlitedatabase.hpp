#pragma once

#include "core/core_export.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ledgerseal::storage {

/**
 * @brief Prepared statement owning its sqlite3_stmt
 */
class LEDGERSEAL_CORE_EXPORT SqliteStatement {
public:
    explicit SqliteStatement(sqlite3_stmt* stmt);

    // Bind by 1-based index
    void bind(int index, const std::string& value);
    void bind(int index, const std::optional<std::string>& value);
    void bind(int index, int64_t value);
    void bindNull(int index);

    /**
     * @brief Advance the statement
     * @return SQLITE_ROW, SQLITE_DONE or the error code
     */
    int step();
    void reset();

    std::string columnText(int column) const;
    int64_t columnInt64(int column) const;
    bool columnIsNull(int column) const;

private:
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_;
};

/**
 * @brief Owned SQLite connection
 */
class LEDGERSEAL_CORE_EXPORT SqliteDatabase {
public:
    /**
     * @brief Open (creating if needed) a database file
     * @param path File path, or ":memory:"
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase();

    // Prevent copying
    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    /**
     * @brief Run one or more statements without results
     * @throws std::runtime_error on failure
     */
    void exec(const std::string& sql);

    /**
     * @throws std::runtime_error if the statement does not compile
     */
    SqliteStatement prepare(const std::string& sql);

    std::string lastError() const;
    int changes() const;
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

} // namespace ledgerseal::storage
