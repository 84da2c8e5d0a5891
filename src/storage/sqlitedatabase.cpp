#include "storage/sqlitedatabase.hpp"
#include <stdexcept>

namespace ledgerseal::storage {

SqliteStatement::SqliteStatement(sqlite3_stmt* stmt)
    : stmt_(stmt, sqlite3_finalize) {}

void SqliteStatement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void SqliteStatement::bind(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

void SqliteStatement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
}

void SqliteStatement::bindNull(int index) {
    sqlite3_bind_null(stmt_.get(), index);
}

int SqliteStatement::step() {
    return sqlite3_step(stmt_.get());
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
}

std::string SqliteStatement::columnText(int column) const {
    const auto* text = sqlite3_column_text(stmt_.get(), column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), column)));
}

int64_t SqliteStatement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_.get(), column));
}

bool SqliteStatement::columnIsNull(int column) const {
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

SqliteDatabase::SqliteDatabase(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("Failed to open database " + path + ": " + error);
    }
    sqlite3_busy_timeout(db_, 5000);
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) sqlite3_close(db_);
}

void SqliteDatabase::exec(const std::string& sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : lastError();
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL error: " + error);
    }
}

SqliteStatement SqliteDatabase::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + lastError());
    }
    return SqliteStatement(stmt);
}

std::string SqliteDatabase::lastError() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

int SqliteDatabase::changes() const {
    return sqlite3_changes(db_);
}

} // namespace ledgerseal::storage
