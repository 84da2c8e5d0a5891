#include "storage/sqlitecheckpointstore.hpp"
#include "storage/sqlitedatabase.hpp"
#include "core/logging.hpp"
#include <mutex>
#include <stdexcept>

namespace ledgerseal::storage {

namespace {

namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS checkpoints (
            tenant_id TEXT NOT NULL,
            checkpoint_date TEXT NOT NULL,
            checkpoint_hash TEXT NOT NULL,
            payload TEXT NOT NULL,
            PRIMARY KEY (tenant_id, checkpoint_date)
        );

        CREATE TRIGGER IF NOT EXISTS checkpoints_immutable
        BEFORE UPDATE ON checkpoints
        BEGIN
            SELECT RAISE(ABORT, 'checkpoints are immutable');
        END;

        CREATE TRIGGER IF NOT EXISTS checkpoints_no_delete
        BEFORE DELETE ON checkpoints
        BEGIN
            SELECT RAISE(ABORT, 'checkpoints cannot be deleted');
        END;
    )";

    const char* INSERT_CHECKPOINT = R"(
        INSERT INTO checkpoints (tenant_id, checkpoint_date, checkpoint_hash, payload)
        VALUES (?, ?, ?, ?);
    )";

    const char* SELECT_ONE =
        "SELECT payload FROM checkpoints WHERE tenant_id = ? AND checkpoint_date = ?;";

    // ISO dates order lexicographically
    const char* SELECT_LATEST_BEFORE = R"(
        SELECT payload FROM checkpoints
        WHERE tenant_id = ? AND checkpoint_date < ?
        ORDER BY checkpoint_date DESC LIMIT 1;
    )";

    const char* SELECT_LATEST = R"(
        SELECT payload FROM checkpoints
        WHERE tenant_id = ?
        ORDER BY checkpoint_date DESC LIMIT 1;
    )";

    const char* SELECT_RANGE = R"(
        SELECT payload FROM checkpoints
        WHERE tenant_id = ? AND checkpoint_date >= ? AND checkpoint_date <= ?
        ORDER BY checkpoint_date ASC;
    )";
}

} // anonymous namespace

class SqliteCheckpointStore::Impl {
public:
    explicit Impl(const std::string& dbPath) : db_(dbPath) {
        db_.exec(sql::CREATE_TABLES);
    }

    bool save(const core::Checkpoint& checkpoint) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::INSERT_CHECKPOINT);
        stmt.bind(1, checkpoint.tenantId);
        stmt.bind(2, checkpoint.date.toString());
        stmt.bind(3, checkpoint.checkpointHash);
        stmt.bind(4, checkpoint.toJson().dump(-1, ' ', false,
                                              nlohmann::json::error_handler_t::replace));

        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return true;
        }
        if (rc == SQLITE_CONSTRAINT) {
            core::logger()->warn("Checkpoint for {} on {} already stored",
                                 checkpoint.tenantId, checkpoint.date.toString());
            return false;
        }
        throw std::runtime_error("Failed to store checkpoint: " + db_.lastError());
    }

    std::optional<core::Checkpoint> get(const std::string& tenantId,
                                        const core::compat::CivilDate& date) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::SELECT_ONE);
        stmt.bind(1, tenantId);
        stmt.bind(2, date.toString());
        return single(stmt);
    }

    std::optional<core::Checkpoint> latestBefore(const std::string& tenantId,
                                                 const core::compat::CivilDate& date) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::SELECT_LATEST_BEFORE);
        stmt.bind(1, tenantId);
        stmt.bind(2, date.toString());
        return single(stmt);
    }

    std::optional<core::Checkpoint> latest(const std::string& tenantId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::SELECT_LATEST);
        stmt.bind(1, tenantId);
        return single(stmt);
    }

    std::vector<core::Checkpoint> list(const std::string& tenantId,
                                       const core::compat::CivilDate& from,
                                       const core::compat::CivilDate& to) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::SELECT_RANGE);
        stmt.bind(1, tenantId);
        stmt.bind(2, from.toString());
        stmt.bind(3, to.toString());

        std::vector<core::Checkpoint> result;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            result.push_back(core::Checkpoint::fromJson(nlohmann::json::parse(stmt.columnText(0))));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Checkpoint query failed: " + db_.lastError());
        }
        return result;
    }

private:
    SqliteDatabase db_;
    std::mutex mutex_;

    std::optional<core::Checkpoint> single(SqliteStatement& stmt) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            throw std::runtime_error("Checkpoint query failed: " + db_.lastError());
        }
        return core::Checkpoint::fromJson(nlohmann::json::parse(stmt.columnText(0)));
    }
};

SqliteCheckpointStore::SqliteCheckpointStore(const std::string& dbPath)
    : impl_(std::make_unique<Impl>(dbPath)) {}

SqliteCheckpointStore::~SqliteCheckpointStore() = default;

bool SqliteCheckpointStore::save(const core::Checkpoint& checkpoint) {
    return impl_->save(checkpoint);
}

std::optional<core::Checkpoint> SqliteCheckpointStore::get(const std::string& tenantId,
                                                           const core::compat::CivilDate& date) {
    return impl_->get(tenantId, date);
}

std::optional<core::Checkpoint> SqliteCheckpointStore::latestBefore(
    const std::string& tenantId, const core::compat::CivilDate& date) {
    return impl_->latestBefore(tenantId, date);
}

std::optional<core::Checkpoint> SqliteCheckpointStore::latest(const std::string& tenantId) {
    return impl_->latest(tenantId);
}

std::vector<core::Checkpoint> SqliteCheckpointStore::list(const std::string& tenantId,
                                                          const core::compat::CivilDate& from,
                                                          const core::compat::CivilDate& to) {
    return impl_->list(tenantId, from, to);
}

} // namespace ledgerseal::storage
