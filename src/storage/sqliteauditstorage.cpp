#include "storage/sqliteauditstorage.hpp"
#include "storage/sqlitedatabase.hpp"
#include "core/logging.hpp"
#include <cstdint>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ledgerseal::storage {

// Schema version for database migrations
constexpr int SCHEMA_VERSION = 1;

namespace {

namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS audit_events (
            event_id TEXT PRIMARY KEY,
            tenant_id TEXT NOT NULL,
            project_id TEXT,
            ts_micros INTEGER NOT NULL,
            actor_type TEXT NOT NULL,
            actor_id TEXT NOT NULL,
            actor_email TEXT,
            event_category TEXT NOT NULL,
            event_type TEXT NOT NULL,
            event_severity TEXT NOT NULL,
            resource_type TEXT NOT NULL,
            resource_id TEXT NOT NULL,
            action TEXT NOT NULL,
            hash TEXT NOT NULL,
            previous_hash TEXT NOT NULL,
            payload TEXT NOT NULL,
            retain_until INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );

        CREATE INDEX IF NOT EXISTS idx_events_tenant_ts ON audit_events(tenant_id, ts_micros);
        CREATE INDEX IF NOT EXISTS idx_events_resource ON audit_events(resource_type, resource_id);
        CREATE INDEX IF NOT EXISTS idx_events_retention ON audit_events(retain_until);

        CREATE TRIGGER IF NOT EXISTS audit_events_immutable
        BEFORE UPDATE ON audit_events
        BEGIN
            SELECT RAISE(ABORT, 'audit events are immutable');
        END;

        CREATE TRIGGER IF NOT EXISTS audit_events_retention_lock
        BEFORE DELETE ON audit_events
        WHEN OLD.retain_until > CAST((julianday('now') - 2440587.5) * 86400000000.0 AS INTEGER)
        BEGIN
            SELECT RAISE(ABORT, 'audit event is under retention lock');
        END;
    )";

    const char* INSERT_EVENT = R"(
        INSERT INTO audit_events (
            event_id, tenant_id, project_id, ts_micros, actor_type, actor_id, actor_email,
            event_category, event_type, event_severity, resource_type, resource_id, action,
            hash, previous_hash, payload, retain_until
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    const char* SELECT_BY_ID = "SELECT payload FROM audit_events WHERE event_id = ?;";

    const char* SELECT_RETENTION = "SELECT retain_until FROM audit_events WHERE event_id = ?;";

    const char* QUERY_EVENTS = "SELECT payload FROM audit_events WHERE 1=1";

    const char* PURGE_EXPIRED = "DELETE FROM audit_events WHERE retain_until <= ?;";
}

constexpr int64_t MICROS_PER_DAY = 86400LL * 1000000LL;

int64_t toMicros(core::compat::Timestamp tp) {
    return std::chrono::duration_cast<core::compat::microseconds>(tp.time_since_epoch()).count();
}

core::compat::Timestamp fromMicros(int64_t micros) {
    return core::compat::Timestamp(core::compat::microseconds(micros));
}

} // anonymous namespace

class SqliteAuditStorage::Impl {
public:
    Impl(const std::string& dbPath, int retentionDays)
        : db_(dbPath), retentionDays_(retentionDays) {
        if (retentionDays_ < 0) {
            throw std::runtime_error("Retention days must not be negative");
        }
        initializeDatabase();
        core::logger()->info("SQLite audit storage at {} (retention {} days)",
                             dbPath, retentionDays_);
    }

    bool writeEvent(const core::AuditEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::INSERT_EVENT);
        return insert(stmt, event, toMicros(core::compat::now()));
    }

    size_t writeBatch(const std::vector<core::AuditEvent>& events) {
        std::lock_guard<std::mutex> lock(mutex_);
        db_.exec("BEGIN IMMEDIATE;");
        size_t written = 0;
        try {
            auto stmt = db_.prepare(sql::INSERT_EVENT);
            const int64_t nowMicros = toMicros(core::compat::now());
            for (const auto& event : events) {
                if (insert(stmt, event, nowMicros)) {
                    ++written;
                }
                stmt.reset();
            }
            db_.exec("COMMIT;");
        } catch (const std::runtime_error&) {
            rollback();
            throw;
        }
        return written;
    }

    std::optional<core::AuditEvent> readEvent(const std::string& eventId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::SELECT_BY_ID);
        stmt.bind(1, eventId);
        if (stmt.step() != SQLITE_ROW) {
            return std::nullopt;
        }
        return decode(stmt.columnText(0));
    }

    std::vector<core::AuditEvent> query(const core::EventFilter& filter) {
        std::stringstream query;
        query << sql::QUERY_EVENTS;
        // Parameters are bound in the order their placeholders were emitted
        std::vector<std::string> textParams;
        std::vector<int64_t> intParams;
        std::vector<std::pair<bool, size_t>> order;  // (isText, index)
        auto text = [&](const char* column, const std::string& value) {
            query << " AND " << column << " = ?";
            textParams.push_back(value);
            order.emplace_back(true, textParams.size() - 1);
        };
        auto integer = [&](const char* clause, int64_t value) {
            query << " AND " << clause;
            intParams.push_back(value);
            order.emplace_back(false, intParams.size() - 1);
        };

        if (filter.tenantId) text("tenant_id", *filter.tenantId);
        if (filter.projectId) text("project_id", *filter.projectId);
        if (filter.actorType) text("actor_type", core::toString(*filter.actorType));
        if (filter.actorId) text("actor_id", *filter.actorId);
        if (filter.actorEmail) text("actor_email", *filter.actorEmail);
        if (filter.category) text("event_category", core::toString(*filter.category));
        if (filter.eventType) text("event_type", *filter.eventType);
        if (filter.severity) text("event_severity", core::toString(*filter.severity));
        if (filter.resourceType) text("resource_type", *filter.resourceType);
        if (filter.resourceId) text("resource_id", *filter.resourceId);
        if (filter.action) text("action", core::toString(*filter.action));
        if (filter.start) integer("ts_micros >= ?", toMicros(*filter.start));
        if (filter.end) integer("ts_micros < ?", toMicros(*filter.end));

        query << " ORDER BY ts_micros DESC LIMIT ? OFFSET ?;";

        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(query.str());
        int index = 1;
        for (const auto& param : order) {
            if (param.first) {
                stmt.bind(index++, textParams[param.second]);
            } else {
                stmt.bind(index++, intParams[param.second]);
            }
        }
        // LIMIT -1 means no limit
        const int64_t limit = filter.limit > static_cast<size_t>(INT64_MAX)
                                  ? int64_t{-1}
                                  : static_cast<int64_t>(filter.limit);
        const int64_t offset = filter.offset > static_cast<size_t>(INT64_MAX)
                                   ? INT64_MAX
                                   : static_cast<int64_t>(filter.offset);
        stmt.bind(index++, limit);
        stmt.bind(index++, offset);

        std::vector<core::AuditEvent> events;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            if (auto event = decode(stmt.columnText(0))) {
                events.push_back(std::move(*event));
            }
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Audit query failed: " + db_.lastError());
        }
        return events;
    }

    size_t purgeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::PURGE_EXPIRED);
        stmt.bind(1, toMicros(core::compat::now()));
        if (stmt.step() != SQLITE_DONE) {
            throw std::runtime_error("Failed to purge expired events: " + db_.lastError());
        }
        auto removed = static_cast<size_t>(db_.changes());
        if (removed > 0) {
            core::logger()->info("Purged {} audit events past retention", removed);
        }
        return removed;
    }

    std::optional<core::compat::Timestamp> retainUntil(const std::string& eventId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare(sql::SELECT_RETENTION);
        stmt.bind(1, eventId);
        if (stmt.step() != SQLITE_ROW) {
            return std::nullopt;
        }
        return fromMicros(stmt.columnInt64(0));
    }

    int retentionDays() const { return retentionDays_; }

private:
    SqliteDatabase db_;
    int retentionDays_;
    std::mutex mutex_;

    void initializeDatabase() {
        db_.exec(sql::CREATE_TABLES);
        auto stmt = db_.prepare("INSERT OR IGNORE INTO schema_version (version) VALUES (?);");
        stmt.bind(1, int64_t{SCHEMA_VERSION});
        if (stmt.step() != SQLITE_DONE) {
            throw std::runtime_error("Failed to record schema version: " + db_.lastError());
        }
    }

    // Returns false when the id already exists
    bool insert(SqliteStatement& stmt, const core::AuditEvent& event, int64_t nowMicros) {
        stmt.bind(1, event.id);
        stmt.bind(2, event.tenantId);
        stmt.bind(3, event.projectId);
        stmt.bind(4, toMicros(event.timestamp));
        stmt.bind(5, core::toString(event.actorType));
        stmt.bind(6, event.actorId);
        stmt.bind(7, event.actorEmail);
        stmt.bind(8, core::toString(event.category));
        stmt.bind(9, event.eventType);
        stmt.bind(10, core::toString(event.severity));
        stmt.bind(11, event.resourceType);
        stmt.bind(12, event.resourceId);
        stmt.bind(13, core::toString(event.action));
        stmt.bind(14, event.hash);
        stmt.bind(15, event.previousHash);
        stmt.bind(16, event.toJson().dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace));
        stmt.bind(17, nowMicros + static_cast<int64_t>(retentionDays_) * MICROS_PER_DAY);

        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return true;
        }
        if (rc == SQLITE_CONSTRAINT) {
            core::logger()->warn("Audit event {} already exists, write rejected", event.id);
            return false;
        }
        throw std::runtime_error("Failed to insert audit event " + event.id + ": " +
                                 db_.lastError());
    }

    void rollback() {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            core::logger()->error("Rollback failed: {}", errMsg ? errMsg : "unknown error");
        }
        sqlite3_free(errMsg);
    }

    std::optional<core::AuditEvent> decode(const std::string& payload) const {
        try {
            return core::AuditEvent::fromJson(nlohmann::json::parse(payload));
        } catch (const nlohmann::json::exception& e) {
            core::logger()->error("Unreadable audit row: {}", e.what());
        } catch (const std::runtime_error& e) {
            core::logger()->error("Malformed audit row: {}", e.what());
        }
        return std::nullopt;
    }
};

SqliteAuditStorage::SqliteAuditStorage(const std::string& dbPath, int retentionDays)
    : impl_(std::make_unique<Impl>(dbPath, retentionDays)) {}

SqliteAuditStorage::~SqliteAuditStorage() = default;

bool SqliteAuditStorage::writeEvent(const core::AuditEvent& event) {
    return impl_->writeEvent(event);
}

size_t SqliteAuditStorage::writeBatch(const std::vector<core::AuditEvent>& events) {
    return impl_->writeBatch(events);
}

std::optional<core::AuditEvent> SqliteAuditStorage::readEvent(const std::string& eventId) {
    return impl_->readEvent(eventId);
}

std::vector<core::AuditEvent> SqliteAuditStorage::query(const core::EventFilter& filter) {
    return impl_->query(filter);
}

size_t SqliteAuditStorage::purgeExpired() {
    return impl_->purgeExpired();
}

std::optional<core::compat::Timestamp> SqliteAuditStorage::retainUntil(const std::string& eventId) {
    return impl_->retainUntil(eventId);
}

int SqliteAuditStorage::retentionDays() const {
    return impl_->retentionDays();
}

} // namespace ledgerseal::storage
