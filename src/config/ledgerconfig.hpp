#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "service/auditservice.hpp"
#include "storage/auditstorage.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace ledgerseal::core {
class CheckpointStore;
class TimestampAuthority;
}

namespace ledgerseal::config {

struct LEDGERSEAL_CORE_EXPORT StorageConfig {
    /// "local" (filesystem) or "sqlite"
    std::string backend{"local"};
    std::string path{"audit_logs"};
    int retentionDays{2555};
};

struct LEDGERSEAL_CORE_EXPORT CheckpointConfig {
    /// SQLite file; empty keeps checkpoints in memory
    std::string path;
};

struct LEDGERSEAL_CORE_EXPORT TimestampConfig {
    core::compat::seconds clockSkewTolerance{300};
    std::string authorityName{"ledgerseal-local"};
    /// Hex Ed25519 private key of the local authority, generated if missing.
    /// Empty gives a new key per process.
    std::string keyFile;
};

struct LEDGERSEAL_CORE_EXPORT LoggingConfig {
    std::string level{"info"};
    std::optional<std::string> file;
};

/**
 * @brief Ledger settings, loadable from JSON
 *
 * Layout:
 * @code
 * {
 *   "capture":     { "batch_size": 100, "batch_interval_ms": 5000,
 *                    "enable_deduplication": true, "deduplication_window_s": 60,
 *                    "strict_event_types": false },
 *   "storage":     { "backend": "sqlite", "path": "audit.db", "retention_days": 2555 },
 *   "checkpoints": { "path": "checkpoints.db" },
 *   "timestamp":   { "clock_skew_tolerance_s": 300, "authority_name": "ledgerseal-local",
 *                    "key_file": "tsa.key" },
 *   "logging":     { "level": "info", "file": "ledgerseal.log" }
 * }
 * @endcode
 * Every key is optional, except that "timestamp.key_file" is required
 * once "checkpoints.path" is set: stored tokens must stay verifiable after
 * a restart. Unknown keys are ignored.
 */
struct LEDGERSEAL_CORE_EXPORT LedgerConfig {
    service::CaptureConfig capture;
    StorageConfig storage;
    CheckpointConfig checkpoints;
    TimestampConfig timestamp;
    LoggingConfig logging;

    /**
     * @throws std::runtime_error naming the offending key on a wrong type
     *         or an out-of-range value
     */
    static LedgerConfig fromJson(const nlohmann::json& json);

    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static LedgerConfig loadFromFile(const std::string& path);

    nlohmann::json toJson() const;
};

/**
 * @brief Build the configured event store
 * @throws std::runtime_error on an unknown backend or if the store cannot be opened
 */
LEDGERSEAL_CORE_EXPORT std::unique_ptr<storage::AuditStorage> createStorage(const StorageConfig& config);

/**
 * @brief Build the configured checkpoint store
 */
LEDGERSEAL_CORE_EXPORT std::unique_ptr<core::CheckpointStore> createCheckpointStore(const CheckpointConfig& config);

/**
 * @brief Local timestamp authority with the configured name and skew tolerance
 *
 * Signs with the key in config.keyFile, creating the file with a new key
 * (owner read/write only) if it does not exist.
 * @throws std::runtime_error if the key file cannot be read, written or decoded
 */
LEDGERSEAL_CORE_EXPORT std::unique_ptr<core::TimestampAuthority> createTimestampAuthority(const TimestampConfig& config);

/**
 * @brief Point the shared logger at the configured level and sink
 * @throws std::runtime_error on an unknown level or an unwritable file
 */
LEDGERSEAL_CORE_EXPORT void applyLogging(const LoggingConfig& config);

} // namespace ledgerseal::config
