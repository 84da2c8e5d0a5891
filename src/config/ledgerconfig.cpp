#include "config/ledgerconfig.hpp"
#include "core/checkpoint/checkpointstore.hpp"
#include "core/crypto/signaturesystem.hpp"
#include "core/digest.hpp"
#include "core/logging.hpp"
#include "core/timestamp/timestampauthority.hpp"
#include "storage/localauditstorage.hpp"
#include "storage/sqliteauditstorage.hpp"
#include "storage/sqlitecheckpointstore.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace ledgerseal::config {

using nlohmann::json;

namespace {

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::runtime_error(std::string("Config key '") + name + "' must be an object");
    }
    return &*it;
}

std::string keyName(const char* sectionName, const char* key) {
    return std::string(sectionName) + "." + key;
}

void readString(const json& obj, const char* sectionName, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    if (!it->is_string()) {
        throw std::runtime_error("Config key '" + keyName(sectionName, key) + "' must be a string");
    }
    out = it->get<std::string>();
}

void readBool(const json& obj, const char* sectionName, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    if (!it->is_boolean()) {
        throw std::runtime_error("Config key '" + keyName(sectionName, key) + "' must be a boolean");
    }
    out = it->get<bool>();
}

/// Reads a non-negative integer; returns false if the key is absent
bool readCount(const json& obj, const char* sectionName, const char* key, int64_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return false;
    }
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw std::runtime_error("Config key '" + keyName(sectionName, key)
                                 + "' must be a non-negative integer");
    }
    out = it->get<int64_t>();
    return true;
}

core::SecureMemory::SecureVector<uint8_t> readSigningKey(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string hex;
    if (!in || !(in >> hex)) {
        throw std::runtime_error("Cannot read timestamp key file: " + path.string());
    }
    auto bytes = core::Digest::fromHex(hex);
    std::fill(hex.begin(), hex.end(), '\0');
    if (!bytes) {
        throw std::runtime_error("Timestamp key file is not hex: " + path.string());
    }
    core::SecureMemory::SecureVector<uint8_t> key(bytes->begin(), bytes->end());
    std::fill(bytes->begin(), bytes->end(), 0);
    return key;
}

core::SecureMemory::SecureVector<uint8_t> createSigningKey(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    core::SignatureSystem signer;
    auto keyPair = signer.generateKeyPair();

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot create timestamp key file: " + path.string());
        }
        out << core::Digest::toHex(keyPair.privateKey.data(), keyPair.privateKey.size()) << "\n";
        if (!out.flush()) {
            throw std::runtime_error("Cannot write timestamp key file: " + path.string());
        }
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    core::logger()->info("Generated timestamp authority key {}", path.string());
    return std::move(keyPair.privateKey);
}

} // anonymous namespace

LedgerConfig LedgerConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    LedgerConfig config;
    int64_t value = 0;

    if (const json* capture = section(root, "capture")) {
        if (readCount(*capture, "capture", "batch_size", value)) {
            if (value == 0) {
                throw std::runtime_error("Config key 'capture.batch_size' must be positive");
            }
            config.capture.batchSize = static_cast<size_t>(value);
        }
        if (readCount(*capture, "capture", "batch_interval_ms", value)) {
            if (value == 0) {
                throw std::runtime_error("Config key 'capture.batch_interval_ms' must be positive");
            }
            config.capture.batchInterval = core::compat::milliseconds(value);
        }
        readBool(*capture, "capture", "enable_deduplication", config.capture.enableDeduplication);
        if (readCount(*capture, "capture", "deduplication_window_s", value)) {
            config.capture.deduplicationWindow = core::compat::seconds(value);
        }
        readBool(*capture, "capture", "strict_event_types", config.capture.strictEventTypes);
    }

    if (const json* storage = section(root, "storage")) {
        readString(*storage, "storage", "backend", config.storage.backend);
        if (config.storage.backend != "local" && config.storage.backend != "sqlite") {
            throw std::runtime_error("Config key 'storage.backend' must be \"local\" or \"sqlite\"");
        }
        readString(*storage, "storage", "path", config.storage.path);
        if (readCount(*storage, "storage", "retention_days", value)) {
            config.storage.retentionDays = static_cast<int>(value);
        }
    }

    if (const json* checkpoints = section(root, "checkpoints")) {
        readString(*checkpoints, "checkpoints", "path", config.checkpoints.path);
    }

    if (const json* timestamp = section(root, "timestamp")) {
        if (readCount(*timestamp, "timestamp", "clock_skew_tolerance_s", value)) {
            config.timestamp.clockSkewTolerance = core::compat::seconds(value);
        }
        readString(*timestamp, "timestamp", "authority_name", config.timestamp.authorityName);
        readString(*timestamp, "timestamp", "key_file", config.timestamp.keyFile);
    }
    if (!config.checkpoints.path.empty() && config.timestamp.keyFile.empty()) {
        throw std::runtime_error(
            "Config key 'timestamp.key_file' is required when 'checkpoints.path' is set");
    }

    if (const json* logging = section(root, "logging")) {
        readString(*logging, "logging", "level", config.logging.level);
        std::string file;
        readString(*logging, "logging", "file", file);
        if (!file.empty()) {
            config.logging.file = file;
        }
    }

    return config;
}

LedgerConfig LedgerConfig::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    return fromJson(root);
}

json LedgerConfig::toJson() const {
    json result = {
        {"capture", {
            {"batch_size", capture.batchSize},
            {"batch_interval_ms", capture.batchInterval.count()},
            {"enable_deduplication", capture.enableDeduplication},
            {"deduplication_window_s", capture.deduplicationWindow.count()},
            {"strict_event_types", capture.strictEventTypes}
        }},
        {"storage", {
            {"backend", storage.backend},
            {"path", storage.path},
            {"retention_days", storage.retentionDays}
        }},
        {"checkpoints", {{"path", checkpoints.path}}},
        {"timestamp", {
            {"clock_skew_tolerance_s", timestamp.clockSkewTolerance.count()},
            {"authority_name", timestamp.authorityName},
            {"key_file", timestamp.keyFile}
        }},
        {"logging", {{"level", logging.level}}}
    };
    if (logging.file) {
        result["logging"]["file"] = *logging.file;
    }
    return result;
}

std::unique_ptr<storage::AuditStorage> createStorage(const StorageConfig& config) {
    if (config.backend == "local") {
        return std::make_unique<storage::LocalAuditStorage>(config.path);
    }
    if (config.backend == "sqlite") {
        return std::make_unique<storage::SqliteAuditStorage>(config.path, config.retentionDays);
    }
    throw std::runtime_error("Unknown storage backend: " + config.backend);
}

std::unique_ptr<core::CheckpointStore> createCheckpointStore(const CheckpointConfig& config) {
    if (config.path.empty()) {
        return std::make_unique<core::MemoryCheckpointStore>();
    }
    return std::make_unique<storage::SqliteCheckpointStore>(config.path);
}

std::unique_ptr<core::TimestampAuthority> createTimestampAuthority(const TimestampConfig& config) {
    if (config.keyFile.empty()) {
        core::logger()->warn("Timestamp authority {} uses a new key; its tokens will not verify "
                             "after a restart", config.authorityName);
        return std::make_unique<core::LocalTimestampAuthority>(config.authorityName,
                                                               config.clockSkewTolerance);
    }

    const std::filesystem::path path(config.keyFile);
    auto key = std::filesystem::exists(path) ? readSigningKey(path) : createSigningKey(path);
    return std::make_unique<core::LocalTimestampAuthority>(std::move(key), config.authorityName,
                                                           config.clockSkewTolerance);
}

void applyLogging(const LoggingConfig& config) {
    core::configureLogging(config.level, config.file);
}

} // namespace ledgerseal::config
