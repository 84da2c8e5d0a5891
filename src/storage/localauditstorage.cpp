#include "storage/localauditstorage.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace ledgerseal::storage {

namespace fs = std::filesystem;

namespace {

constexpr const char* EVENT_EXTENSION = ".json";

bool isPathSafe(const std::string& name) {
    if (name.empty() || name.size() > 255 || name[0] == '.') {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

std::optional<int> numericComponent(const fs::path& path) {
    const auto text = path.filename().string();
    if (text.empty() || text.size() > 4) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

std::vector<fs::path> sortedSubdirectories(const fs::path& dir) {
    std::vector<fs::path> result;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return result;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) {
            result.push_back(entry.path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // anonymous namespace

class LocalAuditStorage::Impl {
public:
    explicit Impl(fs::path basePath) : basePath_(std::move(basePath)) {
        try {
            fs::create_directories(basePath_);
            rebuildIndex();
        } catch (const fs::filesystem_error& e) {
            throw std::runtime_error("Failed to open audit storage at " +
                                     basePath_.string() + ": " + e.what());
        }
        core::logger()->info("Local audit storage at {} ({} events indexed)",
                             basePath_.string(), index_.size());
    }

    fs::path eventPath(const core::AuditEvent& event) const {
        auto date = core::compat::CivilDate::fromTimestamp(event.timestamp);
        char year[8], month[4], day[4];
        std::snprintf(year, sizeof(year), "%04d", date.year);
        std::snprintf(month, sizeof(month), "%02u", date.month);
        std::snprintf(day, sizeof(day), "%02u", date.day);
        return basePath_ / event.tenantId / year / month / day / (event.id + EVENT_EXTENSION);
    }

    bool writeEvent(const core::AuditEvent& event) {
        if (!isPathSafe(event.tenantId) || !isPathSafe(event.id)) {
            core::logger()->warn("Rejected audit event with unsafe id {} / tenant {}",
                                 event.id, event.tenantId);
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.count(event.id) > 0) {
            core::logger()->warn("Audit event {} already exists, write rejected", event.id);
            return false;
        }

        const auto path = eventPath(event);
        if (fs::exists(path)) {
            index_.emplace(event.id, path);
            core::logger()->warn("Audit event {} already exists, write rejected", event.id);
            return false;
        }

        fs::create_directories(path.parent_path());
        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw std::runtime_error("Failed to create " + temp.string());
            }
            file << event.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            if (!file) {
                file.close();
                fs::remove(temp);
                throw std::runtime_error("Failed to write " + temp.string());
            }
        }
        fs::rename(temp, path);
        fs::permissions(path,
                        fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                        fs::perm_options::replace);

        index_.emplace(event.id, path);
        return true;
    }

    std::optional<core::AuditEvent> readEvent(const std::string& eventId) {
        fs::path path;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(eventId);
            if (it == index_.end()) {
                return std::nullopt;
            }
            path = it->second;
        }
        return loadEvent(path);
    }

    std::vector<core::AuditEvent> query(const core::EventFilter& filter) {
        std::vector<fs::path> tenantDirs;
        if (filter.tenantId) {
            if (!isPathSafe(*filter.tenantId)) {
                return {};
            }
            tenantDirs.push_back(basePath_ / *filter.tenantId);
        } else {
            tenantDirs = sortedSubdirectories(basePath_);
        }

        std::optional<core::compat::CivilDate> firstDay;
        std::optional<core::compat::CivilDate> lastDay;
        if (filter.start) {
            firstDay = core::compat::CivilDate::fromTimestamp(*filter.start);
        }
        if (filter.end) {
            lastDay = core::compat::CivilDate::fromTimestamp(*filter.end);
        }

        std::vector<core::AuditEvent> matches;
        for (const auto& tenantDir : tenantDirs) {
            for (const auto& dayDir : dayDirectories(tenantDir, firstDay, lastDay)) {
                for (const auto& entry : fs::directory_iterator(dayDir)) {
                    if (!entry.is_regular_file() ||
                        entry.path().extension() != EVENT_EXTENSION) {
                        continue;
                    }
                    auto event = loadEvent(entry.path());
                    if (event && filter.matches(*event)) {
                        matches.push_back(std::move(*event));
                    }
                }
            }
        }
        return paginate(std::move(matches), filter);
    }

    const fs::path& basePath() const { return basePath_; }

private:
    fs::path basePath_;
    std::mutex mutex_;
    std::unordered_map<std::string, fs::path> index_;

    void rebuildIndex() {
        for (const auto& entry : fs::recursive_directory_iterator(basePath_)) {
            if (entry.is_regular_file() && entry.path().extension() == EVENT_EXTENSION) {
                index_.emplace(entry.path().stem().string(), entry.path());
            }
        }
    }

    std::vector<fs::path> dayDirectories(const fs::path& tenantDir,
                                         const std::optional<core::compat::CivilDate>& firstDay,
                                         const std::optional<core::compat::CivilDate>& lastDay) {
        std::vector<fs::path> result;
        for (const auto& yearDir : sortedSubdirectories(tenantDir)) {
            for (const auto& monthDir : sortedSubdirectories(yearDir)) {
                for (const auto& dayDir : sortedSubdirectories(monthDir)) {
                    auto year = numericComponent(yearDir);
                    auto month = numericComponent(monthDir);
                    auto day = numericComponent(dayDir);
                    if (!year || !month || !day) {
                        continue;
                    }
                    core::compat::CivilDate date{*year, static_cast<unsigned>(*month),
                                                 static_cast<unsigned>(*day)};
                    if ((firstDay && date < *firstDay) || (lastDay && *lastDay < date)) {
                        continue;
                    }
                    result.push_back(dayDir);
                }
            }
        }
        return result;
    }

    std::optional<core::AuditEvent> loadEvent(const fs::path& path) const {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            core::logger()->error("Failed to open audit record {}", path.string());
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            return core::AuditEvent::fromJson(nlohmann::json::parse(buffer.str()));
        } catch (const nlohmann::json::exception& e) {
            core::logger()->error("Unreadable audit record {}: {}", path.string(), e.what());
        } catch (const std::runtime_error& e) {
            core::logger()->error("Malformed audit record {}: {}", path.string(), e.what());
        }
        return std::nullopt;
    }
};

LocalAuditStorage::LocalAuditStorage(std::filesystem::path basePath)
    : impl_(std::make_unique<Impl>(std::move(basePath))) {}

LocalAuditStorage::~LocalAuditStorage() = default;

bool LocalAuditStorage::writeEvent(const core::AuditEvent& event) {
    try {
        return impl_->writeEvent(event);
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::string("Audit storage write failed: ") + e.what());
    }
}

std::optional<core::AuditEvent> LocalAuditStorage::readEvent(const std::string& eventId) {
    return impl_->readEvent(eventId);
}

std::vector<core::AuditEvent> LocalAuditStorage::query(const core::EventFilter& filter) {
    try {
        return impl_->query(filter);
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::string("Audit storage query failed: ") + e.what());
    }
}

const std::filesystem::path& LocalAuditStorage::basePath() const {
    return impl_->basePath();
}

std::filesystem::path LocalAuditStorage::eventPath(const core::AuditEvent& event) const {
    return impl_->eventPath(event);
}

} // namespace ledgerseal::storage
