#include "core/logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <stdexcept>

namespace ledgerseal::core {

namespace {

constexpr const char* LOGGER_NAME = "ledgerseal";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

std::mutex loggerMutex;
std::shared_ptr<spdlog::logger> sharedLogger;

std::shared_ptr<spdlog::logger> makeLogger(spdlog::sink_ptr sink) {
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    log->set_pattern(LOG_PATTERN);
    return log;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (!sharedLogger) {
        sharedLogger = makeLogger(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        sharedLogger->set_level(spdlog::level::info);
    }
    return sharedLogger;
}

void configureLogging(const std::string& level, const std::optional<std::string>& file) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::runtime_error("Unknown log level: " + level);
    }

    spdlog::sink_ptr sink;
    try {
        if (file) {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*file);
        } else {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        }
    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error(std::string("Failed to open log sink: ") + e.what());
    }

    auto log = makeLogger(std::move(sink));
    log->set_level(parsed);
    log->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(loggerMutex);
    sharedLogger = std::move(log);
}

} // namespace ledgerseal::core
