#pragma once

#include "core/core_export.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace ledgerseal::core {

/**
 * @brief Shared "ledgerseal" logger
 *
 * Created on first use with a colored stderr sink at info level.
 */
LEDGERSEAL_CORE_EXPORT std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Reconfigure the shared logger
 * @param level spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 * @param file Log to this file instead of stderr when set
 * @throws std::runtime_error on an unknown level or an unwritable file
 */
LEDGERSEAL_CORE_EXPORT void configureLogging(const std::string& level,
                                             const std::optional<std::string>& file = std::nullopt);

} // namespace ledgerseal::core
