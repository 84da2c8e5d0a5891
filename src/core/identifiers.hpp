#pragma once

#include "core/core_export.hpp"
#include <string>

namespace ledgerseal::core {

/**
 * @brief Generate a random RFC 4122 version 4 UUID (lowercase, hyphenated)
 * @throws std::runtime_error if the random source fails
 */
LEDGERSEAL_CORE_EXPORT std::string generateUuid();

/**
 * @brief Generate @p bytes random bytes rendered as hex
 */
LEDGERSEAL_CORE_EXPORT std::string randomHex(size_t bytes);

} // namespace ledgerseal::core
