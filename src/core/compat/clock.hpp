#pragma once

#include "core/core_export.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace ledgerseal::core::compat {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

using microseconds = std::chrono::microseconds;
using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;

/**
 * @brief Current UTC instant truncated to microsecond precision
 *
 * Audit timestamps are stored and hashed with microsecond precision, so
 * every instant entering the ledger goes through this truncation.
 */
LEDGERSEAL_CORE_EXPORT Timestamp now();

LEDGERSEAL_CORE_EXPORT Timestamp truncateToMicros(Timestamp tp);

/**
 * @brief Format an instant as ISO-8601 UTC, e.g. 2024-03-01T12:00:00.000250Z
 */
LEDGERSEAL_CORE_EXPORT std::string toIso8601(Timestamp tp);

/**
 * @brief Parse an ISO-8601 instant
 *
 * Accepts a trailing "Z" or a numeric offset ("+00:00", "-05:30") and an
 * optional fraction of up to nine digits (truncated to microseconds).
 * @return Instant in UTC or nullopt if the text is malformed
 */
LEDGERSEAL_CORE_EXPORT std::optional<Timestamp> parseIso8601(const std::string& text);

/**
 * @brief Calendar date in the proleptic Gregorian calendar (UTC)
 */
struct LEDGERSEAL_CORE_EXPORT CivilDate {
    int year{1970};
    unsigned month{1};
    unsigned day{1};

    static CivilDate fromTimestamp(Timestamp tp);
    static std::optional<CivilDate> parse(const std::string& text);

    /// YYYY-MM-DD
    std::string toString() const;
    Timestamp startOfDay() const;
    CivilDate next() const;
    CivilDate previous() const;

    bool operator==(const CivilDate& other) const;
    bool operator!=(const CivilDate& other) const { return !(*this == other); }
    bool operator<(const CivilDate& other) const;
    bool operator<=(const CivilDate& other) const { return !(other < *this); }
};

} // namespace ledgerseal::core::compat
