#include "core/compat/clock.hpp"
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <tuple>

namespace ledgerseal::core::compat {

namespace {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t SECONDS_PER_DAY = 86400;

// Days since 1970-01-01 for a civil date (H. Hinnant's algorithm).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2)), m, d};
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

unsigned daysInMonth(int year, unsigned month) {
    static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return table[month - 1];
}

bool readDigits(const std::string& text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // anonymous namespace

Timestamp truncateToMicros(Timestamp tp) {
    return std::chrono::time_point_cast<microseconds>(tp);
}

Timestamp now() {
    return truncateToMicros(Clock::now());
}

std::string toIso8601(Timestamp tp) {
    const int64_t micros = std::chrono::duration_cast<microseconds>(
        tp.time_since_epoch()).count();
    const int64_t secs = floorDiv(micros, MICROS_PER_SECOND);
    const int64_t frac = micros - secs * MICROS_PER_SECOND;
    const int64_t days = floorDiv(secs, SECONDS_PER_DAY);
    const int64_t secOfDay = secs - days * SECONDS_PER_DAY;

    CivilDate date = civilFromDays(days);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  date.year, date.month, date.day,
                  static_cast<int>(secOfDay / 3600),
                  static_cast<int>((secOfDay % 3600) / 60),
                  static_cast<int>(secOfDay % 60),
                  static_cast<long long>(frac));
    return buf;
}

std::optional<Timestamp> parseIso8601(const std::string& text) {
    size_t pos = 0;
    int year, month, day, hour, minute, second;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month)) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            return std::nullopt;
        }
        for (size_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int offH, offM;
        if (!readDigits(text, pos, 2, offH) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, offM) || offH > 23 || offM > 59) {
            return std::nullopt;
        }
        offsetSeconds = sign * (offH * 3600 + offM * 60);
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second - offsetSeconds;
    return Timestamp(microseconds(secs * MICROS_PER_SECOND + micros));
}

CivilDate CivilDate::fromTimestamp(Timestamp tp) {
    const int64_t micros = std::chrono::duration_cast<microseconds>(
        tp.time_since_epoch()).count();
    return civilFromDays(floorDiv(floorDiv(micros, MICROS_PER_SECOND), SECONDS_PER_DAY));
}

std::optional<CivilDate> CivilDate::parse(const std::string& text) {
    size_t pos = 0;
    int year, month, day;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day) || pos != text.size()) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }
    return CivilDate{year, static_cast<unsigned>(month), static_cast<unsigned>(day)};
}

std::string CivilDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

Timestamp CivilDate::startOfDay() const {
    int64_t days = daysFromCivil(year, month, day);
    return Timestamp(seconds(days * SECONDS_PER_DAY));
}

CivilDate CivilDate::next() const {
    return civilFromDays(daysFromCivil(year, month, day) + 1);
}

CivilDate CivilDate::previous() const {
    return civilFromDays(daysFromCivil(year, month, day) - 1);
}

bool CivilDate::operator==(const CivilDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool CivilDate::operator<(const CivilDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

} // namespace ledgerseal::core::compat
