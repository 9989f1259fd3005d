#include "core/Timestamp.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

namespace newsfeed {
namespace core {

namespace {

// Nanosecond time points only span roughly 1678..2261.
constexpr int kMinYear = 1700;
constexpr int kMaxYear = 2200;

const std::array<const char*, 7> kWeekdays = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
const std::array<const char*, 7> kWeekdaysLong = {"sunday", "monday", "tuesday", "wednesday",
                                                  "thursday", "friday", "saturday"};
const std::array<const char*, 12> kMonths = {"jan", "feb", "mar", "apr", "may", "jun",
                                             "jul", "aug", "sep", "oct", "nov", "dec"};
const std::array<const char*, 12> kMonthsLong = {"january", "february", "march", "april",
                                                 "may", "june", "july", "august",
                                                 "september", "october", "november", "december"};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<long long>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

// 0 = Sunday.
int weekdayFromDays(long long days) {
    long long w = (days + 4) % 7;
    if (w < 0) {
        w += 7;
    }
    return static_cast<int>(w);
}

// Reads exactly `count` digits starting at `pos`.
bool readDigits(const std::string& s, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

int indexOfName(const std::string& token, const std::array<const char*, 7>& shortNames,
                const std::array<const char*, 7>& longNames) {
    const std::string lower = toLower(token);
    for (std::size_t i = 0; i < shortNames.size(); ++i) {
        if (lower == shortNames[i] || lower == longNames[i]) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int monthFromName(const std::string& token) {
    const std::string lower = toLower(token);
    for (std::size_t i = 0; i < kMonths.size(); ++i) {
        if (lower == kMonths[i] || lower == kMonthsLong[i]) {
            return static_cast<int>(i) + 1;
        }
    }
    return -1;
}

struct CivilTime {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    long long nanos = 0;
};

bool validate(const CivilTime& t) {
    if (t.year < kMinYear || t.year > kMaxYear) return false;
    if (t.month < 1 || t.month > 12) return false;
    if (t.day < 1 || t.day > daysInMonth(t.year, t.month)) return false;
    if (t.hour > 23 || t.minute > 59 || t.second > 59) return false;
    return true;
}

Timestamp compose(const CivilTime& t, std::chrono::seconds offset) {
    const long long localSeconds = daysFromCivil(t.year, t.month, t.day) * 86400LL
                                 + t.hour * 3600LL + t.minute * 60LL + t.second;
    Timestamp ts;
    ts.offset = offset;
    ts.instant = TimePoint(std::chrono::seconds(localSeconds - offset.count()) +
                           std::chrono::nanoseconds(t.nanos));
    return ts;
}

// "+hhmm" or "-hh:mm"; the colon is optional.
bool readOffset(const std::string& s, std::size_t pos, std::chrono::seconds& offset, std::size_t& consumed) {
    if (pos >= s.size() || (s[pos] != '+' && s[pos] != '-')) {
        return false;
    }
    const int sign = s[pos] == '-' ? -1 : 1;
    int hours = 0;
    int minutes = 0;
    if (!readDigits(s, pos + 1, 2, hours)) {
        return false;
    }
    std::size_t next = pos + 3;
    if (next < s.size() && s[next] == ':') {
        ++next;
    }
    if (!readDigits(s, next, 2, minutes)) {
        return false;
    }
    if (hours > 23 || minutes > 59) {
        return false;
    }
    offset = std::chrono::seconds(sign * (hours * 3600 + minutes * 60));
    consumed = next + 2 - pos;
    return true;
}

} // namespace

std::optional<Timestamp> Timestamp::parseRfc822(const std::string& text) {
    std::istringstream in(trim(text));
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() != 6) {
        return std::nullopt;
    }

    // Weekday, directly followed by a comma
    std::string weekdayToken = tokens[0];
    if (weekdayToken.size() < 2 || weekdayToken.back() != ',') {
        return std::nullopt;
    }
    weekdayToken.pop_back();
    const int weekday = indexOfName(weekdayToken, kWeekdays, kWeekdaysLong);
    if (weekday < 0) {
        return std::nullopt;
    }

    CivilTime t;
    int day = 0;
    if (tokens[1].empty() || tokens[1].size() > 2 || !readDigits(tokens[1], 0, tokens[1].size(), day)) {
        return std::nullopt;
    }
    t.day = static_cast<unsigned>(day);

    const int month = monthFromName(tokens[2]);
    if (month < 0) {
        return std::nullopt;
    }
    t.month = static_cast<unsigned>(month);

    if (tokens[3].size() != 4 || !readDigits(tokens[3], 0, 4, t.year)) {
        return std::nullopt;
    }

    const std::string& clock = tokens[4];
    if (clock.size() != 8 || clock[2] != ':' || clock[5] != ':' ||
        !readDigits(clock, 0, 2, t.hour) || !readDigits(clock, 3, 2, t.minute) ||
        !readDigits(clock, 6, 2, t.second)) {
        return std::nullopt;
    }

    std::chrono::seconds offset{0};
    const std::string zone = toLower(tokens[5]);
    if (zone != "gmt" && zone != "ut" && zone != "utc" && zone != "z") {
        std::size_t consumed = 0;
        if (zone.size() != 5 || !readOffset(zone, 0, offset, consumed) || consumed != zone.size()) {
            return std::nullopt;
        }
    }

    if (!validate(t)) {
        return std::nullopt;
    }
    if (weekdayFromDays(daysFromCivil(t.year, t.month, t.day)) != weekday) {
        return std::nullopt;
    }
    return compose(t, offset);
}

std::optional<Timestamp> Timestamp::parseIso8601(const std::string& text) {
    const std::string s = trim(text);
    CivilTime t;
    int month = 0;
    int day = 0;
    if (s.size() < 20 ||
        !readDigits(s, 0, 4, t.year) || s[4] != '-' ||
        !readDigits(s, 5, 2, month) || s[7] != '-' ||
        !readDigits(s, 8, 2, day)) {
        return std::nullopt;
    }
    t.month = static_cast<unsigned>(month);
    t.day = static_cast<unsigned>(day);

    if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') {
        return std::nullopt;
    }
    if (!readDigits(s, 11, 2, t.hour) || s[13] != ':' ||
        !readDigits(s, 14, 2, t.minute) || s[16] != ':' ||
        !readDigits(s, 17, 2, t.second)) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        const std::size_t start = pos;
        long long nanos = 0;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
        t.nanos = nanos;
    }

    std::chrono::seconds offset{0};
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else {
        std::size_t consumed = 0;
        if (!readOffset(s, pos, offset, consumed)) {
            return std::nullopt;
        }
        pos += consumed;
    }
    if (pos != s.size() || !validate(t)) {
        return std::nullopt;
    }
    return compose(t, offset);
}

std::string Timestamp::toIso8601() const {
    const long long totalNanos = (instant.time_since_epoch() + offset).count();
    long long seconds = totalNanos / 1000000000LL;
    long long nanos = totalNanos % 1000000000LL;
    if (nanos < 0) {
        nanos += 1000000000LL;
        --seconds;
    }
    long long days = seconds / 86400;
    long long secondOfDay = seconds % 86400;
    if (secondOfDay < 0) {
        secondOfDay += 86400;
        --days;
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civilFromDays(days, year, month, day);

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day << 'T'
        << std::setw(2) << secondOfDay / 3600 << ':'
        << std::setw(2) << (secondOfDay / 60) % 60 << ':'
        << std::setw(2) << secondOfDay % 60;

    if (nanos != 0) {
        std::ostringstream fraction;
        fraction << std::setfill('0') << std::setw(9) << nanos;
        std::string digits = fraction.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        out << '.' << digits;
    }

    const long long offsetMinutes = offset.count() / 60;
    out << (offsetMinutes < 0 ? '-' : '+')
        << std::setw(2) << std::llabs(offsetMinutes) / 60 << ':'
        << std::setw(2) << std::llabs(offsetMinutes) % 60;
    return out.str();
}

} // namespace core
} // namespace newsfeed
