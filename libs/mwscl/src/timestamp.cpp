#include "mwscl/timestamp.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/log.hpp"

#include <cctype>
#include <cstdlib>

#include "spdlog/fmt/fmt.h"
#include "stx/format.h"

namespace mwscl
{

namespace
{

constexpr int MAX_OFFSET_MINUTES = 23 * 60 + 59;
constexpr std::int64_t SECONDS_PER_DAY = 86400;

/**
 * Days since 1970-01-01 of the given proleptic Gregorian date.
 * See http://howardhinnant.github.io/date_algorithms.html
 */
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d)
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

unsigned daysInMonth(std::int64_t y, unsigned m)
{
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return (m == 2 && leap) ? 29u : days[m - 1];
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b)
{
    auto q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

bool readDigits(std::string const& s, std::size_t& pos, std::size_t count, int& out)
{
    if (pos + count > s.size())
        return false;
    out = 0;
    for (std::size_t i = 0; i < count; ++i) {
        auto c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c))
            return false;
        out = out * 10 + (c - '0');
    }
    pos += count;
    return true;
}

bool expect(std::string const& s, std::size_t& pos, char c)
{
    if (pos >= s.size() || s[pos] != c)
        return false;
    ++pos;
    return true;
}

InvalidParameter timestampError(char const* reason, std::string const& input)
{
    return logRuntimeError<InvalidParameter>(
        stx::format("[Timestamp] {} in '{}'", reason, input), "timestamp");
}

}

Timestamp::Timestamp(Clock::time_point instant, int offsetMinutes)
    : secondsSinceEpoch_(std::chrono::floor<std::chrono::seconds>(instant).time_since_epoch().count()),
      offsetMinutes_(offsetMinutes)
{
    if (std::abs(offsetMinutes) > MAX_OFFSET_MINUTES)
        throw logRuntimeError<InvalidParameter>(
            stx::format("[Timestamp] UTC offset of {} minutes is out of range", offsetMinutes),
            "timestamp");
}

Timestamp Timestamp::now()
{
    return Timestamp(Clock::now());
}

Timestamp Timestamp::fromIso8601(std::string const& str)
{
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!readDigits(str, pos, 4, year) || !expect(str, pos, '-') ||
        !readDigits(str, pos, 2, month) || !expect(str, pos, '-') ||
        !readDigits(str, pos, 2, day) || !expect(str, pos, 'T') ||
        !readDigits(str, pos, 2, hour) || !expect(str, pos, ':') ||
        !readDigits(str, pos, 2, minute) || !expect(str, pos, ':') ||
        !readDigits(str, pos, 2, second))
        throw timestampError("Malformed date/time", str);

    if (month < 1 || month > 12 ||
        day < 1 || static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month)) ||
        hour > 23 || minute > 59 || second > 59)
        throw timestampError("Date/time out of range", str);

    // Fractional seconds are dropped.
    if (expect(str, pos, '.')) {
        auto fractionBegin = pos;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos])))
            ++pos;
        if (pos == fractionBegin)
            throw timestampError("Malformed fractional seconds", str);
    }

    int offset = 0;
    if (expect(str, pos, 'Z')) {
        offset = 0;
    }
    else if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
        const int sign = str[pos++] == '-' ? -1 : 1;
        int offsetHours = 0, offsetMinutes = 0;
        if (!readDigits(str, pos, 2, offsetHours))
            throw timestampError("Malformed UTC offset", str);
        expect(str, pos, ':');
        if (!readDigits(str, pos, 2, offsetMinutes))
            throw timestampError("Malformed UTC offset", str);
        if (offsetHours > 23 || offsetMinutes > 59)
            throw timestampError("UTC offset out of range", str);
        offset = sign * (offsetHours * 60 + offsetMinutes);
    }
    else
        throw timestampError("Missing UTC offset", str);

    if (pos != str.size())
        throw timestampError("Trailing characters", str);

    const std::int64_t local =
        daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * SECONDS_PER_DAY +
        hour * 3600 + minute * 60 + second;

    Timestamp result;
    result.secondsSinceEpoch_ = local - static_cast<std::int64_t>(offset) * 60;
    result.offsetMinutes_ = offset;
    return result;
}

std::string Timestamp::iso8601() const
{
    const std::int64_t local = secondsSinceEpoch_ + static_cast<std::int64_t>(offsetMinutes_) * 60;
    const std::int64_t days = floorDiv(local, SECONDS_PER_DAY);
    const std::int64_t secondOfDay = local - days * SECONDS_PER_DAY;

    std::int64_t year = 0;
    unsigned month = 0, day = 0;
    civilFromDays(days, year, month, day);

    const int absOffset = std::abs(offsetMinutes_);
    return fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{:02}:{:02}",
        year, month, day,
        secondOfDay / 3600, (secondOfDay % 3600) / 60, secondOfDay % 60,
        offsetMinutes_ < 0 ? '-' : '+',
        absOffset / 60, absOffset % 60);
}

Timestamp::Clock::time_point Timestamp::instant() const
{
    return Clock::time_point(std::chrono::seconds(secondsSinceEpoch_));
}

bool Timestamp::operator==(Timestamp const& other) const
{
    return secondsSinceEpoch_ == other.secondsSinceEpoch_ &&
        offsetMinutes_ == other.offsetMinutes_;
}

}
