#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mwscl
{

/**
 * Point in time together with the UTC offset it was expressed in.
 *
 * The offset is kept as supplied, since MWS signs the rendered
 * string: 2013-01-01T00:00:00-02:00 and 2013-01-01T02:00:00Z denote
 * the same instant but produce different signatures.
 */
class Timestamp
{
public:
    using Clock = std::chrono::system_clock;

    Timestamp() = default;

    /**
     * Construct from an instant and an offset east of UTC in minutes.
     * Throws InvalidParameter if |offsetMinutes| exceeds 23:59.
     */
    explicit Timestamp(Clock::time_point instant, int offsetMinutes = 0);

    /**
     * Current wall-clock time, expressed in UTC, truncated to seconds.
     */
    static Timestamp now();

    /**
     * Parse `YYYY-MM-DDTHH:MM:SS` followed by `Z`, `+HH:MM`, `-HH:MM`,
     * `+HHMM` or `-HHMM`. Fractional seconds are accepted and dropped.
     *
     * Throws InvalidParameter.
     */
    static Timestamp fromIso8601(std::string const& str);

    /**
     * Render as ISO-8601 with seconds precision and explicit offset,
     * e.g. `2013-01-01T00:00:00-02:00`. UTC renders as `+00:00`.
     */
    std::string iso8601() const;

    Clock::time_point instant() const;
    int offsetMinutes() const { return offsetMinutes_; }

    bool operator==(Timestamp const& other) const;
    bool operator!=(Timestamp const& other) const { return !(*this == other); }

private:
    std::int64_t secondsSinceEpoch_ = 0;
    int offsetMinutes_ = 0;
};

}
