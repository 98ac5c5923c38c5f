#pragma once

#include "types.hpp"
#include <chrono>
#include <string>

namespace warden
{

    using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

    /**
     * Clock collaborator used for occurrence and insertion timestamps.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual Timestamp now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        Timestamp now() const override;
    };

    /** ISO 8601 UTC with millisecond precision, e.g. 2025-12-11T08:30:00.123Z */
    std::string format_iso8601(Timestamp ts);

    /**
     * Parse an ISO 8601 UTC timestamp. Accepts an optional fractional part
     * (milliseconds, extra digits truncated) and requires the Z suffix.
     */
    Result<Timestamp> parse_iso8601(const std::string &text);

} // namespace warden
