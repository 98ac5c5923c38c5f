#include "warden/clock.hpp"
#include <cctype>
#include <charconv>
#include <format>

namespace warden
{

    namespace
    {
        bool read_int(const std::string &text, std::size_t pos, std::size_t len, int &out)
        {
            if (pos + len > text.size())
                return false;
            auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
            return ec == std::errc{} && ptr == text.data() + pos + len;
        }
    } // namespace

    Timestamp SystemClock::now() const
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    }

    std::string format_iso8601(Timestamp ts)
    {
        auto days = std::chrono::floor<std::chrono::days>(ts);
        std::chrono::year_month_day ymd{days};
        std::chrono::hh_mm_ss<std::chrono::milliseconds> hms{ts - days};

        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           static_cast<int>(ymd.year()),
                           static_cast<unsigned>(ymd.month()),
                           static_cast<unsigned>(ymd.day()),
                           hms.hours().count(),
                           hms.minutes().count(),
                           static_cast<int>(hms.seconds().count()),
                           static_cast<int>(hms.subseconds().count()));
    }

    Result<Timestamp> parse_iso8601(const std::string &text)
    {
        auto fail = [&text]()
        {
            return std::unexpected(WardenError::invalid_input("Invalid ISO 8601 timestamp: " + text));
        };

        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
            text[13] != ':' || text[16] != ':')
            return fail();
        if (!read_int(text, 0, 4, y) || !read_int(text, 5, 2, mo) || !read_int(text, 8, 2, d) ||
            !read_int(text, 11, 2, h) || !read_int(text, 14, 2, mi) || !read_int(text, 17, 2, s))
            return fail();

        std::size_t pos = 19;
        int millis = 0;
        if (text[pos] == '.')
        {
            ++pos;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                if (digits < 3)
                    millis = millis * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0)
                return fail();
            for (; digits < 3; ++digits)
                millis *= 10;
        }
        if (pos + 1 != text.size() || text[pos] != 'Z')
            return fail();

        std::chrono::year_month_day ymd{std::chrono::year{y},
                                        std::chrono::month{static_cast<unsigned>(mo)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
        if (!ymd.ok() || h > 23 || mi > 59 || s > 59)
            return fail();

        return Timestamp{std::chrono::sys_days{ymd}.time_since_epoch() +
                         std::chrono::hours{h} + std::chrono::minutes{mi} +
                         std::chrono::seconds{s} + std::chrono::milliseconds{millis}};
    }

} // namespace warden
