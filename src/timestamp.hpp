#pragma once

// Internal header, not installed.
// ISO-8601 UTC timestamps with millisecond precision ("...T12:34:56.789Z").

#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace docpatch_cpp::detail {

using TimePoint = std::chrono::system_clock::time_point;

inline auto format_timestamp(TimePoint tp) -> std::string {
    using namespace std::chrono;
    const auto ms = floor<milliseconds>(tp);
    const auto day = floor<days>(ms);
    const auto ymd = year_month_day{day};
    const auto tod = hh_mm_ss<milliseconds>{ms - day};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<int>(tod.subseconds().count()));
    return std::string{buf};
}

inline auto parse_timestamp(std::string_view text) -> std::optional<TimePoint> {
    using namespace std::chrono;
    // Exactly "YYYY-MM-DDTHH:MM:SS.mmmZ".
    if (text.size() != 24 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':' || text[19] != '.' || text[23] != 'Z') {
        return std::nullopt;
    }
    auto digits = [&](std::size_t pos, std::size_t len) -> std::optional<int> {
        int v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            if (text[i] < '0' || text[i] > '9') return std::nullopt;
            v = v * 10 + (text[i] - '0');
        }
        return v;
    };
    auto y = digits(0, 4), mo = digits(5, 2), d = digits(8, 2);
    auto h = digits(11, 2), mi = digits(14, 2), s = digits(17, 2), ms = digits(20, 3);
    if (!y || !mo || !d || !h || !mi || !s || !ms) return std::nullopt;

    const auto ymd = year{*y} / month{static_cast<unsigned>(*mo)} / day{static_cast<unsigned>(*d)};
    if (!ymd.ok() || *h > 23 || *mi > 59 || *s > 59) return std::nullopt;

    return TimePoint{sys_days{ymd} + hours{*h} + minutes{*mi} + seconds{*s} +
                     milliseconds{*ms}};
}

}  // namespace docpatch_cpp::detail
