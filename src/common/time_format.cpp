// ---------------------------------------------------------------------------
// time_format.cpp
// ---------------------------------------------------------------------------

#include "common/time_format.hpp"

#include <charconv>

#include <spdlog/spdlog.h>

namespace {

// 내부 헬퍼: 고정 폭 10진수 필드를 읽는다. 실패 시 std::nullopt.
[[nodiscard]] std::optional<int> read_fixed(std::string_view text, std::size_t pos, std::size_t width) {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value{0};
    const char* begin = text.data() + pos;
    const char* end   = begin + width;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// 내부 헬퍼: 1970-01-01 기준 일수 (proleptic Gregorian).
[[nodiscard]] std::chrono::sys_days to_sys_days(int y, int m, int d) {
    return std::chrono::sys_days{std::chrono::year{y} / std::chrono::month{static_cast<unsigned>(m)}
                                 / std::chrono::day{static_cast<unsigned>(d)}};
}

}  // namespace

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto micros_total = duration_cast<microseconds>(tp.time_since_epoch());
    const auto day_point    = floor<days>(sys_time<microseconds>{micros_total});
    const year_month_day ymd{day_point};
    const auto in_day = sys_time<microseconds>{micros_total} - day_point;
    const hh_mm_ss hms{in_day};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       hms.subseconds().count());
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    // YYYY-MM-DDTHH:MM:SS 최소 19자
    if (text.size() < 19 || text[4] != '-' || text[7] != '-'
        || (text[10] != 'T' && text[10] != 't' && text[10] != ' ')
        || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    const auto y  = read_fixed(text, 0, 4);
    const auto mo = read_fixed(text, 5, 2);
    const auto d  = read_fixed(text, 8, 2);
    const auto h  = read_fixed(text, 11, 2);
    const auto mi = read_fixed(text, 14, 2);
    const auto s  = read_fixed(text, 17, 2);
    if (!y || !mo || !d || !h || !mi || !s) {
        return std::nullopt;
    }
    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                             day{static_cast<unsigned>(*d)}};
    if (!ymd.ok() || *h > 23 || *mi > 59 || *s > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;

    // 소수 초: 자릿수 가변, 마이크로초까지만 사용
    std::int64_t micros{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    // 오프셋: 없으면 UTC 로 간주
    minutes offset{0};
    if (pos < text.size()) {
        const char tz = text[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            const auto oh = read_fixed(text, pos + 1, 2);
            std::optional<int> om;
            if (pos + 3 < text.size() && text[pos + 3] == ':') {
                om = read_fixed(text, pos + 4, 2);
                pos += 6;
            } else {
                om = read_fixed(text, pos + 3, 2);
                pos += 5;
            }
            if (!oh || !om) {
                return std::nullopt;
            }
            offset = hours{*oh} + minutes{*om};
            if (tz == '-') {
                offset = -offset;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const auto tp = to_sys_days(*y, *mo, *d) + hours{*h} + minutes{*mi} + seconds{*s}
                    + microseconds{micros} - offset;
    return time_point_cast<system_clock::duration>(tp);
}

std::chrono::system_clock::time_point now_micros() {
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(
        floor<microseconds>(system_clock::now()));
}
