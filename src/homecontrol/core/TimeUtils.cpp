#include "core/TimeUtils.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace HC {

namespace {

bool gmtime_utc(std::time_t value, std::tm& out) {
    return gmtime_r(&value, &out) != nullptr;
}

auto malformed(std::string_view text) -> Error {
    return Error{Error::Code::MalformedInput, "invalid timestamp '" + std::string{text} + "'"};
}

bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    auto const* first = text.data() + pos;
    auto        result = std::from_chars(first, first + count, out);
    if (result.ec != std::errc{} || result.ptr != first + count) {
        return false;
    }
    pos += count;
    return true;
}

bool expect_char(std::string_view text, std::size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

auto format_timestamp(Timestamp tp) -> std::string {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis       = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds_part);
    if (millis.count() < 0) {
        seconds_part -= std::chrono::seconds{1};
        millis += std::chrono::seconds{1};
    }
    std::time_t raw = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm     tm{};
    if (!gmtime_utc(raw, tm)) {
        return "1970-01-01T00:00:00.000Z";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << millis.count();
    oss << 'Z';
    return oss.str();
}

auto parse_timestamp(std::string_view text) -> Expected<Timestamp> {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, pos, 4, year) || !expect_char(text, pos, '-')
        || !read_digits(text, pos, 2, month) || !expect_char(text, pos, '-')
        || !read_digits(text, pos, 2, day)) {
        return std::unexpected(malformed(text));
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::unexpected(malformed(text));
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect_char(text, pos, ':')
        || !read_digits(text, pos, 2, minute) || !expect_char(text, pos, ':')
        || !read_digits(text, pos, 2, second)) {
        return std::unexpected(malformed(text));
    }

    std::chrono::nanoseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::int64_t scale  = 100'000'000;
        std::size_t  digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (scale > 0) {
                fraction += std::chrono::nanoseconds{(text[pos] - '0') * scale};
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::unexpected(malformed(text));
        }
    }

    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int off_hours = 0, off_minutes = 0;
            if (!read_digits(text, pos, 2, off_hours)) {
                return std::unexpected(malformed(text));
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!read_digits(text, pos, 2, off_minutes)) {
                return std::unexpected(malformed(text));
            }
            offset = std::chrono::hours{off_hours} + std::chrono::minutes{off_minutes};
            if (sign == '-') {
                offset = -offset;
            }
        } else {
            return std::unexpected(malformed(text));
        }
    }
    if (pos != text.size()) {
        return std::unexpected(malformed(text));
    }

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::unexpected(malformed(text));
    }

    auto local = std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute}
                 + std::chrono::seconds{second};
    auto utc = local - offset;
    return std::chrono::time_point_cast<Timestamp::duration>(utc)
           + std::chrono::duration_cast<Timestamp::duration>(fraction);
}

} // namespace HC
