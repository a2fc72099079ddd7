#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace fdr {

    using Clock = std::chrono::system_clock;
    using Duration = std::chrono::microseconds;
    using Timestamp = std::chrono::time_point<Clock, Duration>;

    struct TimeRange {
        Timestamp min;
        Timestamp max;

        Duration span() const { return max - min; }
        Timestamp clamp(Timestamp t) const { return t < min ? min : (t > max ? max : t); }
    };

    inline double to_seconds(Duration d) {
        return std::chrono::duration<double>(d).count();
    }

    // Rounds to the nearest microsecond so repeated identical steps accumulate exactly
    inline Duration from_seconds(double seconds) {
        return Duration(static_cast<int64_t>(std::llround(seconds * 1e6)));
    }

    namespace detail {

        // Proleptic Gregorian calendar <-> days since 1970-01-01 (H. Hinnant's algorithms)
        constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<int64_t>(doe) - 719468;
        }

        struct CivilDate {
            int64_t year;
            unsigned month;
            unsigned day;
        };

        constexpr CivilDate civil_from_days(int64_t z) {
            z += 719468;
            const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const int64_t y = static_cast<int64_t>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;
            return CivilDate{y + (m <= 2), m, d};
        }

        constexpr bool is_leap(int64_t y) {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        constexpr unsigned days_in_month(int64_t y, unsigned m) {
            constexpr unsigned table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            return (m == 2 && is_leap(y)) ? 29u : table[m - 1];
        }

        // Reads exactly `count` digits at `pos`
        inline bool read_digits(std::string_view s, size_t& pos, size_t count, int64_t& out) {
            if (pos + count > s.size()) return false;
            int64_t value = 0;
            for (size_t i = 0; i < count; ++i) {
                char c = s[pos + i];
                if (c < '0' || c > '9') return false;
                value = value * 10 + (c - '0');
            }
            pos += count;
            out = value;
            return true;
        }

    } // namespace detail

    // Accepts YYYY-MM-DD, optionally followed by ' ' or 'T' and HH:MM[:SS[.ffffff]],
    // optionally followed by 'Z' or a +HH:MM / -HH:MM offset. Naive times are UTC.
    inline std::optional<Timestamp> parse_timestamp(std::string_view text) {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

        size_t pos = 0;
        int64_t year = 0, month = 0, day = 0;
        if (!detail::read_digits(text, pos, 4, year)) return std::nullopt;
        if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
        if (!detail::read_digits(text, pos, 2, month)) return std::nullopt;
        if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
        if (!detail::read_digits(text, pos, 2, day)) return std::nullopt;

        if (month < 1 || month > 12) return std::nullopt;
        if (day < 1 || day > detail::days_in_month(year, static_cast<unsigned>(month))) return std::nullopt;

        int64_t hour = 0, minute = 0, second = 0, micros = 0;
        if (pos < text.size() && (text[pos] == ' ' || text[pos] == 'T')) {
            ++pos;
            if (!detail::read_digits(text, pos, 2, hour)) return std::nullopt;
            if (pos >= text.size() || text[pos++] != ':') return std::nullopt;
            if (!detail::read_digits(text, pos, 2, minute)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
                if (!detail::read_digits(text, pos, 2, second)) return std::nullopt;
                if (pos < text.size() && text[pos] == '.') {
                    ++pos;
                    size_t digits = 0;
                    int64_t scale = 100000;
                    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                        if (digits < 6) {
                            micros += (text[pos] - '0') * scale;
                            scale /= 10;
                        }
                        ++digits;
                        ++pos;
                    }
                    if (digits == 0) return std::nullopt;
                }
            }
            if (hour > 23 || minute > 59 || second > 59) return std::nullopt;
        }

        int64_t offset_minutes = 0;
        if (pos < text.size()) {
            char zone = text[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                ++pos;
                int64_t oh = 0, om = 0;
                if (!detail::read_digits(text, pos, 2, oh)) return std::nullopt;
                if (pos < text.size() && text[pos] == ':') ++pos;
                if (!detail::read_digits(text, pos, 2, om)) return std::nullopt;
                if (oh > 23 || om > 59) return std::nullopt;
                offset_minutes = (oh * 60 + om) * (zone == '-' ? -1 : 1);
            }
        }
        if (pos != text.size()) return std::nullopt;

        const int64_t days = detail::days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
        return Timestamp(Duration(seconds * 1000000 + micros));
    }

    // ISO-8601 UTC, fractional part only when non-zero: 2025-09-19T09:00:00Z
    inline std::string format_timestamp(Timestamp t) {
        const int64_t us = t.time_since_epoch().count();
        int64_t secs = us / 1000000;
        int64_t frac = us % 1000000;
        if (frac < 0) {
            frac += 1000000;
            secs -= 1;
        }
        int64_t days = secs / 86400;
        int64_t sod = secs % 86400;
        if (sod < 0) {
            sod += 86400;
            days -= 1;
        }
        const detail::CivilDate date = detail::civil_from_days(days);

        char buf[40];
        if (frac == 0) {
            std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<long long>(sod / 3600), static_cast<long long>((sod % 3600) / 60),
                static_cast<long long>(sod % 60));
        } else {
            std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lldZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<long long>(sod / 3600), static_cast<long long>((sod % 3600) / 60),
                static_cast<long long>(sod % 60), static_cast<long long>(frac));
        }
        return std::string(buf);
    }

} // namespace fdr
