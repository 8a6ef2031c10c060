#include "domain/value_objects/Timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace vbe::domain {

namespace {

int read_digits(const std::string& str, std::size_t& pos, std::size_t count) {
    if (pos + count > str.size()) {
        throw std::invalid_argument("Truncated timestamp: " + str);
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = str[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return value;
}

void expect(const std::string& str, std::size_t& pos, char c) {
    if (pos >= str.size() || str[pos] != c) {
        throw std::invalid_argument("Invalid timestamp: " + str);
    }
    ++pos;
}

} // namespace

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::from_string(const std::string& str) {
    bool all_digits = !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
    if (all_digits) {
        return Timestamp(std::stoll(str));
    }
    return from_iso8601(str);
}

Timestamp Timestamp::from_iso8601(const std::string& str) {
    std::size_t pos = 0;
    int year = read_digits(str, pos, 4);
    expect(str, pos, '-');
    int month = read_digits(str, pos, 2);
    expect(str, pos, '-');
    int day = read_digits(str, pos, 2);
    std::chrono::year_month_day date{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        throw std::invalid_argument("Invalid date in timestamp: " + str);
    }

    int hour = 0, minute = 0, second = 0, millis = 0;
    int64_t offset_minutes = 0;
    if (pos < str.size() && (str[pos] == 'T' || str[pos] == ' ')) {
        ++pos;
        hour = read_digits(str, pos, 2);
        expect(str, pos, ':');
        minute = read_digits(str, pos, 2);
        if (pos < str.size() && str[pos] == ':') {
            ++pos;
            second = read_digits(str, pos, 2);
        }
        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            int scale = 100;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                millis += (str[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
        if (pos < str.size() && str[pos] == 'Z') {
            ++pos;
        } else if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
            int sign = str[pos] == '-' ? -1 : 1;
            ++pos;
            int off_h = read_digits(str, pos, 2);
            if (pos < str.size() && str[pos] == ':') ++pos;
            int off_m = read_digits(str, pos, 2);
            offset_minutes = sign * (off_h * 60 + off_m);
        }
    }
    if (pos != str.size()) {
        throw std::invalid_argument("Trailing characters in timestamp: " + str);
    }

    auto time = std::chrono::sys_days{date}.time_since_epoch() + std::chrono::hours{hour} +
                std::chrono::minutes{minute - offset_minutes} + std::chrono::seconds{second} +
                std::chrono::milliseconds{millis};
    return Timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(time).count());
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

std::string Timestamp::to_iso8601() const {
    std::chrono::sys_time<std::chrono::milliseconds> point{std::chrono::milliseconds{ms_}};
    auto midnight = std::chrono::floor<std::chrono::days>(point);
    std::chrono::year_month_day date{midnight};
    std::chrono::hh_mm_ss time{point - midnight};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()),
                  static_cast<long long>(time.hours().count()),
                  static_cast<long long>(time.minutes().count()),
                  static_cast<long long>(time.seconds().count()),
                  static_cast<long long>(time.subseconds().count()));
    return buf;
}

} // namespace vbe::domain
