#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace vbe::domain {

class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    // Accepts epoch milliseconds ("1718035200000") or ISO-8601
    // ("2024-06-10T16:00:00.000Z", "2024-06-10T16:00:00+00:00").
    static Timestamp from_string(const std::string& str);
    static Timestamp from_iso8601(const std::string& str);
    static Timestamp now();

    int64_t milliseconds() const noexcept { return ms_; }
    std::string to_iso8601() const;

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace vbe::domain
