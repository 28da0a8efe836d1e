#pragma once
#include <cstdint>
#include <string>
#include <ostream>

namespace liftscope::core {

// A calendar day without time of day, stored as days since 1970-01-01
// in the proleptic Gregorian calendar.
class Date {
public:
    constexpr Date() : days_(0) {}

    static constexpr Date from_days(int64_t days_since_epoch) {
        return Date(days_since_epoch);
    }

    // Throws std::invalid_argument for out-of-range fields.
    static Date from_ymd(int year, unsigned month, unsigned day);

    // Accepts "YYYY-MM-DD", optionally followed by ' ' or 'T' and a time of
    // day, which is discarded. Throws std::invalid_argument otherwise.
    static Date parse(const std::string& text);

    constexpr int64_t days_since_epoch() const { return days_; }

    // ISO-8601 "YYYY-MM-DD"
    std::string to_string() const;

    constexpr Date operator+(int64_t days) const { return Date(days_ + days); }
    constexpr Date operator-(int64_t days) const { return Date(days_ - days); }
    constexpr int64_t operator-(const Date& other) const { return days_ - other.days_; }

    constexpr bool operator==(const Date& other) const { return days_ == other.days_; }
    constexpr bool operator!=(const Date& other) const { return days_ != other.days_; }
    constexpr bool operator<(const Date& other) const { return days_ < other.days_; }
    constexpr bool operator<=(const Date& other) const { return days_ <= other.days_; }
    constexpr bool operator>(const Date& other) const { return days_ > other.days_; }
    constexpr bool operator>=(const Date& other) const { return days_ >= other.days_; }

private:
    constexpr explicit Date(int64_t days) : days_(days) {}

    int64_t days_;
};

// Inclusive range of calendar days.
struct DateRange {
    Date first;
    Date last;

    bool contains(const Date& date) const {
        return first <= date && date <= last;
    }

    // Number of calendar days covered, 0 when last < first.
    int64_t length() const {
        return last < first ? 0 : (last - first) + 1;
    }

    DateRange shifted(int64_t days) const {
        return DateRange{first + days, last + days};
    }
};

std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace liftscope::core
