#include <liftscope/core/date.hpp>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace liftscope::core {

namespace {

struct CivilDate {
    int year;
    unsigned month;
    unsigned day;
};

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[month - 1];
}

// Era-based conversion (400-year cycles of 146097 days) between civil
// dates and a day count relative to 1970-01-01.
int64_t days_from_civil(int year, unsigned month, unsigned day) {
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const unsigned day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    const int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return CivilDate{static_cast<int>(year), month, day};
}

bool parse_digits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

Date Date::from_ymd(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12) {
        throw std::invalid_argument("month out of range: " + std::to_string(month));
    }
    if (day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("day out of range: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return Date(days_from_civil(year, month, day));
}

Date Date::parse(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    size_t end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        throw std::invalid_argument("empty date");
    }
    std::string trimmed = text.substr(begin, end - begin + 1);

    int year = 0;
    int month = 0;
    int day = 0;
    bool ok = trimmed.size() >= 10 &&
              parse_digits(trimmed, 0, 4, year) && trimmed[4] == '-' &&
              parse_digits(trimmed, 5, 2, month) && trimmed[7] == '-' &&
              parse_digits(trimmed, 8, 2, day);
    if (ok && trimmed.size() > 10) {
        ok = trimmed[10] == ' ' || trimmed[10] == 'T';
    }
    if (!ok) {
        throw std::invalid_argument("invalid date '" + text + "', expected YYYY-MM-DD");
    }

    return from_ymd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string Date::to_string() const {
    CivilDate civil = civil_from_days(days_);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", civil.year, civil.month, civil.day);
    return buffer;
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

} // namespace liftscope::core
