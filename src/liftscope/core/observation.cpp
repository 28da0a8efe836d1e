#include <liftscope/core/observation.hpp>
#include <algorithm>

namespace liftscope::core {

DailyObservation::DailyObservation()
    : visits(0.0), orders(0.0), revenue(0.0),
      business_segment(ALL_SEGMENTS), device_type(ALL_SEGMENTS), page_type(ALL_SEGMENTS) {}

DailyObservation::DailyObservation(const Date& d, const std::string& uc,
                                   double v, double o, double r)
    : date(d), use_case(uc), visits(v), orders(o), revenue(r),
      business_segment(ALL_SEGMENTS), device_type(ALL_SEGMENTS), page_type(ALL_SEGMENTS) {}

FeatureLaunch::FeatureLaunch(const std::string& uc, const Date& launch)
    : use_case(uc), launch_date(launch) {}

std::vector<std::string> parse_stakeholders(const std::string& text) {
    std::string normalized(text);
    std::replace(normalized.begin(), normalized.end(), ';', ',');

    std::vector<std::string> emails;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t comma = normalized.find(',', start);
        if (comma == std::string::npos) {
            comma = normalized.size();
        }

        std::string entry = normalized.substr(start, comma - start);
        entry.erase(0, entry.find_first_not_of(" \t\r\n"));
        entry.erase(entry.find_last_not_of(" \t\r\n") + 1);
        if (!entry.empty() && entry.find('@') != std::string::npos) {
            emails.push_back(entry);
        }

        start = comma + 1;
    }
    return emails;
}

std::optional<Date> max_observed_date(const std::vector<DailyObservation>& rows) {
    if (rows.empty()) {
        return std::nullopt;
    }

    auto latest = std::max_element(rows.begin(), rows.end(),
        [](const DailyObservation& a, const DailyObservation& b) {
            return a.date < b.date;
        });
    return latest->date;
}

} // namespace liftscope::core
