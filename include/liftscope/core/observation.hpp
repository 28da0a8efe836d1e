#pragma once
#include <liftscope/core/date.hpp>
#include <optional>
#include <string>
#include <vector>

namespace liftscope::core {

// Value of a segment dimension that was not present in the input.
inline const std::string ALL_SEGMENTS = "All";

// One row of the daily KPI series. Several rows may share a (date, use_case)
// pair across segment dimensions; they are summed when aggregated.
struct DailyObservation {
    Date date;
    std::string use_case;
    double visits;
    double orders;
    double revenue;
    std::string business_segment;
    std::string device_type;
    std::string page_type;

    DailyObservation();

    DailyObservation(const Date& d, const std::string& uc,
                     double v, double o, double r);
};

struct FeatureLaunch {
    std::string use_case;
    Date launch_date;
    std::string description;
    std::vector<std::string> stakeholders;

    FeatureLaunch() = default;
    FeatureLaunch(const std::string& uc, const Date& launch);
};

// Splits a "a@x.com; b@y.com, c@z.com" list. Entries are trimmed and only
// those containing '@' are kept, in input order.
std::vector<std::string> parse_stakeholders(const std::string& text);

// Latest date among the rows; this is the data-availability horizon used by
// every window derivation.
std::optional<Date> max_observed_date(const std::vector<DailyObservation>& rows);

} // namespace liftscope::core
