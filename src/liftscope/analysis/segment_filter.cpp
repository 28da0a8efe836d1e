#include <liftscope/analysis/segment_filter.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace liftscope::analysis {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

} // namespace

bool is_all_sentinel(const std::optional<std::string>& value) {
    return !value || value->empty() || iequals(*value, core::ALL_SEGMENTS);
}

SegmentFilter::SegmentFilter(std::optional<std::string> segment,
                             std::optional<std::string> device,
                             std::optional<std::string> page)
    : business_segment(std::move(segment)),
      device_type(std::move(device)),
      page_type(std::move(page)) {}

bool SegmentFilter::matches(const core::DailyObservation& row) const {
    if (!is_all_sentinel(business_segment) && !iequals(row.business_segment, *business_segment)) {
        return false;
    }
    if (!is_all_sentinel(device_type) && !iequals(row.device_type, *device_type)) {
        return false;
    }
    if (!is_all_sentinel(page_type) && row.page_type != *page_type) {
        return false;
    }
    return true;
}

bool SegmentFilter::is_pass_through() const {
    return is_all_sentinel(business_segment) &&
           is_all_sentinel(device_type) &&
           is_all_sentinel(page_type);
}

std::vector<core::DailyObservation> SegmentFilter::apply(
    const std::vector<core::DailyObservation>& rows) const {
    if (is_pass_through()) {
        return rows;
    }

    std::vector<core::DailyObservation> filtered;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(filtered),
                 [this](const core::DailyObservation& row) { return matches(row); });
    return filtered;
}

std::vector<core::DailyObservation> select_use_case(const std::vector<core::DailyObservation>& rows,
                                                    const std::string& use_case) {
    std::vector<core::DailyObservation> selected;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(selected),
                 [&use_case](const core::DailyObservation& row) { return row.use_case == use_case; });
    return selected;
}

} // namespace liftscope::analysis
