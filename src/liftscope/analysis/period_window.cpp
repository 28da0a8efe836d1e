#include <liftscope/analysis/period_window.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace liftscope::analysis {

PeriodRequest PeriodRequest::days(int64_t days) {
    if (days <= 0) {
        throw std::invalid_argument("period must be a positive number of days, got " +
                                    std::to_string(days));
    }
    return PeriodRequest(days);
}

PeriodRequest PeriodRequest::parse(const std::string& text) {
    std::string trimmed(text);
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);

    std::string lowered(trimmed);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "all") {
        return all();
    }

    if (trimmed.empty() ||
        !std::all_of(trimmed.begin(), trimmed.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("invalid period '" + text + "', expected 'all' or a day count");
    }

    int64_t value = 0;
    try {
        value = std::stoll(trimmed);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("period out of range: '" + text + "'");
    }
    return days(value);
}

std::string PeriodRequest::to_string() const {
    return is_all() ? std::string("all") : std::to_string(days_);
}

std::optional<AnalysisWindow> derive_windows(const core::Date& launch_date,
                                             const PeriodRequest& period,
                                             const core::Date& available_horizon) {
    int64_t total_post_days = available_horizon - launch_date;
    if (total_post_days <= 0) {
        return std::nullopt;
    }

    int64_t actual_post_days = period.is_all()
        ? total_post_days
        : std::min(period.requested_days(), total_post_days);

    AnalysisWindow window;
    window.launch_date = launch_date;
    window.horizon = available_horizon;
    window.total_post_days = total_post_days;
    window.actual_post_days = actual_post_days;

    window.post_ty = core::DateRange{launch_date, launch_date + actual_post_days};
    window.pre_ty = core::DateRange{launch_date - actual_post_days, launch_date - 1};
    window.post_ly = window.post_ty.shifted(-LAST_YEAR_SHIFT_DAYS);
    window.pre_ly = window.pre_ty.shifted(-LAST_YEAR_SHIFT_DAYS);

    return window;
}

} // namespace liftscope::analysis
