#pragma once
#include <liftscope/core/date.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace liftscope::analysis {

// LY windows sit exactly this many days before their TY counterparts. In leap
// years this drifts the day of week by one.
inline constexpr int64_t LAST_YEAR_SHIFT_DAYS = 365;

// Requested post-launch period: every available day, or a positive count.
class PeriodRequest {
public:
    static PeriodRequest all() { return PeriodRequest(0); }

    // Throws std::invalid_argument unless days > 0.
    static PeriodRequest days(int64_t days);

    // "all" (any case) or a positive integer; throws std::invalid_argument.
    static PeriodRequest parse(const std::string& text);

    bool is_all() const { return days_ == 0; }
    int64_t requested_days() const { return days_; }

    std::string to_string() const;

    bool operator==(const PeriodRequest& other) const { return days_ == other.days_; }

private:
    explicit PeriodRequest(int64_t days) : days_(days) {}

    int64_t days_;
};

struct AnalysisWindow {
    core::Date launch_date;
    core::Date horizon;           // latest observed date for the use case
    int64_t total_post_days = 0;  // horizon - launch_date
    int64_t actual_post_days = 0; // requested period capped to total_post_days

    core::DateRange pre_ty;
    core::DateRange post_ty;
    core::DateRange pre_ly;
    core::DateRange post_ly;

    // Calendar date a year before launch that anchors LY day offsets.
    core::Date ly_launch_equivalent() const {
        return launch_date - LAST_YEAR_SHIFT_DAYS;
    }
};

// Derives the four comparison windows anchored at launch_date:
//   post-TY [L, L + n], pre-TY [L - n, L - 1], LY = TY - 365 days,
// where n = min(requested, horizon - L), or horizon - L for "all".
// Returns nullopt when horizon - L <= 0: the launch is in the future or no
// data exists after it.
std::optional<AnalysisWindow> derive_windows(const core::Date& launch_date,
                                             const PeriodRequest& period,
                                             const core::Date& available_horizon);

} // namespace liftscope::analysis
