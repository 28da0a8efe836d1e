#pragma once
#include <liftscope/analysis/metric_aggregator.hpp>
#include <liftscope/analysis/period_window.hpp>
#include <liftscope/core/date.hpp>
#include <liftscope/core/kpi.hpp>
#include <liftscope/core/observation.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace liftscope::analysis {

// One chart point. TY and LY share the offset when they are the same number
// of days past their year's launch-equivalent date.
struct ComparisonPoint {
    int64_t day_offset = 0;
    core::Date ty_date;
    core::Date ly_date;
    std::optional<PrimaryTotals> ty;  // nullopt: no TY observation at this offset
    std::optional<PrimaryTotals> ly;

    std::optional<double> ty_value(core::Kpi kpi) const;
    std::optional<double> ly_value(core::Kpi kpi) const;
};

using ComparisonSeries = std::vector<ComparisonPoint>;

class DailyAlignmentBuilder {
public:
    // rows must already be segment-filtered and scoped to one use case.
    // The horizon is the latest observed date in rows, as for the analysis
    // path. Offsets are the union of TY and LY offsets, ascending.
    // Returns an empty series without a launch date, without rows, or when
    // no data exists after launch.
    static ComparisonSeries align(const std::vector<core::DailyObservation>& rows,
                                  const std::optional<core::Date>& launch_date,
                                  const PeriodRequest& period);

    // Same as align() for an already derived window.
    static ComparisonSeries align(const std::vector<core::DailyObservation>& rows,
                                  const AnalysisWindow& window);
};

} // namespace liftscope::analysis
