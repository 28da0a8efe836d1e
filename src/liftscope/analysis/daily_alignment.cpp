#include <liftscope/analysis/daily_alignment.hpp>
#include <liftscope/utils/logger.hpp>
#include <map>

namespace liftscope::analysis {

std::optional<double> ComparisonPoint::ty_value(core::Kpi kpi) const {
    if (!ty) {
        return std::nullopt;
    }
    return MetricAggregator::metric(*ty, kpi);
}

std::optional<double> ComparisonPoint::ly_value(core::Kpi kpi) const {
    if (!ly) {
        return std::nullopt;
    }
    return MetricAggregator::metric(*ly, kpi);
}

ComparisonSeries DailyAlignmentBuilder::align(const std::vector<core::DailyObservation>& rows,
                                              const std::optional<core::Date>& launch_date,
                                              const PeriodRequest& period) {
    if (!launch_date) {
        return {};
    }

    auto horizon = core::max_observed_date(rows);
    if (!horizon) {
        return {};
    }

    auto window = derive_windows(*launch_date, period, *horizon);
    if (!window) {
        utils::Logger::debug() << "No post-launch data after " << *launch_date
                               << " (horizon " << *horizon << "), empty comparison"
                               << utils::Logger::endl;
        return {};
    }

    return align(rows, *window);
}

ComparisonSeries DailyAlignmentBuilder::align(const std::vector<core::DailyObservation>& rows,
                                              const AnalysisWindow& window) {
    const core::Date ty_anchor = window.launch_date;
    const core::Date ly_anchor = window.ly_launch_equivalent();

    std::map<int64_t, ComparisonPoint> by_offset;

    for (const auto& day : MetricAggregator::aggregate_by_date(rows, window.post_ty)) {
        ComparisonPoint& point = by_offset[day.date - ty_anchor];
        point.ty = day.totals;
    }

    for (const auto& day : MetricAggregator::aggregate_by_date(rows, window.post_ly)) {
        ComparisonPoint& point = by_offset[day.date - ly_anchor];
        point.ly = day.totals;
    }

    ComparisonSeries series;
    series.reserve(by_offset.size());
    for (auto& [offset, point] : by_offset) {
        point.day_offset = offset;
        point.ty_date = ty_anchor + offset;
        point.ly_date = ly_anchor + offset;
        series.push_back(point);
    }
    return series;
}

} // namespace liftscope::analysis
