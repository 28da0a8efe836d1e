#include <liftscope/analysis/metric_aggregator.hpp>
#include <map>

namespace liftscope::analysis {

namespace {

template<typename Predicate>
std::vector<DailyTotals> group_by_date(const std::vector<core::DailyObservation>& rows,
                                       Predicate include) {
    std::map<core::Date, PrimaryTotals> by_date;
    for (const auto& row : rows) {
        if (include(row)) {
            by_date[row.date].add(row);
        }
    }

    std::vector<DailyTotals> days;
    days.reserve(by_date.size());
    for (const auto& [date, totals] : by_date) {
        days.push_back(DailyTotals{date, totals});
    }
    return days;
}

} // namespace

PrimaryTotals MetricAggregator::aggregate(const std::vector<core::DailyObservation>& rows,
                                          const core::DateRange& range) {
    PrimaryTotals totals;
    for (const auto& row : rows) {
        if (range.contains(row.date)) {
            totals.add(row);
        }
    }
    return totals;
}

PrimaryTotals MetricAggregator::aggregate(const std::vector<core::DailyObservation>& rows) {
    PrimaryTotals totals;
    for (const auto& row : rows) {
        totals.add(row);
    }
    return totals;
}

std::vector<DailyTotals> MetricAggregator::aggregate_by_date(
    const std::vector<core::DailyObservation>& rows, const core::DateRange& range) {
    return group_by_date(rows, [&range](const core::DailyObservation& row) {
        return range.contains(row.date);
    });
}

std::vector<DailyTotals> MetricAggregator::aggregate_by_date(
    const std::vector<core::DailyObservation>& rows) {
    return group_by_date(rows, [](const core::DailyObservation&) { return true; });
}

double MetricAggregator::metric(const PrimaryTotals& totals, core::Kpi kpi) {
    switch (kpi) {
        case core::Kpi::VISITS:
            return totals.visits;
        case core::Kpi::ORDERS:
            return totals.orders;
        case core::Kpi::REVENUE:
            return totals.revenue;
        case core::Kpi::CVR:
            return totals.cvr();
        case core::Kpi::AOV:
            return totals.aov();
        case core::Kpi::RPV:
            return totals.rpv();
    }
    return 0.0;
}

} // namespace liftscope::analysis
