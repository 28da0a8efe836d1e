#pragma once
#include <liftscope/core/date.hpp>
#include <liftscope/core/kpi.hpp>
#include <liftscope/core/observation.hpp>
#include <vector>

namespace liftscope::analysis {

// Summed primary counters. Ratios are always derived from these sums and
// never from averages of per-row ratios.
struct PrimaryTotals {
    double visits = 0.0;
    double orders = 0.0;
    double revenue = 0.0;

    void add(const core::DailyObservation& row) {
        visits += row.visits;
        orders += row.orders;
        revenue += row.revenue;
    }

    double cvr() const { return visits > 0 ? orders / visits : 0.0; }
    double aov() const { return orders > 0 ? revenue / orders : 0.0; }
    double rpv() const { return visits > 0 ? revenue / visits : 0.0; }
};

// Totals for one calendar day.
struct DailyTotals {
    core::Date date;
    PrimaryTotals totals;
};

class MetricAggregator {
public:
    // Sum over rows whose date lies in range (inclusive). Empty range or no
    // matching rows yields zeros.
    static PrimaryTotals aggregate(const std::vector<core::DailyObservation>& rows,
                                   const core::DateRange& range);

    // Sum over all rows.
    static PrimaryTotals aggregate(const std::vector<core::DailyObservation>& rows);

    // Rows in range grouped by date, ascending. Days with no rows are absent.
    static std::vector<DailyTotals> aggregate_by_date(const std::vector<core::DailyObservation>& rows,
                                                      const core::DateRange& range);

    static std::vector<DailyTotals> aggregate_by_date(const std::vector<core::DailyObservation>& rows);

    static double metric(const PrimaryTotals& totals, core::Kpi kpi);
};

} // namespace liftscope::analysis
