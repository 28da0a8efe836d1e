#pragma once
#include <liftscope/analysis/daily_alignment.hpp>
#include <liftscope/analysis/lift_calculator.hpp>
#include <liftscope/analysis/metric_aggregator.hpp>
#include <liftscope/analysis/period_window.hpp>
#include <liftscope/analysis/segment_filter.hpp>
#include <liftscope/core/dataset.hpp>
#include <liftscope/core/kpi.hpp>
#include <liftscope/utils/config.hpp>
#include <optional>
#include <string>
#include <vector>

namespace liftscope::analysis {

// Query options shared by every engine entry point.
struct AnalysisQuery {
    std::optional<std::string> use_case;  // unset: every use case
    PeriodRequest period = PeriodRequest::all();
    SegmentFilter segments;
    std::optional<core::Kpi> kpi;         // unset: every KPI

    // Reads use_case, period, business_segment, device_type, page_type and
    // kpi. Throws std::invalid_argument for a bad period or unknown KPI.
    static AnalysisQuery from_config(const utils::Config& config);
};

struct AnalysisResult {
    std::string use_case;
    core::Kpi kpi = core::Kpi::VISITS;

    double pre_ly = 0.0;
    double pre_ty = 0.0;
    double pre_lift = 0.0;
    double post_ly = 0.0;
    double post_ty = 0.0;
    double post_lift = 0.0;
    double pre_post_comp_lift = 0.0;

    AnalysisWindow window;
    bool is_bps = false;

    int64_t period_days() const { return window.actual_post_days; }
    int64_t total_post_days() const { return window.total_post_days; }
    const core::Date& launch_date() const { return window.launch_date; }
    const core::Date& max_data_date() const { return window.horizon; }
};

struct KpiSummary {
    double visits = 0.0;
    double orders = 0.0;
    double revenue = 0.0;
    double cvr = 0.0;
    double aov = 0.0;
    double rpv = 0.0;

    double value(core::Kpi kpi) const;
};

struct DailyKpiPoint {
    core::Date date;
    std::string use_case;  // "All" when the query spans every use case
    PrimaryTotals totals;
};

class AnalysisEngine {
public:
    // Pre/post, TY/LY analysis for every launch in config order (or only
    // query.use_case). Use cases without post-launch data are left out; a
    // KPI whose computation fails is logged and dropped on its own.
    static std::vector<AnalysisResult> analyze(const core::Dataset& dataset,
                                               const AnalysisQuery& query);

    // Results for one launch given its segment-filtered, use-case-scoped rows.
    static std::vector<AnalysisResult> analyze_launch(const std::vector<core::DailyObservation>& rows,
                                                      const core::FeatureLaunch& launch,
                                                      const PeriodRequest& period,
                                                      const std::optional<core::Kpi>& only_kpi = std::nullopt);

    // Day-aligned TY/LY series for query.use_case; empty without a use case
    // or launch.
    static ComparisonSeries comparison(const core::Dataset& dataset, const AnalysisQuery& query);

    // Totals over the filtered rows; with a launched use case, restricted to
    // [launch, launch + period]. Throws std::domain_error when a total is
    // not finite.
    static KpiSummary summary(const core::Dataset& dataset, const AnalysisQuery& query);

    // Same restriction as summary(), one point per date ascending.
    static std::vector<DailyKpiPoint> daily_series(const core::Dataset& dataset,
                                                   const AnalysisQuery& query);

    static std::vector<std::string> use_cases(const core::Dataset& dataset);
    static std::optional<core::Date> launch_date(const core::Dataset& dataset,
                                                 const std::string& use_case);
    static std::vector<std::string> stakeholders(const core::Dataset& dataset,
                                                 const std::string& use_case);

    // "All" first, then distinct page types in sorted order.
    static std::vector<std::string> page_types(const core::Dataset& dataset);
};

} // namespace liftscope::analysis
