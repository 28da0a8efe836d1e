#include <liftscope/analysis/analysis_engine.hpp>
#include <liftscope/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <stdexcept>

namespace liftscope::analysis {

namespace {

constexpr int SUMMARY_PRECISION = 4;

std::vector<core::DailyObservation> scoped_rows(const core::Dataset& dataset,
                                                const AnalysisQuery& query) {
    std::vector<core::DailyObservation> rows = query.segments.apply(dataset.observations);
    if (query.use_case) {
        rows = select_use_case(rows, *query.use_case);
    }
    return rows;
}

// Rows from launch onward, up to launch + period unless the period is "all".
std::vector<core::DailyObservation> post_launch_rows(const std::vector<core::DailyObservation>& rows,
                                                     const core::Date& launch,
                                                     const PeriodRequest& period) {
    std::vector<core::DailyObservation> selected;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(selected),
        [&](const core::DailyObservation& row) {
            if (row.date < launch) {
                return false;
            }
            // offset form: requested_days may be as large as INT64_MAX
            return period.is_all() || row.date - launch <= period.requested_days();
        });
    return selected;
}

// Applies the launch restriction when the query names a launched use case.
std::vector<core::DailyObservation> summary_rows(const core::Dataset& dataset,
                                                 const AnalysisQuery& query) {
    std::vector<core::DailyObservation> rows = scoped_rows(dataset, query);
    if (!query.use_case) {
        return rows;
    }

    const core::FeatureLaunch* launch = dataset.find_launch(*query.use_case);
    if (!launch) {
        return rows;
    }
    return post_launch_rows(rows, launch->launch_date, query.period);
}

} // namespace

AnalysisQuery AnalysisQuery::from_config(const utils::Config& config) {
    AnalysisQuery query;
    query.use_case = config.get_optional("use_case");
    query.period = PeriodRequest::parse(config.get("period", "all"));
    query.segments = SegmentFilter(config.get_optional("business_segment"),
                                   config.get_optional("device_type"),
                                   config.get_optional("page_type"));

    if (auto kpi_name = config.get_optional("kpi")) {
        query.kpi = core::parse_kpi(*kpi_name);
        if (!query.kpi) {
            throw std::invalid_argument("unknown kpi '" + *kpi_name +
                                        "', expected visits|orders|revenue|cvr|aov|rpv");
        }
    }
    return query;
}

double KpiSummary::value(core::Kpi kpi) const {
    switch (kpi) {
        case core::Kpi::VISITS:
            return visits;
        case core::Kpi::ORDERS:
            return orders;
        case core::Kpi::REVENUE:
            return revenue;
        case core::Kpi::CVR:
            return cvr;
        case core::Kpi::AOV:
            return aov;
        case core::Kpi::RPV:
            return rpv;
    }
    return 0.0;
}

std::vector<AnalysisResult> AnalysisEngine::analyze_launch(const std::vector<core::DailyObservation>& rows,
                                                           const core::FeatureLaunch& launch,
                                                           const PeriodRequest& period,
                                                           const std::optional<core::Kpi>& only_kpi) {
    auto horizon = core::max_observed_date(rows);
    if (!horizon) {
        utils::Logger::debug() << "Skipping '" << launch.use_case
                               << "': no observations after filtering" << utils::Logger::endl;
        return {};
    }

    auto window = derive_windows(launch.launch_date, period, *horizon);
    if (!window) {
        utils::Logger::debug() << "Skipping '" << launch.use_case << "': launch "
                               << launch.launch_date << " is not before latest data "
                               << *horizon << utils::Logger::endl;
        return {};
    }

    const PrimaryTotals pre_ty = MetricAggregator::aggregate(rows, window->pre_ty);
    const PrimaryTotals pre_ly = MetricAggregator::aggregate(rows, window->pre_ly);
    const PrimaryTotals post_ty = MetricAggregator::aggregate(rows, window->post_ty);
    const PrimaryTotals post_ly = MetricAggregator::aggregate(rows, window->post_ly);

    std::vector<AnalysisResult> results;
    for (core::Kpi kpi : core::ALL_KPIS) {
        if (only_kpi && *only_kpi != kpi) {
            continue;
        }

        WindowValues values;
        values.pre_ly = MetricAggregator::metric(pre_ly, kpi);
        values.pre_ty = MetricAggregator::metric(pre_ty, kpi);
        values.post_ly = MetricAggregator::metric(post_ly, kpi);
        values.post_ty = MetricAggregator::metric(post_ty, kpi);

        KpiLift lift;
        try {
            lift = LiftCalculator::compute(kpi, values);
        } catch (const std::domain_error& e) {
            utils::Logger::warn() << "Error calculating " << core::kpi_display_name(kpi)
                                  << " for '" << launch.use_case << "': " << e.what()
                                  << utils::Logger::endl;
            continue;
        }

        AnalysisResult result;
        result.use_case = launch.use_case;
        result.kpi = kpi;
        result.pre_ly = LiftCalculator::round_to(values.pre_ly, VALUE_PRECISION);
        result.pre_ty = LiftCalculator::round_to(values.pre_ty, VALUE_PRECISION);
        result.post_ly = LiftCalculator::round_to(values.post_ly, VALUE_PRECISION);
        result.post_ty = LiftCalculator::round_to(values.post_ty, VALUE_PRECISION);
        result.pre_lift = lift.pre_lift;
        result.post_lift = lift.post_lift;
        result.pre_post_comp_lift = lift.comp_lift;
        result.window = *window;
        result.is_bps = lift.is_bps;
        results.push_back(result);
    }
    return results;
}

std::vector<AnalysisResult> AnalysisEngine::analyze(const core::Dataset& dataset,
                                                    const AnalysisQuery& query) {
    const std::vector<core::DailyObservation> filtered = query.segments.apply(dataset.observations);

    std::vector<AnalysisResult> results;
    for (const auto& launch : dataset.launches) {
        if (query.use_case && *query.use_case != launch.use_case) {
            continue;
        }

        auto launch_results = analyze_launch(select_use_case(filtered, launch.use_case),
                                             launch, query.period, query.kpi);
        results.insert(results.end(), launch_results.begin(), launch_results.end());
    }

    utils::Logger::debug() << "Analysis produced " << results.size() << " results over "
                           << dataset.launches.size() << " launches" << utils::Logger::endl;
    return results;
}

ComparisonSeries AnalysisEngine::comparison(const core::Dataset& dataset, const AnalysisQuery& query) {
    if (!query.use_case) {
        return {};
    }

    const core::FeatureLaunch* launch = dataset.find_launch(*query.use_case);
    std::optional<core::Date> launch_date;
    if (launch) {
        launch_date = launch->launch_date;
    }

    return DailyAlignmentBuilder::align(scoped_rows(dataset, query), launch_date, query.period);
}

KpiSummary AnalysisEngine::summary(const core::Dataset& dataset, const AnalysisQuery& query) {
    const PrimaryTotals totals = MetricAggregator::aggregate(summary_rows(dataset, query));
    for (core::Kpi kpi : core::ALL_KPIS) {
        if (!std::isfinite(MetricAggregator::metric(totals, kpi))) {
            throw std::domain_error(std::string("non-finite ") + core::kpi_display_name(kpi) +
                                    " total in summary");
        }
    }

    KpiSummary summary;
    summary.visits = LiftCalculator::round_to(totals.visits, SUMMARY_PRECISION);
    summary.orders = LiftCalculator::round_to(totals.orders, SUMMARY_PRECISION);
    summary.revenue = LiftCalculator::round_to(totals.revenue, SUMMARY_PRECISION);
    summary.cvr = LiftCalculator::round_to(totals.cvr(), VALUE_PRECISION);
    summary.aov = LiftCalculator::round_to(totals.aov(), SUMMARY_PRECISION);
    summary.rpv = LiftCalculator::round_to(totals.rpv(), SUMMARY_PRECISION);
    return summary;
}

std::vector<DailyKpiPoint> AnalysisEngine::daily_series(const core::Dataset& dataset,
                                                        const AnalysisQuery& query) {
    const std::string label = query.use_case ? *query.use_case : core::ALL_SEGMENTS;

    std::vector<DailyKpiPoint> points;
    for (const auto& day : MetricAggregator::aggregate_by_date(summary_rows(dataset, query))) {
        points.push_back(DailyKpiPoint{day.date, label, day.totals});
    }
    return points;
}

std::vector<std::string> AnalysisEngine::use_cases(const core::Dataset& dataset) {
    std::vector<std::string> names;
    names.reserve(dataset.launches.size());
    for (const auto& launch : dataset.launches) {
        names.push_back(launch.use_case);
    }
    return names;
}

std::optional<core::Date> AnalysisEngine::launch_date(const core::Dataset& dataset,
                                                      const std::string& use_case) {
    const core::FeatureLaunch* launch = dataset.find_launch(use_case);
    if (!launch) {
        return std::nullopt;
    }
    return launch->launch_date;
}

std::vector<std::string> AnalysisEngine::stakeholders(const core::Dataset& dataset,
                                                      const std::string& use_case) {
    const core::FeatureLaunch* launch = dataset.find_launch(use_case);
    return launch ? launch->stakeholders : std::vector<std::string>{};
}

std::vector<std::string> AnalysisEngine::page_types(const core::Dataset& dataset) {
    std::set<std::string> distinct;
    for (const auto& row : dataset.observations) {
        if (row.page_type.find_first_not_of(" \t") != std::string::npos &&
            row.page_type != core::ALL_SEGMENTS) {
            distinct.insert(row.page_type);
        }
    }

    std::vector<std::string> types;
    types.reserve(distinct.size() + 1);
    types.push_back(core::ALL_SEGMENTS);
    types.insert(types.end(), distinct.begin(), distinct.end());
    return types;
}

} // namespace liftscope::analysis
