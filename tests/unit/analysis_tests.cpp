#include <gtest/gtest.h>
#include <liftscope/analysis/analysis_engine.hpp>
#include <liftscope/analysis/daily_alignment.hpp>
#include <liftscope/analysis/lift_calculator.hpp>
#include <liftscope/analysis/metric_aggregator.hpp>
#include <liftscope/analysis/period_window.hpp>
#include <liftscope/analysis/segment_filter.hpp>
#include <liftscope/core/dataset.hpp>
#include <liftscope/report/csv_report.hpp>
#include <liftscope/utils/config.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using liftscope::analysis::AnalysisEngine;
using liftscope::analysis::AnalysisQuery;
using liftscope::analysis::AnalysisResult;
using liftscope::analysis::DailyAlignmentBuilder;
using liftscope::analysis::LiftCalculator;
using liftscope::analysis::MetricAggregator;
using liftscope::analysis::PeriodRequest;
using liftscope::analysis::SegmentFilter;
using liftscope::core::DailyObservation;
using liftscope::core::Date;
using liftscope::core::Kpi;

namespace {

Date d(const char* text) {
    return Date::parse(text);
}

DailyObservation row(const char* date, const std::string& use_case,
                     double visits, double orders, double revenue = 0.0) {
    return DailyObservation(d(date), use_case, visits, orders, revenue);
}

DailyObservation segment_row(const char* date, const std::string& segment,
                             const std::string& device, const std::string& page,
                             double visits) {
    DailyObservation r = row(date, "Search", visits, 0.0);
    r.business_segment = segment;
    r.device_type = device;
    r.page_type = page;
    return r;
}

const AnalysisResult* find_result(const std::vector<AnalysisResult>& results,
                                  const std::string& use_case, Kpi kpi) {
    for (const auto& r : results) {
        if (r.use_case == use_case && r.kpi == kpi) {
            return &r;
        }
    }
    return nullptr;
}

} // namespace

// ---------------------------------------------------------------------------
// SegmentFilter
// ---------------------------------------------------------------------------

class SegmentFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        rows = {
            segment_row("2024-01-01", "B2B", "MW", "PLP", 1.0),
            segment_row("2024-01-01", "B2C", "MW", "PDP", 2.0),
            segment_row("2024-01-01", "B2B", "App", "PDP", 4.0),
            segment_row("2024-01-01", "B2C", "DTW", "plp", 8.0),
        };
    }

    double visits(const std::vector<DailyObservation>& subset) {
        return MetricAggregator::aggregate(subset).visits;
    }

    std::vector<DailyObservation> rows;
};

TEST_F(SegmentFilterTest, UnsetAndSentinelArePassThrough) {
    EXPECT_EQ(SegmentFilter().apply(rows).size(), 4u);
    EXPECT_EQ(SegmentFilter(std::string("ALL"), std::string("all"), std::string("All")).apply(rows).size(), 4u);
    EXPECT_EQ(SegmentFilter(std::string(""), std::nullopt, std::nullopt).apply(rows).size(), 4u);
    EXPECT_TRUE(SegmentFilter(std::string("all"), std::nullopt, std::nullopt).is_pass_through());
}

TEST_F(SegmentFilterTest, SegmentAndDeviceIgnoreCase) {
    EXPECT_EQ(visits(SegmentFilter(std::string("b2b"), std::nullopt, std::nullopt).apply(rows)), 5.0);
    EXPECT_EQ(visits(SegmentFilter(std::nullopt, std::string("mw"), std::nullopt).apply(rows)), 3.0);
}

TEST_F(SegmentFilterTest, PageTypeIsCaseSensitive) {
    EXPECT_EQ(visits(SegmentFilter(std::nullopt, std::nullopt, std::string("PLP")).apply(rows)), 1.0);
    EXPECT_EQ(visits(SegmentFilter(std::nullopt, std::nullopt, std::string("plp")).apply(rows)), 8.0);
}

TEST_F(SegmentFilterTest, FiltersCombineWithAnd) {
    auto subset = SegmentFilter(std::string("B2B"), std::string("App"), std::string("PDP")).apply(rows);
    ASSERT_EQ(subset.size(), 1u);
    EXPECT_EQ(subset[0].visits, 4.0);

    EXPECT_TRUE(SegmentFilter(std::string("B2B"), std::string("DTW"), std::nullopt).apply(rows).empty());
}

TEST_F(SegmentFilterTest, InputIsNotModified) {
    auto subset = SegmentFilter(std::string("B2C"), std::nullopt, std::nullopt).apply(rows);
    EXPECT_EQ(rows.size(), 4u);
    EXPECT_EQ(subset.size(), 2u);
    EXPECT_EQ(subset[0].business_segment, "B2C");
}

// ---------------------------------------------------------------------------
// PeriodWindowCalculator
// ---------------------------------------------------------------------------

TEST(PeriodRequestTest, Parse) {
    EXPECT_TRUE(PeriodRequest::parse("all").is_all());
    EXPECT_TRUE(PeriodRequest::parse("ALL").is_all());
    EXPECT_EQ(PeriodRequest::parse(" 30 ").requested_days(), 30);
    EXPECT_EQ(PeriodRequest::parse("7").to_string(), "7");

    EXPECT_THROW(PeriodRequest::parse("0"), std::invalid_argument);
    EXPECT_THROW(PeriodRequest::parse("-5"), std::invalid_argument);
    EXPECT_THROW(PeriodRequest::parse("7d"), std::invalid_argument);
    EXPECT_THROW(PeriodRequest::parse(""), std::invalid_argument);
    EXPECT_THROW(PeriodRequest::days(0), std::invalid_argument);
}

TEST(PeriodWindowTest, AllUsesEveryPostLaunchDay) {
    auto window = liftscope::analysis::derive_windows(d("2024-01-01"), PeriodRequest::all(), d("2024-01-11"));
    ASSERT_TRUE(window.has_value());

    EXPECT_EQ(window->total_post_days, 10);
    EXPECT_EQ(window->actual_post_days, 10);
    EXPECT_EQ(window->post_ty.first, d("2024-01-01"));
    EXPECT_EQ(window->post_ty.last, d("2024-01-11"));
    EXPECT_EQ(window->pre_ty.first, d("2023-12-22"));
    EXPECT_EQ(window->pre_ty.last, d("2023-12-31"));
}

TEST(PeriodWindowTest, RequestedPeriodIsCapped) {
    auto window = liftscope::analysis::derive_windows(d("2024-01-01"), PeriodRequest::days(5), d("2024-01-11"));
    ASSERT_TRUE(window.has_value());

    EXPECT_EQ(window->total_post_days, 10);
    EXPECT_EQ(window->actual_post_days, 5);
    // launch_date through launch_date + 5, both ends included
    EXPECT_EQ(window->post_ty.length(), 6);
    EXPECT_EQ(window->post_ty.last, d("2024-01-06"));
    EXPECT_EQ(window->pre_ty.length(), 5);

    for (int64_t requested : {11, 30, 365, 10000}) {
        auto capped = liftscope::analysis::derive_windows(d("2024-01-01"), PeriodRequest::days(requested),
                                                          d("2024-01-11"));
        ASSERT_TRUE(capped.has_value());
        EXPECT_EQ(capped->actual_post_days, capped->total_post_days) << requested;
    }
}

TEST(PeriodWindowTest, LastYearIsShiftedExactly365Days) {
    for (const char* launch : {"2024-01-01", "2024-03-01", "2023-06-15", "2025-02-28"}) {
        auto window = liftscope::analysis::derive_windows(d(launch), PeriodRequest::days(14), d(launch) + 40);
        ASSERT_TRUE(window.has_value());

        EXPECT_EQ(window->post_ty.first - window->post_ly.first, 365) << launch;
        EXPECT_EQ(window->post_ty.last - window->post_ly.last, 365) << launch;
        EXPECT_EQ(window->pre_ty.first - window->pre_ly.first, 365) << launch;
        EXPECT_EQ(window->pre_ty.last - window->pre_ly.last, 365) << launch;
        EXPECT_EQ(window->launch_date - window->ly_launch_equivalent(), 365) << launch;
    }
}

TEST(PeriodWindowTest, NoPostLaunchDataIsExcluded) {
    // horizon on launch day
    EXPECT_FALSE(liftscope::analysis::derive_windows(d("2024-01-01"), PeriodRequest::all(), d("2024-01-01")));
    // launch after the data ends
    EXPECT_FALSE(liftscope::analysis::derive_windows(d("2024-06-01"), PeriodRequest::days(7), d("2024-01-01")));
}

// ---------------------------------------------------------------------------
// MetricAggregator
// ---------------------------------------------------------------------------

TEST(MetricAggregatorTest, SumsInsideInclusiveRange) {
    std::vector<DailyObservation> rows = {
        row("2023-12-31", "Search", 999.0, 99.0, 9.0),
        row("2024-01-01", "Search", 100.0, 5.0, 250.0),
        row("2024-01-03", "Search", 50.0, 0.0, 0.0),
        row("2024-01-06", "Search", 10.0, 1.0, 30.0),
        row("2024-01-07", "Search", 999.0, 99.0, 9.0),
    };
    liftscope::core::DateRange range{d("2024-01-01"), d("2024-01-06")};

    auto totals = MetricAggregator::aggregate(rows, range);
    EXPECT_DOUBLE_EQ(totals.visits, 160.0);
    EXPECT_DOUBLE_EQ(totals.orders, 6.0);
    EXPECT_DOUBLE_EQ(totals.revenue, 280.0);
}

TEST(MetricAggregatorTest, EmptyWindowIsZero) {
    std::vector<DailyObservation> rows = {row("2024-01-01", "Search", 100.0, 5.0, 250.0)};
    auto totals = MetricAggregator::aggregate(rows, {d("2023-01-01"), d("2023-01-31")});

    for (Kpi kpi : liftscope::core::ALL_KPIS) {
        EXPECT_EQ(MetricAggregator::metric(totals, kpi), 0.0) << liftscope::core::kpi_display_name(kpi);
    }
}

TEST(MetricAggregatorTest, RatiosAreDerivedFromSums) {
    // High-traffic day at 1% and low-traffic day at 50%
    std::vector<DailyObservation> rows = {
        row("2024-01-01", "Search", 1000.0, 10.0, 500.0),
        row("2024-01-02", "Search", 10.0, 5.0, 1000.0),
    };
    auto totals = MetricAggregator::aggregate(rows);

    EXPECT_DOUBLE_EQ(totals.cvr(), 15.0 / 1010.0);
    EXPECT_NE(totals.cvr(), (0.01 + 0.5) / 2.0);
    EXPECT_DOUBLE_EQ(totals.aov(), 1500.0 / 15.0);
    EXPECT_DOUBLE_EQ(totals.rpv(), 1500.0 / 1010.0);
}

TEST(MetricAggregatorTest, ZeroDenominators) {
    liftscope::analysis::PrimaryTotals totals;
    totals.revenue = 100.0;

    EXPECT_EQ(totals.cvr(), 0.0);
    EXPECT_EQ(totals.aov(), 0.0);
    EXPECT_EQ(totals.rpv(), 0.0);
}

TEST(MetricAggregatorTest, GroupsRowsByDate) {
    std::vector<DailyObservation> rows = {
        row("2024-01-02", "Search", 80.0, 6.0),
        row("2024-01-01", "Search", 100.0, 5.0),
        row("2024-01-02", "Search", 20.0, 0.0),
    };
    auto days = MetricAggregator::aggregate_by_date(rows);

    ASSERT_EQ(days.size(), 2u);
    EXPECT_EQ(days[0].date, d("2024-01-01"));
    EXPECT_EQ(days[1].date, d("2024-01-02"));
    EXPECT_DOUBLE_EQ(days[1].totals.visits, 100.0);
    EXPECT_DOUBLE_EQ(days[1].totals.cvr(), 0.06);
}

// ---------------------------------------------------------------------------
// LiftCalculator
// ---------------------------------------------------------------------------

TEST(LiftCalculatorTest, PercentLift) {
    EXPECT_DOUBLE_EQ(LiftCalculator::lift(110.0, 100.0, liftscope::core::LiftUnit::PERCENT), 10.0);
    EXPECT_DOUBLE_EQ(LiftCalculator::lift(50.0, 100.0, liftscope::core::LiftUnit::PERCENT), -50.0);
    EXPECT_EQ(LiftCalculator::lift(50.0, 0.0, liftscope::core::LiftUnit::PERCENT), 0.0);
}

TEST(LiftCalculatorTest, BasisPointLift) {
    EXPECT_NEAR(LiftCalculator::lift(0.03, 0.025, liftscope::core::LiftUnit::BASIS_POINTS), 50.0, 1e-9);
    // no zero-denominator guard: an absolute delta is defined against zero
    EXPECT_NEAR(LiftCalculator::lift(0.01, 0.0, liftscope::core::LiftUnit::BASIS_POINTS), 100.0, 1e-9);
}

TEST(LiftCalculatorTest, CompositeLiftIsPostMinusPre) {
    liftscope::analysis::WindowValues values;
    values.pre_ly = 100.0;
    values.pre_ty = 105.0;
    values.post_ly = 100.0;
    values.post_ty = 120.0;

    auto lift = LiftCalculator::compute(Kpi::VISITS, values);
    EXPECT_DOUBLE_EQ(lift.pre_lift, 5.0);
    EXPECT_DOUBLE_EQ(lift.post_lift, 20.0);
    EXPECT_DOUBLE_EQ(lift.comp_lift, 15.0);
    EXPECT_FALSE(lift.is_bps);
}

TEST(LiftCalculatorTest, UnitFlagFollowsKpi) {
    liftscope::analysis::WindowValues values;
    values.post_ty = 0.02;
    values.post_ly = 0.01;

    for (Kpi kpi : liftscope::core::ALL_KPIS) {
        EXPECT_EQ(LiftCalculator::compute(kpi, values).is_bps, kpi == Kpi::CVR)
            << liftscope::core::kpi_display_name(kpi);
    }
    EXPECT_NEAR(LiftCalculator::compute(Kpi::CVR, values).post_lift, 100.0, 1e-9);
    EXPECT_NEAR(LiftCalculator::compute(Kpi::AOV, values).post_lift, 100.0, 1e-9);
}

TEST(LiftCalculatorTest, NonFiniteInputThrows) {
    liftscope::analysis::WindowValues values;
    values.post_ty = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(LiftCalculator::compute(Kpi::REVENUE, values), std::domain_error);

    values.post_ty = 1.0;
    values.pre_ly = std::numeric_limits<double>::infinity();
    EXPECT_THROW(LiftCalculator::compute(Kpi::CVR, values), std::domain_error);
}

TEST(LiftCalculatorTest, Rounding) {
    EXPECT_DOUBLE_EQ(LiftCalculator::round_to(1.23456789, 4), 1.2346);
    EXPECT_DOUBLE_EQ(LiftCalculator::round_to(0.0333333333, 6), 0.033333);
    EXPECT_EQ(LiftCalculator::round_to(-2.5, 0), -3.0);
    EXPECT_EQ(LiftCalculator::round_to(2.5, 0), 3.0);

    double tiny_negative = LiftCalculator::round_to(-0.00001, 4);
    EXPECT_EQ(tiny_negative, 0.0);
    EXPECT_FALSE(std::signbit(tiny_negative));
}

// ---------------------------------------------------------------------------
// DailyAlignmentBuilder
// ---------------------------------------------------------------------------

class DailyAlignmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        rows = {
            // before launch: not charted
            row("2024-01-09", "Search", 500.0, 50.0),
            // TY
            row("2024-01-10", "Search", 100.0, 10.0),
            row("2024-01-12", "Search", 80.0, 6.0),
            row("2024-01-12", "Search", 20.0, 0.0),
            // LY, launch-equivalent is 2023-01-10
            row("2023-01-11", "Search", 80.0, 4.0),
            row("2023-01-12", "Search", 40.0, 2.0),
            // past the LY window end
            row("2023-01-13", "Search", 999.0, 9.0),
        };
    }

    std::vector<DailyObservation> rows;
};

TEST_F(DailyAlignmentTest, OffsetsAreUnionOfBothYears) {
    auto series = DailyAlignmentBuilder::align(rows, d("2024-01-10"), PeriodRequest::all());

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series[0].day_offset, 0);
    EXPECT_EQ(series[1].day_offset, 1);
    EXPECT_EQ(series[2].day_offset, 2);

    // TY only
    ASSERT_TRUE(series[0].ty_value(Kpi::VISITS).has_value());
    EXPECT_DOUBLE_EQ(*series[0].ty_value(Kpi::VISITS), 100.0);
    EXPECT_FALSE(series[0].ly_value(Kpi::VISITS).has_value());

    // LY only: TY side is null, not zero
    EXPECT_FALSE(series[1].ty_value(Kpi::VISITS).has_value());
    EXPECT_FALSE(series[1].ty_value(Kpi::CVR).has_value());
    ASSERT_TRUE(series[1].ly_value(Kpi::VISITS).has_value());
    EXPECT_DOUBLE_EQ(*series[1].ly_value(Kpi::VISITS), 80.0);
}

TEST_F(DailyAlignmentTest, CalendarDatesPerSide) {
    auto series = DailyAlignmentBuilder::align(rows, d("2024-01-10"), PeriodRequest::all());
    ASSERT_EQ(series.size(), 3u);

    EXPECT_EQ(series[1].ty_date.to_string(), "2024-01-11");
    EXPECT_EQ(series[1].ly_date.to_string(), "2023-01-11");
    EXPECT_EQ(series[0].ly_date.to_string(), "2023-01-10");
}

TEST_F(DailyAlignmentTest, DailyRatiosUseSummedPrimaries) {
    auto series = DailyAlignmentBuilder::align(rows, d("2024-01-10"), PeriodRequest::all());
    ASSERT_EQ(series.size(), 3u);

    // 6 orders over 100 visits, not the mean of 7.5% and 0%
    EXPECT_DOUBLE_EQ(*series[2].ty_value(Kpi::VISITS), 100.0);
    EXPECT_DOUBLE_EQ(*series[2].ty_value(Kpi::CVR), 0.06);
    EXPECT_DOUBLE_EQ(*series[2].ly_value(Kpi::CVR), 0.05);
}

TEST_F(DailyAlignmentTest, PeriodLimitsBothSides) {
    auto series = DailyAlignmentBuilder::align(rows, d("2024-01-10"), PeriodRequest::days(1));

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.back().day_offset, 1);
}

TEST_F(DailyAlignmentTest, EmptyWithoutAnchor) {
    EXPECT_TRUE(DailyAlignmentBuilder::align(rows, std::nullopt, PeriodRequest::all()).empty());
    EXPECT_TRUE(DailyAlignmentBuilder::align({}, d("2024-01-10"), PeriodRequest::all()).empty());
    // launch after the latest observation
    EXPECT_TRUE(DailyAlignmentBuilder::align(rows, d("2024-02-01"), PeriodRequest::all()).empty());
}

// ---------------------------------------------------------------------------
// AnalysisEngine
// ---------------------------------------------------------------------------

class AnalysisEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dataset.launches.emplace_back("Search", d("2024-01-01"));

        dataset.observations = {
            row("2024-01-01", "Search", 100.0, 5.0, 500.0),
            row("2024-01-05", "Search", 50.0, 0.0, 0.0),
            // zero row that sets the data horizon to 2024-01-11
            row("2024-01-11", "Search", 0.0, 0.0, 0.0),
        };
    }

    liftscope::core::Dataset dataset;
};

TEST_F(AnalysisEngineTest, PostLaunchWithoutLastYearData) {
    auto results = AnalysisEngine::analyze(dataset, AnalysisQuery());
    ASSERT_EQ(results.size(), 6u);

    const AnalysisResult* visits = find_result(results, "Search", Kpi::VISITS);
    ASSERT_NE(visits, nullptr);
    EXPECT_DOUBLE_EQ(visits->post_ty, 150.0);
    EXPECT_DOUBLE_EQ(visits->post_ly, 0.0);
    EXPECT_EQ(visits->post_lift, 0.0);
    EXPECT_EQ(visits->period_days(), 10);
    EXPECT_EQ(visits->total_post_days(), 10);
    EXPECT_EQ(visits->max_data_date().to_string(), "2024-01-11");

    const AnalysisResult* cvr = find_result(results, "Search", Kpi::CVR);
    ASSERT_NE(cvr, nullptr);
    EXPECT_DOUBLE_EQ(cvr->post_ty, 0.033333);
    EXPECT_DOUBLE_EQ(cvr->post_lift, 333.3333);
    EXPECT_EQ(cvr->pre_lift, 0.0);
    EXPECT_DOUBLE_EQ(cvr->pre_post_comp_lift, 333.3333);
    EXPECT_TRUE(cvr->is_bps);

    const AnalysisResult* orders = find_result(results, "Search", Kpi::ORDERS);
    ASSERT_NE(orders, nullptr);
    EXPECT_DOUBLE_EQ(orders->post_ty, 5.0);
    EXPECT_FALSE(orders->is_bps);
}

TEST_F(AnalysisEngineTest, PreAndPostAgainstLastYear) {
    // pre-TY window is [2023-12-22, 2023-12-31], LY windows 365 days earlier
    dataset.observations.push_back(row("2023-12-25", "Search", 110.0, 11.0, 220.0));
    dataset.observations.push_back(row("2022-12-25", "Search", 100.0, 10.0, 200.0));
    dataset.observations.push_back(row("2023-01-03", "Search", 120.0, 4.0, 400.0));

    auto results = AnalysisEngine::analyze(dataset, AnalysisQuery());

    const AnalysisResult* visits = find_result(results, "Search", Kpi::VISITS);
    ASSERT_NE(visits, nullptr);
    EXPECT_DOUBLE_EQ(visits->pre_ty, 110.0);
    EXPECT_DOUBLE_EQ(visits->pre_ly, 100.0);
    EXPECT_DOUBLE_EQ(visits->pre_lift, 10.0);
    EXPECT_DOUBLE_EQ(visits->post_ly, 120.0);
    EXPECT_DOUBLE_EQ(visits->post_lift, 25.0);
    EXPECT_DOUBLE_EQ(visits->pre_post_comp_lift, 15.0);

    const AnalysisResult* cvr = find_result(results, "Search", Kpi::CVR);
    ASSERT_NE(cvr, nullptr);
    // pre: 0.1 vs 0.1; post: 5/150 vs 4/120
    EXPECT_EQ(cvr->pre_lift, 0.0);
    EXPECT_NEAR(cvr->post_lift, 0.0, 1e-4);
}

TEST_F(AnalysisEngineTest, FutureLaunchIsExcluded) {
    dataset.launches.emplace_back("Checkout", d("2025-06-01"));
    dataset.observations.push_back(row("2024-01-03", "Checkout", 10.0, 1.0, 5.0));

    auto results = AnalysisEngine::analyze(dataset, AnalysisQuery());

    ASSERT_EQ(results.size(), 6u);
    for (const auto& r : results) {
        EXPECT_EQ(r.use_case, "Search");
    }
}

TEST_F(AnalysisEngineTest, UseCaseWithoutRowsIsExcluded) {
    dataset.launches.emplace_back("Checkout", d("2023-06-01"));
    auto results = AnalysisEngine::analyze(dataset, AnalysisQuery());
    EXPECT_EQ(results.size(), 6u);
}

TEST_F(AnalysisEngineTest, HorizonFollowsFilteredRows) {
    DailyObservation late = row("2024-03-01", "Search", 10.0, 1.0, 5.0);
    late.business_segment = "B2B";
    dataset.observations.push_back(late);

    auto unfiltered = AnalysisEngine::analyze(dataset, AnalysisQuery());
    ASSERT_FALSE(unfiltered.empty());
    EXPECT_EQ(unfiltered.front().max_data_date().to_string(), "2024-03-01");

    AnalysisQuery query;
    query.segments.business_segment = "All";
    query.segments.device_type = "All";
    query.segments.page_type = "All";
    EXPECT_EQ(AnalysisEngine::analyze(dataset, query).front().max_data_date().to_string(), "2024-03-01");

    query.segments.business_segment = "b2c";
    EXPECT_TRUE(AnalysisEngine::analyze(dataset, query).empty());
}

TEST_F(AnalysisEngineTest, FailingKpiIsDroppedAlone) {
    dataset.observations.push_back(row("2024-01-02", "Search", 10.0, 1.0,
                                       std::numeric_limits<double>::quiet_NaN()));

    auto results = AnalysisEngine::analyze(dataset, AnalysisQuery());

    // revenue, aov and rpv all depend on the bad revenue value
    ASSERT_EQ(results.size(), 3u);
    EXPECT_NE(find_result(results, "Search", Kpi::VISITS), nullptr);
    EXPECT_NE(find_result(results, "Search", Kpi::ORDERS), nullptr);
    EXPECT_NE(find_result(results, "Search", Kpi::CVR), nullptr);
    EXPECT_EQ(find_result(results, "Search", Kpi::REVENUE), nullptr);
}

TEST_F(AnalysisEngineTest, QueryRestrictsUseCaseAndKpi) {
    dataset.launches.emplace_back("Checkout", d("2024-01-02"));
    dataset.observations.push_back(row("2024-01-04", "Checkout", 10.0, 1.0, 5.0));

    AnalysisQuery query;
    EXPECT_EQ(AnalysisEngine::analyze(dataset, query).size(), 12u);

    query.use_case = "Checkout";
    auto results = AnalysisEngine::analyze(dataset, query);
    ASSERT_EQ(results.size(), 6u);
    EXPECT_EQ(results.front().use_case, "Checkout");

    query.kpi = Kpi::AOV;
    results = AnalysisEngine::analyze(dataset, query);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().kpi, Kpi::AOV);
}

TEST_F(AnalysisEngineTest, RepeatedCallsAreIdentical) {
    dataset.observations.push_back(row("2023-01-03", "Search", 120.0, 4.0, 401.13));

    AnalysisQuery query;
    query.period = PeriodRequest::days(7);

    std::ostringstream first;
    std::ostringstream second;
    liftscope::report::write_analysis_csv(first, AnalysisEngine::analyze(dataset, query));
    liftscope::report::write_analysis_csv(second, AnalysisEngine::analyze(dataset, query));
    EXPECT_EQ(first.str(), second.str());

    std::ostringstream chart_first;
    std::ostringstream chart_second;
    query.use_case = "Search";
    liftscope::report::write_comparison_csv(chart_first, AnalysisEngine::comparison(dataset, query));
    liftscope::report::write_comparison_csv(chart_second, AnalysisEngine::comparison(dataset, query));
    EXPECT_EQ(chart_first.str(), chart_second.str());
}

TEST_F(AnalysisEngineTest, ChartAndAnalysisAgreeOnTotals) {
    dataset.observations.push_back(row("2023-01-03", "Search", 120.0, 4.0, 400.0));
    dataset.observations.push_back(row("2023-01-09", "Search", 30.0, 1.0, 40.0));

    AnalysisQuery query;
    query.use_case = "Search";
    query.period = PeriodRequest::days(6);

    auto results = AnalysisEngine::analyze(dataset, query);
    auto series = AnalysisEngine::comparison(dataset, query);

    double ty_visits = 0.0;
    double ly_visits = 0.0;
    for (const auto& point : series) {
        ty_visits += point.ty_value(Kpi::VISITS).value_or(0.0);
        ly_visits += point.ly_value(Kpi::VISITS).value_or(0.0);
    }

    const AnalysisResult* visits = find_result(results, "Search", Kpi::VISITS);
    ASSERT_NE(visits, nullptr);
    EXPECT_DOUBLE_EQ(visits->post_ty, ty_visits);
    EXPECT_DOUBLE_EQ(visits->post_ly, ly_visits);
    EXPECT_DOUBLE_EQ(ly_visits, 120.0);
}

TEST_F(AnalysisEngineTest, ComparisonNeedsUseCase) {
    EXPECT_TRUE(AnalysisEngine::comparison(dataset, AnalysisQuery()).empty());

    AnalysisQuery query;
    query.use_case = "Unknown";
    EXPECT_TRUE(AnalysisEngine::comparison(dataset, query).empty());
}

TEST_F(AnalysisEngineTest, SummaryFromLaunchOnward) {
    dataset.observations.push_back(row("2023-12-30", "Search", 1000.0, 1.0, 1.0));

    AnalysisQuery query;
    query.use_case = "Search";
    auto summary = AnalysisEngine::summary(dataset, query);
    EXPECT_DOUBLE_EQ(summary.visits, 150.0);
    EXPECT_DOUBLE_EQ(summary.orders, 5.0);
    EXPECT_DOUBLE_EQ(summary.cvr, 0.033333);
    EXPECT_DOUBLE_EQ(summary.aov, 100.0);
    EXPECT_DOUBLE_EQ(summary.rpv, 3.3333);

    query.period = PeriodRequest::days(2);
    EXPECT_DOUBLE_EQ(AnalysisEngine::summary(dataset, query).visits, 100.0);

    // no use case: every row, no launch restriction
    EXPECT_DOUBLE_EQ(AnalysisEngine::summary(dataset, AnalysisQuery()).visits, 1150.0);
}

TEST_F(AnalysisEngineTest, HugePeriodKeepsEveryPostLaunchRow) {
    AnalysisQuery query;
    query.use_case = "Search";
    query.period = PeriodRequest::parse("9223372036854775807");

    EXPECT_DOUBLE_EQ(AnalysisEngine::summary(dataset, query).visits, 150.0);
    EXPECT_EQ(AnalysisEngine::daily_series(dataset, query).size(), 3u);

    auto results = AnalysisEngine::analyze(dataset, query);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results.front().period_days(), 10);
}

TEST_F(AnalysisEngineTest, SummaryRejectsOverflowingTotals) {
    dataset.observations.push_back(row("2024-01-02", "Search", 1.7e308, 0.0, 0.0));
    dataset.observations.push_back(row("2024-01-03", "Search", 1.7e308, 0.0, 0.0));

    AnalysisQuery query;
    query.use_case = "Search";
    EXPECT_THROW(AnalysisEngine::summary(dataset, query), std::domain_error);
}

TEST_F(AnalysisEngineTest, DailySeries) {
    AnalysisQuery query;
    query.use_case = "Search";
    query.period = PeriodRequest::days(5);

    auto points = AnalysisEngine::daily_series(dataset, query);
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0].date.to_string(), "2024-01-01");
    EXPECT_EQ(points[1].date.to_string(), "2024-01-05");
    EXPECT_EQ(points[0].use_case, "Search");
    EXPECT_DOUBLE_EQ(points[0].totals.cvr(), 0.05);

    EXPECT_EQ(AnalysisEngine::daily_series(dataset, AnalysisQuery()).front().use_case, "All");
}

TEST_F(AnalysisEngineTest, Catalogue) {
    dataset.launches.emplace_back("Checkout", d("2024-02-01"));
    dataset.launches.back().stakeholders = {"pm@example.com"};

    DailyObservation plp = row("2024-01-02", "Search", 1.0, 0.0);
    plp.page_type = "PLP";
    DailyObservation pdp = row("2024-01-02", "Search", 1.0, 0.0);
    pdp.page_type = "PDP";
    dataset.observations.push_back(plp);
    dataset.observations.push_back(pdp);
    dataset.observations.push_back(plp);

    EXPECT_EQ(AnalysisEngine::use_cases(dataset), (std::vector<std::string>{"Search", "Checkout"}));
    EXPECT_EQ(AnalysisEngine::launch_date(dataset, "Checkout"), d("2024-02-01"));
    EXPECT_FALSE(AnalysisEngine::launch_date(dataset, "Missing").has_value());
    EXPECT_EQ(AnalysisEngine::stakeholders(dataset, "Checkout"), (std::vector<std::string>{"pm@example.com"}));
    EXPECT_TRUE(AnalysisEngine::stakeholders(dataset, "Search").empty());
    EXPECT_EQ(AnalysisEngine::page_types(dataset), (std::vector<std::string>{"All", "PDP", "PLP"}));
}

TEST(AnalysisQueryTest, FromConfig) {
    liftscope::utils::Config config;
    std::istringstream in(
        "use_case = Search\n"
        "period = 30\n"
        "business_segment = B2B\n"
        "device_type =\n"
        "kpi = CVR\n");
    config.load_from_stream(in);

    auto query = AnalysisQuery::from_config(config);
    EXPECT_EQ(query.use_case, std::optional<std::string>("Search"));
    EXPECT_EQ(query.period.requested_days(), 30);
    EXPECT_EQ(query.segments.business_segment, std::optional<std::string>("B2B"));
    EXPECT_FALSE(query.segments.device_type.has_value());
    EXPECT_EQ(query.kpi, Kpi::CVR);
}

TEST(AnalysisQueryTest, RejectsBadParameters) {
    liftscope::utils::Config config;
    config.set("kpi", "ctr");
    EXPECT_THROW(AnalysisQuery::from_config(config), std::invalid_argument);

    liftscope::utils::Config period_config;
    period_config.set("period", "-3");
    EXPECT_THROW(AnalysisQuery::from_config(period_config), std::invalid_argument);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
