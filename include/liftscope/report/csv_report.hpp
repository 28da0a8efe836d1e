#pragma once
#include <liftscope/analysis/analysis_engine.hpp>
#include <liftscope/analysis/daily_alignment.hpp>
#include <liftscope/core/kpi.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace liftscope::report {

// Raw values are written with 6 decimals, lifts with 4. Missing comparison
// values are written as empty cells.
void write_analysis_csv(std::ostream& out, const std::vector<analysis::AnalysisResult>& results);

// Columns day_offset,date,ly_date then {kpi}_ty,{kpi}_ly for kpi or all six.
void write_comparison_csv(std::ostream& out, const analysis::ComparisonSeries& series,
                          const std::optional<core::Kpi>& kpi = std::nullopt);

void write_daily_csv(std::ostream& out, const std::vector<analysis::DailyKpiPoint>& points,
                     const std::optional<core::Kpi>& kpi = std::nullopt);

void write_summary(std::ostream& out, const analysis::KpiSummary& summary);

// Fixed-width console table of lifts.
void write_analysis_table(std::ostream& out, const std::vector<analysis::AnalysisResult>& results);

// "+12.5000%" or "-3.2100 bps"
std::string format_lift(double lift, bool is_bps);

// File variants log and return false when the file cannot be written.
bool export_analysis_csv(const std::string& path, const std::vector<analysis::AnalysisResult>& results);
bool export_comparison_csv(const std::string& path, const analysis::ComparisonSeries& series,
                           const std::optional<core::Kpi>& kpi = std::nullopt);

} // namespace liftscope::report
