#include <liftscope/report/csv_report.hpp>
#include <liftscope/analysis/lift_calculator.hpp>
#include <liftscope/utils/logger.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace liftscope::report {

namespace {

// Quotes a field when it contains a delimiter, quote or line break.
std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string fixed(double value, int places) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(places) << value;
    return out.str();
}

std::string optional_value(const std::optional<double>& value) {
    return value ? fixed(*value, analysis::VALUE_PRECISION) : std::string();
}

std::vector<core::Kpi> selected_kpis(const std::optional<core::Kpi>& kpi) {
    if (kpi) {
        return {*kpi};
    }
    return std::vector<core::Kpi>(core::ALL_KPIS.begin(), core::ALL_KPIS.end());
}

} // namespace

void write_analysis_csv(std::ostream& out, const std::vector<analysis::AnalysisResult>& results) {
    out << "use_case,kpi,pre_ly,pre_ty,pre_lift,post_ly,post_ty,post_lift,pre_post_comp_lift,unit,"
           "launch_date,period_days,total_post_days,max_data_date,"
           "pre_ty_start,pre_ty_end,post_ty_start,post_ty_end,"
           "pre_ly_start,pre_ly_end,post_ly_start,post_ly_end\n";

    for (const auto& r : results) {
        const analysis::AnalysisWindow& w = r.window;
        out << csv_field(r.use_case) << ","
            << core::kpi_display_name(r.kpi) << ","
            << fixed(r.pre_ly, analysis::VALUE_PRECISION) << ","
            << fixed(r.pre_ty, analysis::VALUE_PRECISION) << ","
            << fixed(r.pre_lift, analysis::LIFT_PRECISION) << ","
            << fixed(r.post_ly, analysis::VALUE_PRECISION) << ","
            << fixed(r.post_ty, analysis::VALUE_PRECISION) << ","
            << fixed(r.post_lift, analysis::LIFT_PRECISION) << ","
            << fixed(r.pre_post_comp_lift, analysis::LIFT_PRECISION) << ","
            << (r.is_bps ? "bps" : "pct") << ","
            << r.launch_date() << ","
            << r.period_days() << ","
            << r.total_post_days() << ","
            << r.max_data_date() << ","
            << w.pre_ty.first << "," << w.pre_ty.last << ","
            << w.post_ty.first << "," << w.post_ty.last << ","
            << w.pre_ly.first << "," << w.pre_ly.last << ","
            << w.post_ly.first << "," << w.post_ly.last << "\n";
    }
}

void write_comparison_csv(std::ostream& out, const analysis::ComparisonSeries& series,
                          const std::optional<core::Kpi>& kpi) {
    const std::vector<core::Kpi> kpis = selected_kpis(kpi);

    out << "day_offset,date,ly_date";
    for (core::Kpi k : kpis) {
        out << "," << core::kpi_query_name(k) << "_ty," << core::kpi_query_name(k) << "_ly";
    }
    out << "\n";

    for (const auto& point : series) {
        out << point.day_offset << "," << point.ty_date << "," << point.ly_date;
        for (core::Kpi k : kpis) {
            out << "," << optional_value(point.ty_value(k))
                << "," << optional_value(point.ly_value(k));
        }
        out << "\n";
    }
}

void write_daily_csv(std::ostream& out, const std::vector<analysis::DailyKpiPoint>& points,
                     const std::optional<core::Kpi>& kpi) {
    const std::vector<core::Kpi> kpis = selected_kpis(kpi);

    out << "date,use_case";
    for (core::Kpi k : kpis) {
        out << "," << core::kpi_query_name(k);
    }
    out << "\n";

    for (const auto& point : points) {
        out << point.date << "," << csv_field(point.use_case);
        for (core::Kpi k : kpis) {
            out << "," << fixed(analysis::MetricAggregator::metric(point.totals, k),
                                analysis::VALUE_PRECISION);
        }
        out << "\n";
    }
}

void write_summary(std::ostream& out, const analysis::KpiSummary& summary) {
    for (core::Kpi kpi : core::ALL_KPIS) {
        int places = kpi == core::Kpi::CVR ? analysis::VALUE_PRECISION : 4;
        out << std::left << std::setw(10) << core::kpi_display_name(kpi)
            << fixed(summary.value(kpi), places) << "\n";
    }
}

std::string format_lift(double lift, bool is_bps) {
    std::ostringstream out;
    out << std::showpos << std::fixed << std::setprecision(analysis::LIFT_PRECISION) << lift;
    out << (is_bps ? " bps" : "%");
    return out.str();
}

void write_analysis_table(std::ostream& out, const std::vector<analysis::AnalysisResult>& results) {
    out << std::left
        << std::setw(24) << "USE CASE"
        << std::setw(9) << "KPI"
        << std::setw(18) << "PRE LIFT"
        << std::setw(18) << "POST LIFT"
        << std::setw(18) << "COMP LIFT"
        << "WINDOW" << "\n";

    for (const auto& r : results) {
        out << std::left
            << std::setw(24) << r.use_case
            << std::setw(9) << core::kpi_display_name(r.kpi)
            << std::setw(18) << format_lift(r.pre_lift, r.is_bps)
            << std::setw(18) << format_lift(r.post_lift, r.is_bps)
            << std::setw(18) << format_lift(r.pre_post_comp_lift, r.is_bps)
            << r.window.post_ty.first << ".." << r.window.post_ty.last
            << " (" << r.period_days() << "/" << r.total_post_days() << " days)" << "\n";
    }
}

bool export_analysis_csv(const std::string& path, const std::vector<analysis::AnalysisResult>& results) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to create CSV file: " << path << utils::Logger::endl;
        return false;
    }

    write_analysis_csv(file, results);
    file.close();
    if (file.fail()) {
        utils::Logger::error() << "Failed to write CSV file: " << path << utils::Logger::endl;
        return false;
    }

    utils::Logger::info() << "Exported " << results.size() << " analysis rows to " << path
                          << utils::Logger::endl;
    return true;
}

bool export_comparison_csv(const std::string& path, const analysis::ComparisonSeries& series,
                           const std::optional<core::Kpi>& kpi) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to create CSV file: " << path << utils::Logger::endl;
        return false;
    }

    write_comparison_csv(file, series, kpi);
    file.close();
    if (file.fail()) {
        utils::Logger::error() << "Failed to write CSV file: " << path << utils::Logger::endl;
        return false;
    }

    utils::Logger::info() << "Exported " << series.size() << " comparison points to " << path
                          << utils::Logger::endl;
    return true;
}

} // namespace liftscope::report
