#include <liftscope/analysis/lift_calculator.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace liftscope::analysis {

namespace {

constexpr double PERCENT_SCALE = 100.0;
constexpr double BPS_SCALE = 10000.0;

void require_finite(double value, const char* window, core::Kpi kpi) {
    if (!std::isfinite(value)) {
        throw std::domain_error(std::string("non-finite ") + core::kpi_display_name(kpi) +
                                " value in " + window + " window");
    }
}

} // namespace

double LiftCalculator::lift(double ty, double ly, core::LiftUnit unit) {
    switch (unit) {
        case core::LiftUnit::BASIS_POINTS:
            return (ty - ly) * BPS_SCALE;
        case core::LiftUnit::PERCENT:
            return ly != 0.0 ? (ty - ly) / ly * PERCENT_SCALE : 0.0;
    }
    return 0.0;
}

KpiLift LiftCalculator::compute(core::Kpi kpi, const WindowValues& values) {
    require_finite(values.pre_ly, "pre-LY", kpi);
    require_finite(values.pre_ty, "pre-TY", kpi);
    require_finite(values.post_ly, "post-LY", kpi);
    require_finite(values.post_ty, "post-TY", kpi);

    core::LiftUnit unit = core::lift_unit(kpi);
    double pre_lift = lift(values.pre_ty, values.pre_ly, unit);
    double post_lift = lift(values.post_ty, values.post_ly, unit);
    double comp_lift = post_lift - pre_lift;

    if (!std::isfinite(pre_lift) || !std::isfinite(post_lift) || !std::isfinite(comp_lift)) {
        throw std::domain_error(std::string("lift overflow for ") + core::kpi_display_name(kpi));
    }

    KpiLift result;
    result.pre_lift = round_to(pre_lift, LIFT_PRECISION);
    result.post_lift = round_to(post_lift, LIFT_PRECISION);
    result.comp_lift = round_to(comp_lift, LIFT_PRECISION);
    result.is_bps = unit == core::LiftUnit::BASIS_POINTS;
    return result;
}

double LiftCalculator::round_to(double value, int places) {
    double scale = std::pow(10.0, places);
    double scaled = value * scale;
    if (!std::isfinite(scaled)) {
        return value;
    }
    double rounded = std::round(scaled) / scale;
    return rounded == 0.0 ? 0.0 : rounded;
}

} // namespace liftscope::analysis
