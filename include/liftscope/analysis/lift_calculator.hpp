#pragma once
#include <liftscope/core/kpi.hpp>

namespace liftscope::analysis {

// Decimal places kept on output for wire stability.
inline constexpr int VALUE_PRECISION = 6;
inline constexpr int LIFT_PRECISION = 4;

// One KPI's value in each of the four comparison windows.
struct WindowValues {
    double pre_ly = 0.0;
    double pre_ty = 0.0;
    double post_ly = 0.0;
    double post_ty = 0.0;
};

struct KpiLift {
    double pre_lift = 0.0;
    double post_lift = 0.0;
    double comp_lift = 0.0;  // post_lift - pre_lift, same unit
    bool is_bps = false;
};

class LiftCalculator {
public:
    // PERCENT: (ty - ly) / ly * 100, or 0 when ly == 0.
    // BASIS_POINTS: (ty - ly) * 10000.
    static double lift(double ty, double ly, core::LiftUnit unit);

    // Pre, post and composite lift for kpi, rounded to LIFT_PRECISION.
    // Throws std::domain_error when any window value is not finite.
    static KpiLift compute(core::Kpi kpi, const WindowValues& values);

    // Half away from zero; never returns -0.0.
    static double round_to(double value, int places);
};

} // namespace liftscope::analysis
