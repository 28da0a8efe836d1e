#pragma once
#include <array>
#include <optional>
#include <string>

namespace liftscope::core {

enum class Kpi {
    VISITS,
    ORDERS,
    REVENUE,
    CVR,   // orders / visits
    AOV,   // revenue / orders
    RPV    // revenue / visits
};

enum class LiftUnit {
    PERCENT,
    BASIS_POINTS
};

inline constexpr std::array<Kpi, 6> ALL_KPIS = {
    Kpi::VISITS, Kpi::ORDERS, Kpi::REVENUE, Kpi::CVR, Kpi::AOV, Kpi::RPV
};

// "VISITS", "CVR", ...
const char* kpi_display_name(Kpi kpi);

// "visits", "cvr", ... as used in query parameters and CSV columns
const char* kpi_query_name(Kpi kpi);

// Case-insensitive; empty for an unknown name.
std::optional<Kpi> parse_kpi(const std::string& name);

LiftUnit lift_unit(Kpi kpi);

} // namespace liftscope::core
