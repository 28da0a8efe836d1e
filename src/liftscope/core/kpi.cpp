#include <liftscope/core/kpi.hpp>
#include <algorithm>
#include <cctype>

namespace liftscope::core {

const char* kpi_display_name(Kpi kpi) {
    switch (kpi) {
        case Kpi::VISITS:
            return "VISITS";
        case Kpi::ORDERS:
            return "ORDERS";
        case Kpi::REVENUE:
            return "REVENUE";
        case Kpi::CVR:
            return "CVR";
        case Kpi::AOV:
            return "AOV";
        case Kpi::RPV:
            return "RPV";
    }
    return "UNKNOWN";
}

const char* kpi_query_name(Kpi kpi) {
    switch (kpi) {
        case Kpi::VISITS:
            return "visits";
        case Kpi::ORDERS:
            return "orders";
        case Kpi::REVENUE:
            return "revenue";
        case Kpi::CVR:
            return "cvr";
        case Kpi::AOV:
            return "aov";
        case Kpi::RPV:
            return "rpv";
    }
    return "unknown";
}

std::optional<Kpi> parse_kpi(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (Kpi kpi : ALL_KPIS) {
        if (lowered == kpi_query_name(kpi)) {
            return kpi;
        }
    }
    return std::nullopt;
}

LiftUnit lift_unit(Kpi kpi) {
    switch (kpi) {
        case Kpi::CVR:
            return LiftUnit::BASIS_POINTS;
        case Kpi::VISITS:
        case Kpi::ORDERS:
        case Kpi::REVENUE:
        case Kpi::AOV:
        case Kpi::RPV:
            return LiftUnit::PERCENT;
    }
    return LiftUnit::PERCENT;
}

} // namespace liftscope::core
