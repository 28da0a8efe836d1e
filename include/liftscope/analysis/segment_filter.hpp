#pragma once
#include <liftscope/core/observation.hpp>
#include <optional>
#include <string>
#include <vector>

namespace liftscope::analysis {

// Restricts rows to a categorical subset. Each dimension is either unset,
// blank, "All" (any case), or a constraint. business_segment and device_type
// compare case-insensitively, page_type compares exactly. Constraints are
// combined with AND.
struct SegmentFilter {
    std::optional<std::string> business_segment;
    std::optional<std::string> device_type;
    std::optional<std::string> page_type;

    SegmentFilter() = default;
    SegmentFilter(std::optional<std::string> segment,
                  std::optional<std::string> device,
                  std::optional<std::string> page);

    bool matches(const core::DailyObservation& row) const;

    // True when no dimension constrains anything.
    bool is_pass_through() const;

    std::vector<core::DailyObservation> apply(const std::vector<core::DailyObservation>& rows) const;
};

// Rows whose use_case equals the given name exactly.
std::vector<core::DailyObservation> select_use_case(const std::vector<core::DailyObservation>& rows,
                                                    const std::string& use_case);

// True when the value leaves its dimension unconstrained.
bool is_all_sentinel(const std::optional<std::string>& value);

} // namespace liftscope::analysis
