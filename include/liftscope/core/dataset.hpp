#pragma once
#include <liftscope/core/observation.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace liftscope::core {

// The two input tables as loaded together. Immutable once published through
// a DatasetStore.
struct Dataset {
    std::vector<DailyObservation> observations;
    std::vector<FeatureLaunch> launches;  // config order, unique use_case
    std::string source;
    std::chrono::system_clock::time_point last_updated{};

    // nullptr when the use case has no launch row.
    const FeatureLaunch* find_launch(const std::string& use_case) const;
};

} // namespace liftscope::core
