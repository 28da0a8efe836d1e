#include <liftscope/core/dataset.hpp>
#include <algorithm>

namespace liftscope::core {

const FeatureLaunch* Dataset::find_launch(const std::string& use_case) const {
    auto it = std::find_if(launches.begin(), launches.end(),
        [&use_case](const FeatureLaunch& launch) {
            return launch.use_case == use_case;
        });

    return it != launches.end() ? &*it : nullptr;
}

} // namespace liftscope::core
