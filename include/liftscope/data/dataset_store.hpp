#pragma once
#include <liftscope/core/dataset.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace liftscope::data {

struct LaunchStatus {
    std::string use_case;
    std::string launch_date;
};

struct DataStatus {
    bool has_data = false;
    size_t records = 0;
    std::vector<std::string> use_cases;
    std::vector<LaunchStatus> launches;
    std::string last_updated;  // ISO local timestamp, empty before first load
};

// Holds the current dataset. One writer replaces the whole snapshot; any
// number of readers take a shared_ptr and keep a consistent view of either
// the old or the new dataset for as long as they hold it.
class DatasetStore {
public:
    using Snapshot = std::shared_ptr<const core::Dataset>;

    DatasetStore() = default;
    DatasetStore(const DatasetStore&) = delete;
    DatasetStore& operator=(const DatasetStore&) = delete;

    // Stamps last_updated and publishes the dataset. Returns the new snapshot.
    Snapshot replace(core::Dataset dataset);

    // nullptr before the first replace().
    Snapshot current() const;

    bool has_data() const;

    DataStatus status() const;

private:
    mutable std::mutex mutex_;
    Snapshot snapshot_;
};

std::string format_timestamp(std::chrono::system_clock::time_point time);

} // namespace liftscope::data
