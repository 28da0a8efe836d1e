#include <liftscope/data/dataset_store.hpp>
#include <liftscope/utils/logger.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace liftscope::data {

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

DatasetStore::Snapshot DatasetStore::replace(core::Dataset dataset) {
    dataset.last_updated = std::chrono::system_clock::now();
    Snapshot snapshot = std::make_shared<core::Dataset>(std::move(dataset));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = snapshot;
    }

    utils::Logger::info() << "Dataset replaced: " << snapshot->observations.size()
                          << " observations, " << snapshot->launches.size()
                          << " launches from " << snapshot->source << utils::Logger::endl;
    return snapshot;
}

DatasetStore::Snapshot DatasetStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

bool DatasetStore::has_data() const {
    return current() != nullptr;
}

DataStatus DatasetStore::status() const {
    Snapshot snapshot = current();

    DataStatus status;
    if (!snapshot) {
        return status;
    }

    status.has_data = true;
    status.records = snapshot->observations.size();
    status.last_updated = format_timestamp(snapshot->last_updated);
    for (const auto& launch : snapshot->launches) {
        status.use_cases.push_back(launch.use_case);
        status.launches.push_back(LaunchStatus{launch.use_case, launch.launch_date.to_string()});
    }
    return status;
}

} // namespace liftscope::data
