#pragma once
#include <liftscope/core/dataset.hpp>
#include <liftscope/core/observation.hpp>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace liftscope::data {

// Structurally invalid input: missing file or column, unparsable date,
// non-numeric or negative counter. The message names source and line.
class IngestionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Splits one CSV record. Fields may be double-quoted; "" inside quotes is a
// literal quote. Records spanning several lines are not supported.
std::vector<std::string> split_csv_line(const std::string& line);

class CsvLoader {
public:
    // Daily KPI table. Required columns: date, use_case. Optional: visits,
    // orders, revenue (blank -> 0), business_segment, device_type, page_type
    // (blank -> "All"). Input cvr/aov/rpv columns are ignored.
    static std::vector<core::DailyObservation> load_daily_data(const std::string& path);
    static std::vector<core::DailyObservation> parse_daily_data(std::istream& in,
                                                                const std::string& source);

    // Launch table. Required: use_case, launch_date. Optional: description,
    // stakeholders. A repeated use_case keeps its first row.
    static std::vector<core::FeatureLaunch> load_feature_config(const std::string& path);
    static std::vector<core::FeatureLaunch> parse_feature_config(std::istream& in,
                                                                 const std::string& source);

    static core::Dataset load_dataset(const std::string& daily_data_path,
                                      const std::string& feature_config_path);
};

} // namespace liftscope::data
