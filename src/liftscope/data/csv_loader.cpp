#include <liftscope/data/csv_loader.hpp>
#include <liftscope/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <execution>
#include <filesystem>
#include <fstream>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace liftscope::data {

namespace {

constexpr size_t MISSING_COLUMN = static_cast<size_t>(-1);

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n,") == std::string::npos;
}

std::string location(const std::string& source, size_t line_number) {
    return source + ":" + std::to_string(line_number);
}

class ColumnIndex {
public:
    explicit ColumnIndex(const std::vector<std::string>& header) {
        for (size_t i = 0; i < header.size(); ++i) {
            std::string name = lowercase(trim(header[i]));
            // Strip a UTF-8 byte order mark left on the first header cell.
            if (i == 0 && name.size() >= 3 && name.compare(0, 3, "\xEF\xBB\xBF") == 0) {
                name = name.substr(3);
            }
            if (!name.empty() && columns_.find(name) == columns_.end()) {
                columns_[name] = i;
            }
        }
    }

    size_t find(const std::string& name) const {
        auto it = columns_.find(name);
        return it != columns_.end() ? it->second : MISSING_COLUMN;
    }

    size_t require(const std::string& name, const std::string& source) const {
        size_t index = find(name);
        if (index == MISSING_COLUMN) {
            throw IngestionError(source + ": missing required column '" + name + "'");
        }
        return index;
    }

private:
    std::unordered_map<std::string, size_t> columns_;
};

std::string field(const std::vector<std::string>& fields, size_t index) {
    if (index == MISSING_COLUMN || index >= fields.size()) {
        return "";
    }
    return trim(fields[index]);
}

// Blank cells count as zero. Returns false for anything that is not a finite
// non-negative number.
bool parse_counter(const std::string& text, double& out) {
    if (text.empty()) {
        out = 0.0;
        return true;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value) || value < 0.0) {
        return false;
    }
    out = value;
    return true;
}

struct DailyColumns {
    size_t date;
    size_t use_case;
    size_t visits;
    size_t orders;
    size_t revenue;
    size_t business_segment;
    size_t device_type;
    size_t page_type;
};

struct ParsedLine {
    std::optional<core::DailyObservation> row;
    std::string error;
};

ParsedLine parse_daily_line(const std::string& line, const DailyColumns& columns) {
    ParsedLine parsed;
    if (is_blank(line)) {
        return parsed;
    }

    std::vector<std::string> fields = split_csv_line(line);
    core::DailyObservation row;

    try {
        row.date = core::Date::parse(field(fields, columns.date));
    } catch (const std::invalid_argument& e) {
        parsed.error = std::string("column 'date': ") + e.what();
        return parsed;
    }

    row.use_case = field(fields, columns.use_case);
    if (row.use_case.empty()) {
        parsed.error = "column 'use_case' is empty";
        return parsed;
    }

    const std::pair<size_t, double*> counters[] = {
        {columns.visits, &row.visits},
        {columns.orders, &row.orders},
        {columns.revenue, &row.revenue},
    };
    const char* counter_names[] = {"visits", "orders", "revenue"};
    for (size_t i = 0; i < 3; ++i) {
        std::string text = field(fields, counters[i].first);
        if (!parse_counter(text, *counters[i].second)) {
            parsed.error = std::string("column '") + counter_names[i] +
                           "' is not a non-negative number: '" + text + "'";
            return parsed;
        }
    }

    std::string segment = field(fields, columns.business_segment);
    std::string device = field(fields, columns.device_type);
    std::string page = field(fields, columns.page_type);
    row.business_segment = segment.empty() ? core::ALL_SEGMENTS : segment;
    row.device_type = device.empty() ? core::ALL_SEGMENTS : device;
    row.page_type = page.empty() ? core::ALL_SEGMENTS : page;

    parsed.row = std::move(row);
    return parsed;
}

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::ifstream open_input(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw IngestionError("CSV file does not exist: " + path);
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IngestionError("Failed to open CSV file: " + path);
    }
    return file;
}

} // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::vector<core::DailyObservation> CsvLoader::parse_daily_data(std::istream& in,
                                                               const std::string& source) {
    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::string> lines = read_lines(in);
    if (lines.empty() || is_blank(lines.front())) {
        throw IngestionError(source + ": missing header row");
    }

    ColumnIndex header(split_csv_line(lines.front()));
    DailyColumns columns{};
    columns.date = header.require("date", source);
    columns.use_case = header.require("use_case", source);
    columns.visits = header.find("visits");
    columns.orders = header.find("orders");
    columns.revenue = header.find("revenue");
    columns.business_segment = header.find("business_segment");
    columns.device_type = header.find("device_type");
    columns.page_type = header.find("page_type");

    // Parse data lines in parallel; failures are recorded per line so the
    // lowest failing line number is reported.
    std::vector<ParsedLine> parsed(lines.size() - 1);
    std::transform(
        std::execution::par,
        lines.begin() + 1,
        lines.end(),
        parsed.begin(),
        [&columns](const std::string& line) { return parse_daily_line(line, columns); }
    );

    std::vector<core::DailyObservation> rows;
    rows.reserve(parsed.size());
    for (size_t i = 0; i < parsed.size(); ++i) {
        if (!parsed[i].error.empty()) {
            // +2: one for the header, one for 1-based numbering
            throw IngestionError(location(source, i + 2) + ": " + parsed[i].error);
        }
        if (parsed[i].row) {
            rows.push_back(std::move(*parsed[i].row));
        }
    }

    std::stable_sort(std::execution::par, rows.begin(), rows.end(),
                     [](const core::DailyObservation& a, const core::DailyObservation& b) {
                         return a.date < b.date;
                     });

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    utils::Logger::info() << "Loaded " << rows.size() << " daily observations from "
                          << source << " (" << duration << "ms)" << utils::Logger::endl;
    return rows;
}

std::vector<core::DailyObservation> CsvLoader::load_daily_data(const std::string& path) {
    std::ifstream file = open_input(path);
    return parse_daily_data(file, path);
}

std::vector<core::FeatureLaunch> CsvLoader::parse_feature_config(std::istream& in,
                                                                 const std::string& source) {
    std::vector<std::string> lines = read_lines(in);
    if (lines.empty() || is_blank(lines.front())) {
        throw IngestionError(source + ": missing header row");
    }

    ColumnIndex header(split_csv_line(lines.front()));
    size_t use_case_column = header.require("use_case", source);
    size_t launch_column = header.require("launch_date", source);
    size_t description_column = header.find("description");
    size_t stakeholders_column = header.find("stakeholders");

    std::vector<core::FeatureLaunch> launches;
    std::unordered_set<std::string> seen;

    for (size_t i = 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) {
            continue;
        }
        std::vector<std::string> fields = split_csv_line(lines[i]);

        core::FeatureLaunch launch;
        launch.use_case = field(fields, use_case_column);
        if (launch.use_case.empty()) {
            throw IngestionError(location(source, i + 1) + ": column 'use_case' is empty");
        }

        std::string launch_text = field(fields, launch_column);
        if (launch_text.empty()) {
            throw IngestionError(location(source, i + 1) + ": use case '" + launch.use_case +
                                 "' has no launch_date");
        }
        try {
            launch.launch_date = core::Date::parse(launch_text);
        } catch (const std::invalid_argument& e) {
            throw IngestionError(location(source, i + 1) + ": column 'launch_date': " + e.what());
        }

        launch.description = field(fields, description_column);
        launch.stakeholders = core::parse_stakeholders(field(fields, stakeholders_column));

        if (!seen.insert(launch.use_case).second) {
            utils::Logger::warn() << location(source, i + 1) << ": duplicate launch for '"
                                  << launch.use_case << "', keeping the first"
                                  << utils::Logger::endl;
            continue;
        }
        launches.push_back(std::move(launch));
    }

    utils::Logger::info() << "Loaded " << launches.size() << " feature launches from "
                          << source << utils::Logger::endl;
    return launches;
}

std::vector<core::FeatureLaunch> CsvLoader::load_feature_config(const std::string& path) {
    std::ifstream file = open_input(path);
    return parse_feature_config(file, path);
}

core::Dataset CsvLoader::load_dataset(const std::string& daily_data_path,
                                      const std::string& feature_config_path) {
    core::Dataset dataset;
    dataset.observations = load_daily_data(daily_data_path);
    dataset.launches = load_feature_config(feature_config_path);
    dataset.source = daily_data_path + " + " + feature_config_path;
    return dataset;
}

} // namespace liftscope::data
