// applications/liftscope_app/main.cpp
#include "liftscope/analysis/analysis_engine.hpp"
#include "liftscope/data/csv_loader.hpp"
#include "liftscope/data/dataset_store.hpp"
#include "liftscope/report/csv_report.hpp"
#include "liftscope/utils/config.hpp"
#include "liftscope/utils/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using liftscope::utils::Logger;

int main(int argc, char** argv) {
    try {
        std::string config_file = argc > 1 ? argv[1] : "liftscope.conf";

        auto config = liftscope::utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file
                      << ". Using defaults." << std::endl;
        }

        Logger::set_level(liftscope::utils::parse_log_level(config->get("log_level", "info")));

        auto query = liftscope::analysis::AnalysisQuery::from_config(*config);

        liftscope::data::DatasetStore store;
        store.replace(liftscope::data::CsvLoader::load_dataset(
            config->get("daily_data_file", "daily_data.csv"),
            config->get("feature_config_file", "feature_config.csv")));
        auto snapshot = store.current();

        std::cout << "Running pre/post analysis (period: " << query.period.to_string() << ")..."
                  << std::endl;
        auto results = liftscope::analysis::AnalysisEngine::analyze(*snapshot, query);
        if (results.empty()) {
            std::cout << "No analysis results. Check if launch dates are before the latest data."
                      << std::endl;
        } else {
            liftscope::report::write_analysis_table(std::cout, results);
        }

        std::filesystem::path output_dir = config->get("output_directory", "./liftscope_results");
        std::filesystem::create_directories(output_dir);

        if (!liftscope::report::export_analysis_csv((output_dir / "analysis.csv").string(), results)) {
            return 1;
        }

        if (query.use_case) {
            auto series = liftscope::analysis::AnalysisEngine::comparison(*snapshot, query);
            std::cout << "TY/LY comparison for " << *query.use_case << ": "
                      << series.size() << " aligned days" << std::endl;
            if (!liftscope::report::export_comparison_csv((output_dir / "comparison.csv").string(),
                                                          series, query.kpi)) {
                return 1;
            }

            std::cout << "Post-launch summary:" << std::endl;
            liftscope::report::write_summary(
                std::cout, liftscope::analysis::AnalysisEngine::summary(*snapshot, query));
        }

        return 0;
    } catch (const std::exception& e) {
        Logger::error() << e.what() << Logger::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
