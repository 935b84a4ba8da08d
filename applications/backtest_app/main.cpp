// applications/backtest_app/main.cpp
#include "meridian/backtest/backtest_engine.hpp"
#include "meridian/data/csv_loader.hpp"
#include "meridian/report/report.hpp"
#include "meridian/strategy/strategy_factory.hpp"
#include "meridian/utils/config.hpp"
#include "meridian/utils/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::string file_stem(const std::string& strategy_type, size_t index) {
    return std::to_string(index + 1) + "_" + strategy_type;
}

} // namespace

int main(int argc, char** argv) {
    using namespace meridian;

    try {
        // Load configuration
        std::string config_file = argc > 1 ? argv[1] : "meridian.conf";
        auto config = utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        utils::Logger::set_level(utils::Logger::level_from_string(config->get("log_level", "info")));

        // Load data
        std::string data_file = config->get("data_file", "data.csv");
        core::PriceSeries series = data::CsvLoader::load(data_file);

        // Create strategies
        std::vector<std::string> types = config->get_list("strategies");
        if (types.empty()) {
            types = strategy::StrategyFactory::get_registered_types();
        }

        std::vector<strategy::Strategy> strategies;
        for (const auto& type : types) {
            strategy::StrategyParams params = config->with_prefix("strategy." + type + ".");
            auto created = strategy::StrategyFactory::create_strategy(type, params);
            if (!created) {
                std::cerr << "Failed to create strategy of type " << type << std::endl;
                return 1;
            }
            strategies.push_back(std::move(*created));
        }

        // Run backtests
        backtest::BacktestEngine engine(backtest::BacktestConfiguration::from_config(*config));
        size_t thread_count = config->get<size_t>("thread_count", std::thread::hardware_concurrency());
        if (thread_count == 0) {
            thread_count = 1;
        }

        std::cout << "Running " << strategies.size() << " backtests on " << series.size() << " bars..." << std::endl;
        auto outcomes = engine.run_batch(strategies, series, thread_count);

        // Display results
        for (const auto& outcome : outcomes) {
            if (outcome.ok()) {
                report::print_summary(*outcome.result, std::cout);
            }
        }
        std::cout << std::endl;
        report::print_comparison(outcomes, std::cout);

        // Export
        std::string report_dir = config->get("report_dir", "");
        if (!report_dir.empty()) {
            std::filesystem::create_directories(report_dir);
            for (size_t i = 0; i < outcomes.size(); ++i) {
                if (!outcomes[i].ok()) {
                    continue;
                }
                std::string stem = report_dir + "/" + file_stem(types[i], i);
                bool exported = report::write_trade_log(*outcomes[i].result, stem + "_trades.csv") &&
                                report::write_equity_curve(*outcomes[i].result, stem + "_equity.csv");
                if (!exported) {
                    std::cerr << "Failed to export report for " << outcomes[i].strategy_name << std::endl;
                    return 1;
                }
            }
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
