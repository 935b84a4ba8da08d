#include <meridian/backtest/backtest_engine.hpp>
#include <meridian/strategy/strategy_factory.hpp>
#include <meridian/utils/logger.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

// Random walk of half-hour bars
meridian::core::PriceSeries generate_series(size_t num_bars, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> step_dist(0.0, 0.5);
    std::uniform_real_distribution<double> wick_dist(0.0, 0.4);
    std::uniform_real_distribution<double> volume_dist(100.0, 10000.0);

    meridian::core::PriceSeries series;
    series.reserve(num_bars);

    int64_t timestamp = 1704067200;
    double price = 100.0;
    for (size_t i = 0; i < num_bars; ++i) {
        double open = price;
        price = std::max(1.0, price + step_dist(rng));
        double high = std::max(open, price) + wick_dist(rng);
        double low = std::max(0.5, std::min(open, price) - wick_dist(rng));
        series.emplace_back(timestamp, open, high, low, price, volume_dist(rng));
        timestamp += 1800;
    }
    return series;
}

int main(int argc, char* argv[]) {
    // Set log level to reduce output
    meridian::utils::Logger::set_level(meridian::utils::LogLevel::WARN);

    // Parse command line arguments
    size_t num_bars = 100000;
    int copies_per_type = 4;
    size_t thread_count = std::max(1u, std::thread::hardware_concurrency());

    if (argc > 1) {
        num_bars = std::stoul(argv[1]);
    }
    if (argc > 2) {
        copies_per_type = std::stoi(argv[2]);
    }
    if (argc > 3) {
        thread_count = std::stoul(argv[3]);
    }

    auto series = generate_series(num_bars, 12345);

    std::vector<meridian::strategy::Strategy> strategies;
    for (const auto& type : meridian::strategy::StrategyFactory::get_registered_types()) {
        for (int i = 0; i < copies_per_type; ++i) {
            auto strategy = meridian::strategy::StrategyFactory::create_strategy(type);
            if (strategy) {
                strategies.push_back(*strategy);
            }
        }
    }

    std::cout << "Running throughput benchmark with " << strategies.size()
              << " strategies over " << num_bars << " bars on " << thread_count << " threads" << std::endl;

    meridian::backtest::BacktestEngine engine;

    // Sequential baseline
    double equity_sum = 0.0;
    auto start_time = std::chrono::high_resolution_clock::now();
    for (const auto& strategy : strategies) {
        equity_sum += engine.run_backtest(strategy, series).performance.final_equity;
    }
    auto sequential_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time
    ).count();

    // Batch
    start_time = std::chrono::high_resolution_clock::now();
    auto outcomes = engine.run_batch(strategies, series, thread_count);
    auto batch_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time
    ).count();

    size_t failed = std::count_if(outcomes.begin(), outcomes.end(),
                                  [](const meridian::backtest::RunOutcome& o) { return !o.ok(); });

    double total_bars = static_cast<double>(num_bars) * strategies.size();

    std::cout << "Benchmark results:" << std::endl;
    std::cout << "Sequential time: " << sequential_us / 1000000.0 << " s ("
              << total_bars * 1000000.0 / std::max<int64_t>(1, sequential_us) << " bars/s)" << std::endl;
    std::cout << "Batch time: " << batch_us / 1000000.0 << " s ("
              << total_bars * 1000000.0 / std::max<int64_t>(1, batch_us) << " bars/s)" << std::endl;
    std::cout << "Speedup: " << static_cast<double>(sequential_us) / std::max<int64_t>(1, batch_us) << "x" << std::endl;
    std::cout << "Failed runs: " << failed << std::endl;
    std::cout << "Mean final equity: " << equity_sum / std::max<size_t>(1, strategies.size()) << std::endl;

    return failed == 0 ? 0 : 1;
}
