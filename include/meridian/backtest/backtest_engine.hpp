#pragma once

#include <meridian/core/market_data.hpp>
#include <meridian/core/order.hpp>
#include <meridian/core/portfolio.hpp>
#include <meridian/core/signal.hpp>
#include <meridian/strategy/strategy.hpp>
#include <meridian/utils/config.hpp>
#include <meridian/utils/performance_analyzer.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meridian::backtest {

// Exchange quantity rules for one trading pair
struct QuantityRule {
    int quantity_precision = -1;      // decimal places; negative = no rounding
    double min_order_quantity = 0.0;
    double min_notional = 0.0;

    // Rounds to quantity_precision decimals
    double round_quantity(double raw_quantity) const;
};

// Backtest configuration
struct BacktestConfiguration {
    double initial_capital = 50000.0;
    double commission = 0.001;            // fraction of notional, charged on both sides
    double slippage = 0.0005;             // fraction of close, against the trade direction
    double max_position_fraction = 0.1;   // share of cash committed per entry
    QuantityRule quantity_rule;
    int periods_per_year = 252;           // annualization of Sharpe/Sortino

    // Throws ConfigError on out-of-range values
    void validate() const;

    // Reads initial_capital, commission, slippage, max_position_fraction,
    // quantity_precision, min_order_quantity, min_notional, periods_per_year
    static BacktestConfiguration from_config(const utils::Config& config);
};

struct BacktestResult {
    std::string strategy_name;
    size_t data_points = 0;
    utils::PerformanceResult performance;
    std::vector<core::Trade> trades;
    std::vector<core::EquityPoint> equity_curve;
    std::vector<core::SignalRecord> signals;
};

// Result of one run inside a batch; exactly one of result / error is set
struct RunOutcome {
    std::string strategy_name;
    std::optional<BacktestResult> result;
    std::string error;

    bool ok() const { return result.has_value(); }
};

// Portfolio state of a single run. Created fresh for every run and never shared.
struct RunContext {
    core::Portfolio portfolio;
    std::vector<core::EquityPoint> equity_curve;
    std::vector<core::SignalRecord> signals;

    explicit RunContext(double initial_cash) : portfolio(initial_cash) {}
};

class BacktestEngine {
private:
    BacktestConfiguration config_;

    // Helper methods
    double execution_price(double close, core::Signal signal) const;
    void apply_trading_rules(RunContext& ctx, const core::Bar& bar, core::Signal signal, double price) const;
    void try_open_position(RunContext& ctx, const core::Bar& bar, core::Signal signal, double price) const;

public:
    explicit BacktestEngine(const BacktestConfiguration& config = {});

    // Configuration
    void configure(const BacktestConfiguration& config);
    const BacktestConfiguration& get_config() const { return config_; }

    // Execution

    // Validates the series, precomputes the strategy's signals and replays them.
    // Throws ValidationError / StrategyError before any bar is processed.
    BacktestResult run_backtest(const strategy::Strategy& strategy, const core::PriceSeries& series) const;

    // Replays an externally computed signal vector
    BacktestResult run_signals(const std::string& strategy_name,
                               const core::PriceSeries& series,
                               const std::vector<core::Signal>& signals) const;

    // Runs every strategy on its own state, up to thread_count at a time.
    // Outcomes keep the input order; a failed run leaves the others untouched.
    std::vector<RunOutcome> run_batch(const std::vector<strategy::Strategy>& strategies,
                                      const core::PriceSeries& series,
                                      size_t thread_count = std::thread::hardware_concurrency()) const;
};

// Successful outcomes by descending Sortino (+inf first), failed runs last
std::vector<RunOutcome> rank_by_sortino(std::vector<RunOutcome> outcomes);

} // namespace meridian::backtest
