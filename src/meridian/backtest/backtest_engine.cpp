#include <meridian/backtest/backtest_engine.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>

namespace meridian::backtest {

double QuantityRule::round_quantity(double raw_quantity) const {
    if (quantity_precision < 0) {
        return raw_quantity;
    }
    double scale = std::pow(10.0, quantity_precision);
    return std::round(raw_quantity * scale) / scale;
}

void BacktestConfiguration::validate() const {
    if (!(initial_capital > 0.0)) {
        throw core::ConfigError("initial_capital must be positive");
    }
    if (commission < 0.0 || commission >= 1.0) {
        throw core::ConfigError("commission must be in [0, 1)");
    }
    if (slippage < 0.0 || slippage >= 1.0) {
        throw core::ConfigError("slippage must be in [0, 1)");
    }
    if (!(max_position_fraction > 0.0) || max_position_fraction > 1.0) {
        throw core::ConfigError("max_position_fraction must be in (0, 1]");
    }
    if (quantity_rule.min_order_quantity < 0.0 || quantity_rule.min_notional < 0.0) {
        throw core::ConfigError("exchange minimums must be non-negative");
    }
    if (periods_per_year <= 0) {
        throw core::ConfigError("periods_per_year must be positive");
    }
}

BacktestConfiguration BacktestConfiguration::from_config(const utils::Config& config) {
    BacktestConfiguration result;
    result.initial_capital = config.get("initial_capital", result.initial_capital);
    result.commission = config.get("commission", result.commission);
    result.slippage = config.get("slippage", result.slippage);
    result.max_position_fraction = config.get("max_position_fraction", result.max_position_fraction);
    result.quantity_rule.quantity_precision =
        config.get("quantity_precision", result.quantity_rule.quantity_precision);
    result.quantity_rule.min_order_quantity =
        config.get("min_order_quantity", result.quantity_rule.min_order_quantity);
    result.quantity_rule.min_notional = config.get("min_notional", result.quantity_rule.min_notional);
    result.periods_per_year = config.get("periods_per_year", result.periods_per_year);
    result.validate();
    return result;
}

BacktestEngine::BacktestEngine(const BacktestConfiguration& config) : config_(config) {
    config_.validate();
}

void BacktestEngine::configure(const BacktestConfiguration& config) {
    config.validate();
    config_ = config;
}

double BacktestEngine::execution_price(double close, core::Signal signal) const {
    switch (signal) {
        case core::Signal::LONG:
            return close * (1.0 + config_.slippage);
        case core::Signal::SHORT:
            return close * (1.0 - config_.slippage);
        case core::Signal::FLAT:
            break;
    }
    return close;
}

void BacktestEngine::try_open_position(RunContext& ctx, const core::Bar& bar,
                                       core::Signal signal, double price) const {
    const QuantityRule& rule = config_.quantity_rule;
    double cash = ctx.portfolio.cash();

    double target_notional = std::min(cash * config_.max_position_fraction, cash);
    double quantity = rule.round_quantity(target_notional / price);

    if (quantity <= 0.0) {
        utils::Logger::debug() << "Sizing rejected at " << bar.timestamp
                               << ": quantity rounds to zero" << utils::Logger::endl;
        return;
    }
    if (quantity < rule.min_order_quantity) {
        utils::Logger::debug() << "Sizing rejected at " << bar.timestamp << ": quantity " << quantity
                               << " below minimum order " << rule.min_order_quantity << utils::Logger::endl;
        return;
    }

    double notional = quantity * price;
    if (notional < rule.min_notional) {
        utils::Logger::debug() << "Sizing rejected at " << bar.timestamp << ": notional " << notional
                               << " below minimum " << rule.min_notional << utils::Logger::endl;
        return;
    }
    if (notional * (1.0 + config_.commission) > cash) {
        utils::Logger::debug() << "Sizing rejected at " << bar.timestamp << ": notional " << notional
                               << " plus commission exceeds cash " << cash << utils::Logger::endl;
        return;
    }

    ctx.portfolio.open_position(bar.timestamp, quantity, price, config_.commission, signal);
}

void BacktestEngine::apply_trading_rules(RunContext& ctx, const core::Bar& bar,
                                         core::Signal signal, double price) const {
    // Single lot: enter only when flat, exit only when holding
    if (signal == core::Signal::LONG && !ctx.portfolio.has_position()) {
        try_open_position(ctx, bar, signal, price);
    } else if (signal == core::Signal::SHORT && ctx.portfolio.has_position()) {
        ctx.portfolio.close_position(bar.timestamp, price, config_.commission, signal);
    }
}

BacktestResult BacktestEngine::run_backtest(const strategy::Strategy& strategy,
                                            const core::PriceSeries& series) const {
    core::validate_series(series);

    std::vector<core::Signal> signals = strategy.generate_signals(series);
    return run_signals(strategy.name(), series, signals);
}

BacktestResult BacktestEngine::run_signals(const std::string& strategy_name,
                                           const core::PriceSeries& series,
                                           const std::vector<core::Signal>& signals) const {
    core::validate_series(series);

    if (signals.empty()) {
        throw core::StrategyError(strategy_name + ": strategy produced no signals");
    }
    if (signals.size() != series.size()) {
        throw core::StrategyError(strategy_name + ": " + std::to_string(signals.size()) +
                                  " signals for " + std::to_string(series.size()) + " bars");
    }

    auto start_time = std::chrono::steady_clock::now();
    utils::Logger::info() << "Backtest start: " << strategy_name << " (" << series.size()
                          << " bars)" << utils::Logger::endl;

    RunContext ctx(config_.initial_capital);
    ctx.equity_curve.reserve(series.size());
    ctx.signals.reserve(series.size());

    for (size_t i = 0; i < series.size(); ++i) {
        const core::Bar& bar = series[i];
        core::Signal signal = signals[i];
        double price = execution_price(bar.close, signal);

        apply_trading_rules(ctx, bar, signal, price);

        ctx.equity_curve.push_back(ctx.portfolio.snapshot(bar.timestamp, price));
        ctx.signals.emplace_back(bar.timestamp, signal, price);
    }

    utils::PerformanceAnalyzer analyzer(config_.initial_capital, config_.periods_per_year);

    BacktestResult result;
    result.strategy_name = strategy_name;
    result.data_points = series.size();
    result.performance = analyzer.analyze(ctx.equity_curve, ctx.portfolio.get_trades());
    result.trades = ctx.portfolio.get_trades();
    result.equity_curve = std::move(ctx.equity_curve);
    result.signals = std::move(ctx.signals);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    utils::Logger::info() << "Backtest finished: " << strategy_name
                          << " final equity " << result.performance.final_equity
                          << ", " << result.performance.total_trades << " trades ("
                          << duration << "ms)" << utils::Logger::endl;

    return result;
}

std::vector<RunOutcome> BacktestEngine::run_batch(const std::vector<strategy::Strategy>& strategies,
                                                  const core::PriceSeries& series,
                                                  size_t thread_count) const {
    std::vector<RunOutcome> outcomes(strategies.size());
    if (thread_count == 0) {
        thread_count = 1;
    }

    utils::Logger::info() << "Running " << strategies.size() << " backtests with up to "
                          << thread_count << " threads" << utils::Logger::endl;

    for (size_t batch_start = 0; batch_start < strategies.size(); batch_start += thread_count) {
        size_t batch_end = std::min(batch_start + thread_count, strategies.size());

        std::vector<std::future<BacktestResult>> futures;
        futures.reserve(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; ++i) {
            futures.push_back(std::async(std::launch::async, [this, &strategies, &series, i]() {
                return run_backtest(strategies[i], series);
            }));
        }

        for (size_t i = batch_start; i < batch_end; ++i) {
            RunOutcome& outcome = outcomes[i];
            outcome.strategy_name = strategies[i].name();
            try {
                outcome.result = futures[i - batch_start].get();
            } catch (const std::exception& e) {
                outcome.error = e.what();
                utils::Logger::error() << "Backtest failed: " << outcome.strategy_name
                                       << ": " << e.what() << utils::Logger::endl;
            }
        }
    }

    return outcomes;
}

std::vector<RunOutcome> rank_by_sortino(std::vector<RunOutcome> outcomes) {
    std::stable_sort(outcomes.begin(), outcomes.end(), [](const RunOutcome& a, const RunOutcome& b) {
        if (a.ok() != b.ok()) {
            return a.ok();
        }
        if (!a.ok()) {
            return false;
        }
        return utils::ratio_greater(a.result->performance.sortino_ratio,
                                    b.result->performance.sortino_ratio);
    });
    return outcomes;
}

} // namespace meridian::backtest
