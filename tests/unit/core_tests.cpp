#include <gtest/gtest.h>
#include <meridian/backtest/backtest_engine.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/core/market_data.hpp>
#include <meridian/core/order.hpp>
#include <meridian/core/portfolio.hpp>
#include <meridian/core/signal.hpp>
#include <meridian/strategy/strategy.hpp>
#include <meridian/utils/config.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using meridian::core::Bar;
using meridian::core::PriceSeries;
using meridian::core::Signal;
using meridian::core::TradeAction;

namespace {

constexpr int64_t kStart = 1700000000;
constexpr int64_t kDay = 86400;

PriceSeries make_series(const std::vector<double>& closes, int64_t step = kDay) {
    PriceSeries series;
    for (size_t i = 0; i < closes.size(); ++i) {
        double c = closes[i];
        series.emplace_back(kStart + static_cast<int64_t>(i) * step, c, c, c, c, 1000.0);
    }
    return series;
}

PriceSeries rising_series(size_t n) {
    std::vector<double> closes;
    for (size_t i = 0; i < n; ++i) {
        closes.push_back(100.0 + static_cast<double>(i));
    }
    return make_series(closes);
}

meridian::backtest::BacktestConfiguration frictionless() {
    meridian::backtest::BacktestConfiguration config;
    config.commission = 0.0;
    config.slippage = 0.0;
    return config;
}

} // namespace

// Series validation
TEST(MarketDataTest, ValidSeriesPasses) {
    EXPECT_NO_THROW(meridian::core::validate_series(rising_series(5)));
}

TEST(MarketDataTest, RejectsEmptySeries) {
    EXPECT_THROW(meridian::core::validate_series({}), meridian::core::ValidationError);
}

TEST(MarketDataTest, RejectsNonIncreasingTimestamps) {
    PriceSeries series = rising_series(3);
    series[2].timestamp = series[1].timestamp;
    EXPECT_THROW(meridian::core::validate_series(series), meridian::core::ValidationError);
}

TEST(MarketDataTest, RejectsNonPositiveAndNaNPrices) {
    PriceSeries series = rising_series(3);
    series[1].low = 0.0;
    EXPECT_THROW(meridian::core::validate_series(series), meridian::core::ValidationError);

    series = rising_series(3);
    series[2].close = std::nan("");
    EXPECT_THROW(meridian::core::validate_series(series), meridian::core::ValidationError);
}

TEST(MarketDataTest, RejectsNegativeVolume) {
    PriceSeries series = rising_series(3);
    series[0].volume = -1.0;
    EXPECT_THROW(meridian::core::validate_series(series), meridian::core::ValidationError);
}

// Portfolio
TEST(PortfolioTest, OpenAndCloseAdjustCash) {
    meridian::core::Portfolio portfolio(10000.0);

    const auto& buy = portfolio.open_position(kStart, 10.0, 100.0, 0.001, Signal::LONG);
    EXPECT_EQ(buy.action, TradeAction::BUY);
    EXPECT_DOUBLE_EQ(buy.value, 1000.0);
    EXPECT_DOUBLE_EQ(buy.commission, 1.0);
    EXPECT_DOUBLE_EQ(portfolio.cash(), 8999.0);
    EXPECT_TRUE(portfolio.has_position());

    portfolio.close_position(kStart + kDay, 110.0, 0.001, Signal::SHORT);
    EXPECT_DOUBLE_EQ(portfolio.cash(), 8999.0 + 1100.0 - 1.1);
    EXPECT_FALSE(portfolio.has_position());
    EXPECT_EQ(portfolio.trade_count(), 2);
}

TEST(PortfolioTest, SingleLotAndCashGuards) {
    meridian::core::Portfolio portfolio(1000.0);
    EXPECT_THROW(portfolio.close_position(kStart, 100.0, 0.0, Signal::SHORT), std::logic_error);
    EXPECT_THROW(portfolio.open_position(kStart, 20.0, 100.0, 0.0, Signal::LONG), std::logic_error);

    portfolio.open_position(kStart, 5.0, 100.0, 0.0, Signal::LONG);
    EXPECT_THROW(portfolio.open_position(kStart, 1.0, 100.0, 0.0, Signal::LONG), std::logic_error);
}

TEST(PortfolioTest, SnapshotMarksPosition) {
    meridian::core::Portfolio portfolio(1000.0);
    portfolio.open_position(kStart, 5.0, 100.0, 0.0, Signal::LONG);

    auto point = portfolio.snapshot(kStart, 120.0);
    EXPECT_DOUBLE_EQ(point.cash, 500.0);
    EXPECT_DOUBLE_EQ(point.position, 5.0);
    EXPECT_DOUBLE_EQ(point.equity, 1100.0);
}

// Configuration
TEST(BacktestConfigurationTest, DefaultsAreValid) {
    meridian::backtest::BacktestConfiguration config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.initial_capital, 50000.0);
    EXPECT_DOUBLE_EQ(config.commission, 0.001);
    EXPECT_DOUBLE_EQ(config.slippage, 0.0005);
    EXPECT_DOUBLE_EQ(config.max_position_fraction, 0.1);
}

TEST(BacktestConfigurationTest, RejectsOutOfRangeValues) {
    meridian::backtest::BacktestConfiguration config;
    config.commission = 1.5;
    EXPECT_THROW(meridian::backtest::BacktestEngine engine(config), meridian::core::ConfigError);

    config = {};
    config.max_position_fraction = 0.0;
    EXPECT_THROW(config.validate(), meridian::core::ConfigError);

    config = {};
    config.initial_capital = -1.0;
    EXPECT_THROW(config.validate(), meridian::core::ConfigError);
}

TEST(BacktestConfigurationTest, ReadsFromConfig) {
    meridian::utils::Config config;
    config.load_from_string(
        "initial_capital = 1000\n"
        "commission = 0.002\n"
        "quantity_precision = 3\n"
        "min_notional = 5\n");

    auto parsed = meridian::backtest::BacktestConfiguration::from_config(config);
    EXPECT_DOUBLE_EQ(parsed.initial_capital, 1000.0);
    EXPECT_DOUBLE_EQ(parsed.commission, 0.002);
    EXPECT_DOUBLE_EQ(parsed.slippage, 0.0005);
    EXPECT_EQ(parsed.quantity_rule.quantity_precision, 3);
    EXPECT_DOUBLE_EQ(parsed.quantity_rule.min_notional, 5.0);
}

TEST(QuantityRuleTest, RoundsToPrecision) {
    meridian::backtest::QuantityRule rule;
    EXPECT_DOUBLE_EQ(rule.round_quantity(1.23456), 1.23456);

    rule.quantity_precision = 2;
    EXPECT_DOUBLE_EQ(rule.round_quantity(1.23456), 1.23);
    rule.quantity_precision = 0;
    EXPECT_DOUBLE_EQ(rule.round_quantity(49.6), 50.0);
}

// Engine
class BacktestEngineTest : public ::testing::Test {
protected:
    PriceSeries flat_series_ = make_series({100.0, 100.0, 100.0, 100.0});
};

TEST_F(BacktestEngineTest, SlippageMovesExecutionAgainstTrade) {
    auto config = frictionless();
    config.slippage = 0.01;
    meridian::backtest::BacktestEngine engine(config);

    auto result = engine.run_signals("custom", flat_series_,
                                     {Signal::LONG, Signal::FLAT, Signal::SHORT, Signal::FLAT});

    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_DOUBLE_EQ(result.trades[0].price, 101.0);
    EXPECT_DOUBLE_EQ(result.trades[1].price, 99.0);
    EXPECT_NEAR(result.trades[0].quantity, 5000.0 / 101.0, 1e-9);

    // The entry bar is marked at its execution price, FLAT bars at the close
    EXPECT_NEAR(result.equity_curve[0].equity, 50000.0, 1e-6);
    EXPECT_NEAR(result.equity_curve[1].equity, 45000.0 + 5000.0 / 101.0 * 100.0, 1e-6);
    EXPECT_NEAR(result.equity_curve[3].equity, 45000.0 + 5000.0 / 101.0 * 99.0, 1e-6);
    EXPECT_EQ(result.performance.round_trips, 1);
    EXPECT_EQ(result.performance.winning_trades, 0);
}

TEST_F(BacktestEngineTest, CommissionChargedOnBothSides) {
    auto config = frictionless();
    config.commission = 0.001;
    meridian::backtest::BacktestEngine engine(config);

    auto series = make_series({100.0, 105.0, 110.0});
    auto result = engine.run_signals("custom", series, {Signal::LONG, Signal::FLAT, Signal::SHORT});

    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_DOUBLE_EQ(result.trades[0].quantity, 50.0);
    EXPECT_DOUBLE_EQ(result.trades[0].commission, 5.0);
    EXPECT_DOUBLE_EQ(result.trades[1].commission, 5.5);
    EXPECT_NEAR(result.performance.final_equity, 50000.0 - 5000.0 - 5.0 + 5500.0 - 5.5, 1e-6);
    EXPECT_DOUBLE_EQ(result.performance.win_rate, 1.0);
}

TEST_F(BacktestEngineTest, EquityEqualsCashPlusMarkedPosition) {
    meridian::backtest::BacktestEngine engine;
    auto series = make_series({100.0, 102.0, 99.0, 104.0, 101.0, 97.0, 103.0});
    auto result = engine.run_signals(
        "custom", series,
        {Signal::LONG, Signal::LONG, Signal::SHORT, Signal::LONG, Signal::FLAT, Signal::SHORT, Signal::LONG});

    ASSERT_EQ(result.equity_curve.size(), series.size());
    for (const auto& point : result.equity_curve) {
        EXPECT_GE(point.cash, 0.0);
        EXPECT_NEAR(point.equity, point.cash + point.position * point.price, 1e-9);
    }
    EXPECT_EQ(result.trades.size(), 5u);
}

TEST_F(BacktestEngineTest, RepeatedLongDoesNotPyramid) {
    meridian::backtest::BacktestEngine engine(frictionless());
    auto result = engine.run_signals("custom", flat_series_,
                                     {Signal::LONG, Signal::LONG, Signal::LONG, Signal::LONG});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].action, TradeAction::BUY);
}

TEST_F(BacktestEngineTest, ShortWhileFlatDoesNothing) {
    meridian::backtest::BacktestEngine engine(frictionless());
    auto result = engine.run_signals("custom", flat_series_,
                                     {Signal::SHORT, Signal::SHORT, Signal::FLAT, Signal::SHORT});
    EXPECT_TRUE(result.trades.empty());
    EXPECT_DOUBLE_EQ(result.performance.final_equity, 50000.0);
}

TEST_F(BacktestEngineTest, FullAllocationRejectedWhenCommissionExceedsCash) {
    auto config = frictionless();
    config.commission = 0.001;
    config.max_position_fraction = 1.0;
    meridian::backtest::BacktestEngine engine(config);

    auto result = engine.run_signals("custom", flat_series_,
                                     {Signal::LONG, Signal::FLAT, Signal::FLAT, Signal::FLAT});
    EXPECT_TRUE(result.trades.empty());
}

TEST_F(BacktestEngineTest, QuantityRulesRejectSmallOrders) {
    auto config = frictionless();
    config.quantity_rule.min_order_quantity = 100.0;
    meridian::backtest::BacktestEngine engine(config);
    std::vector<Signal> signals = {Signal::LONG, Signal::FLAT, Signal::FLAT, Signal::FLAT};

    EXPECT_TRUE(engine.run_signals("custom", flat_series_, signals).trades.empty());

    config.quantity_rule.min_order_quantity = 0.0;
    config.quantity_rule.min_notional = 10000.0;
    engine.configure(config);
    EXPECT_DOUBLE_EQ(engine.get_config().quantity_rule.min_notional, 10000.0);
    EXPECT_TRUE(engine.run_signals("custom", flat_series_, signals).trades.empty());
}

TEST_F(BacktestEngineTest, QuantityRoundedToPrecision) {
    auto config = frictionless();
    config.slippage = 0.01;
    config.quantity_rule.quantity_precision = 0;
    meridian::backtest::BacktestEngine engine(config);

    auto result = engine.run_signals("custom", flat_series_,
                                     {Signal::LONG, Signal::FLAT, Signal::FLAT, Signal::FLAT});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(result.trades[0].quantity, 50.0);
    EXPECT_DOUBLE_EQ(result.equity_curve[0].cash, 50000.0 - 50.0 * 101.0);
}

TEST_F(BacktestEngineTest, MisalignedSignalsThrow) {
    meridian::backtest::BacktestEngine engine;
    EXPECT_THROW(engine.run_signals("custom", flat_series_, {Signal::LONG}),
                 meridian::core::StrategyError);
    EXPECT_THROW(engine.run_signals("custom", flat_series_, {}), meridian::core::StrategyError);

    meridian::strategy::CustomStrategy empty("empty", [](const PriceSeries&) {
        return std::vector<Signal>{};
    });
    EXPECT_THROW(engine.run_backtest(empty, flat_series_), meridian::core::StrategyError);
}

TEST_F(BacktestEngineTest, InvalidSeriesThrowsBeforeSignals) {
    meridian::backtest::BacktestEngine engine;
    int calls = 0;
    meridian::strategy::CustomStrategy counting("counting", [&calls](const PriceSeries& series) {
        ++calls;
        return std::vector<Signal>(series.size(), Signal::FLAT);
    });

    EXPECT_THROW(engine.run_backtest(counting, PriceSeries{}), meridian::core::ValidationError);

    PriceSeries unordered = make_series({100.0, 101.0});
    std::swap(unordered[0].timestamp, unordered[1].timestamp);
    EXPECT_THROW(engine.run_backtest(counting, unordered), meridian::core::ValidationError);
    EXPECT_EQ(calls, 0);
}

TEST_F(BacktestEngineTest, TrendingSeriesWithMovingAverageCross) {
    meridian::backtest::BacktestEngine engine;
    auto series = rising_series(30);
    meridian::strategy::MovingAverageCrossStrategy strategy({2, 4});

    auto result = engine.run_backtest(strategy, series);

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].action, TradeAction::BUY);
    EXPECT_EQ(result.trades[0].timestamp, series[3].timestamp);
    EXPECT_GT(result.performance.final_equity, 50000.0 - result.trades[0].commission);
    EXPECT_EQ(result.performance.round_trips, 0);
    EXPECT_DOUBLE_EQ(result.performance.win_rate, 0.0);
}

TEST_F(BacktestEngineTest, FlatSeriesRatios) {
    meridian::backtest::BacktestEngine engine;
    // 100.1 has no exact binary representation
    auto series = make_series(std::vector<double>(40, 100.1));
    auto result = engine.run_backtest(meridian::strategy::MovingAverageCrossStrategy({5, 20}), series);

    EXPECT_TRUE(result.trades.empty());
    EXPECT_DOUBLE_EQ(result.performance.sharpe_ratio, 0.0);
    EXPECT_TRUE(std::isinf(result.performance.sortino_ratio));
    EXPECT_GT(result.performance.sortino_ratio, 0.0);
    EXPECT_DOUBLE_EQ(result.performance.max_drawdown, 0.0);
    EXPECT_TRUE(std::isinf(result.performance.calmar_ratio));
}

TEST_F(BacktestEngineTest, RunsDoNotShareState) {
    meridian::backtest::BacktestEngine engine;
    auto series = make_series({100.0, 95.0, 90.0, 97.0, 104.0, 99.0, 92.0, 96.0, 103.0, 110.0});
    meridian::strategy::Strategy strategy = meridian::strategy::RsiStrategy({2, 30.0, 70.0});

    auto first = engine.run_backtest(strategy, series);
    auto second = engine.run_backtest(strategy, series);

    EXPECT_EQ(first.trades.size(), second.trades.size());
    EXPECT_DOUBLE_EQ(first.performance.final_equity, second.performance.final_equity);
    EXPECT_DOUBLE_EQ(first.equity_curve.front().equity, 50000.0);
    EXPECT_DOUBLE_EQ(second.equity_curve.front().equity, 50000.0);
}

TEST_F(BacktestEngineTest, BatchIsolatesFailures) {
    meridian::backtest::BacktestEngine engine;
    auto series = rising_series(30);

    std::vector<meridian::strategy::Strategy> strategies = {
        meridian::strategy::MovingAverageCrossStrategy({2, 4}),
        meridian::strategy::CustomStrategy("broken", [](const PriceSeries&) -> std::vector<Signal> {
            throw std::runtime_error("signal source unavailable");
        }),
        meridian::strategy::CustomStrategy("short", [](const PriceSeries&) {
            return std::vector<Signal>(3, Signal::FLAT);
        }),
        meridian::strategy::RsiStrategy({14, 30.0, 70.0}),
    };

    auto outcomes = engine.run_batch(strategies, series, 2);

    ASSERT_EQ(outcomes.size(), 4u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[0].strategy_name, "MA cross (2/4)");
    EXPECT_FALSE(outcomes[1].ok());
    EXPECT_NE(outcomes[1].error.find("signal source unavailable"), std::string::npos);
    EXPECT_FALSE(outcomes[2].ok());
    EXPECT_TRUE(outcomes[3].ok());

    // Same result as a standalone run
    auto standalone = engine.run_backtest(strategies[0], series);
    EXPECT_DOUBLE_EQ(outcomes[0].result->performance.final_equity, standalone.performance.final_equity);
}

TEST(RankBySortinoTest, InfinityFirstFailuresLast) {
    auto make = [](const std::string& name, double sortino) {
        meridian::backtest::RunOutcome outcome;
        outcome.strategy_name = name;
        outcome.result = meridian::backtest::BacktestResult{};
        outcome.result->performance.sortino_ratio = sortino;
        return outcome;
    };

    meridian::backtest::RunOutcome failed;
    failed.strategy_name = "failed";
    failed.error = "boom";

    auto ranked = meridian::backtest::rank_by_sortino({
        make("low", 0.5), failed, make("inf", std::numeric_limits<double>::infinity()), make("high", 2.0)});

    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].strategy_name, "inf");
    EXPECT_EQ(ranked[1].strategy_name, "high");
    EXPECT_EQ(ranked[2].strategy_name, "low");
    EXPECT_EQ(ranked[3].strategy_name, "failed");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
