#pragma once

#include <meridian/backtest/backtest_engine.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace meridian::report {

// Console report of a single run
void print_summary(const backtest::BacktestResult& result, std::ostream& out);

// One row per outcome followed by the best strategy by Sortino.
// Failed runs are listed with their error.
void print_comparison(const std::vector<backtest::RunOutcome>& outcomes, std::ostream& out);

// CSV writers. Return false (after logging) when the file cannot be written.
bool write_trade_log(const backtest::BacktestResult& result, const std::string& path);
bool write_equity_curve(const backtest::BacktestResult& result, const std::string& path);

// "inf", "-inf" or the value with the given precision
std::string format_ratio(double value, int precision = 2);

} // namespace meridian::report
