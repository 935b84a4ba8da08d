#include "meridian/utils/performance_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace meridian {
namespace utils {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();
constexpr double kSecondsPerDay = 86400.0;

// Below this a standard deviation or drawdown is treated as exactly zero;
// it only absorbs rounding noise from summing identical returns.
constexpr double kZeroTolerance = 1e-12;

double mean_of(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

// Sample standard deviation (n - 1); callers guarantee at least two values
double std_dev_of(const std::vector<double>& values, double mean) {
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / (values.size() - 1));
}

} // namespace

std::vector<double> PerformanceAnalyzer::calculate_returns(const std::vector<core::EquityPoint>& equity_curve) {
    if (equity_curve.size() < 2) {
        return {};
    }

    std::vector<double> returns;
    returns.reserve(equity_curve.size() - 1);

    for (size_t i = 1; i < equity_curve.size(); i++) {
        returns.push_back(equity_curve[i].equity / equity_curve[i - 1].equity - 1.0);
    }

    return returns;
}

double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    // A single return has no sample deviation
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean = mean_of(returns);
    double std_dev = std_dev_of(returns, mean);

    if (std_dev < kZeroTolerance) {
        return 0.0;
    }

    return mean / std_dev * std::sqrt(static_cast<double>(periods_per_year_));
}

double PerformanceAnalyzer::calculate_sortino_ratio(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) {
            downside.push_back(r);
        }
    }

    // No observed downside is rewarded with an unbounded score
    if (downside.empty()) {
        return kInfinity;
    }

    // One loss has no sample deviation; its own size stands in as the downside risk
    double downside_dev = downside.size() == 1
        ? std::abs(downside.front())
        : std_dev_of(downside, mean_of(downside));
    if (downside_dev < kZeroTolerance) {
        return kInfinity;
    }

    return mean_of(returns) / downside_dev * std::sqrt(static_cast<double>(periods_per_year_));
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<core::EquityPoint>& equity_curve) {
    if (equity_curve.empty()) {
        return 0.0;
    }

    double max_dd = 0.0;
    double peak = equity_curve.front().equity;

    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.equity);
        if (peak > 0.0) {
            max_dd = std::min(max_dd, (point.equity - peak) / peak);
        }
    }

    return max_dd;
}

double PerformanceAnalyzer::calculate_annualized_return(double total_return, double elapsed_days) {
    if (elapsed_days <= 0.0) {
        return 0.0;
    }
    return std::pow(1.0 + total_return, 365.0 / elapsed_days) - 1.0;
}

double PerformanceAnalyzer::calculate_calmar_ratio(double annualized_return, double max_drawdown) {
    double depth = std::abs(max_drawdown);
    if (depth < kZeroTolerance) {
        return kInfinity;
    }
    return annualized_return / depth;
}

std::pair<int, int> PerformanceAnalyzer::count_round_trips(const std::vector<core::Trade>& trades) {
    int round_trips = 0;
    int wins = 0;
    const core::Trade* open_buy = nullptr;

    for (const auto& trade : trades) {
        if (trade.action == core::TradeAction::BUY) {
            if (!open_buy) {
                open_buy = &trade;
            }
        } else if (open_buy) {
            ++round_trips;
            if (trade.price > open_buy->price) {
                ++wins;
            }
            open_buy = nullptr;
        }
    }

    return {round_trips, wins};
}

PerformanceResult PerformanceAnalyzer::analyze(const std::vector<core::EquityPoint>& equity_curve,
                                               const std::vector<core::Trade>& trades) const {
    PerformanceResult result;
    result.initial_capital = initial_capital_;
    result.final_equity = initial_capital_;
    result.total_trades = static_cast<int>(trades.size());

    auto [round_trips, wins] = count_round_trips(trades);
    result.round_trips = round_trips;
    result.winning_trades = wins;
    result.win_rate = round_trips > 0 ? static_cast<double>(wins) / round_trips : 0.0;

    if (equity_curve.empty()) {
        return result;
    }

    result.final_equity = equity_curve.back().equity;
    result.total_return = initial_capital_ > 0.0
        ? (result.final_equity - initial_capital_) / initial_capital_
        : 0.0;

    // Whole calendar days between the first and last snapshot
    double span_seconds = static_cast<double>(equity_curve.back().timestamp - equity_curve.front().timestamp);
    result.elapsed_days = std::floor(span_seconds / kSecondsPerDay);
    result.annualized_return = calculate_annualized_return(result.total_return, result.elapsed_days);

    std::vector<double> returns = calculate_returns(equity_curve);
    result.sharpe_ratio = calculate_sharpe_ratio(returns);
    result.sortino_ratio = calculate_sortino_ratio(returns);

    result.max_drawdown = calculate_max_drawdown(equity_curve);
    result.calmar_ratio = calculate_calmar_ratio(result.annualized_return, result.max_drawdown);

    return result;
}

bool ratio_greater(double lhs, double rhs) {
    if (std::isnan(lhs)) return false;
    if (std::isnan(rhs)) return true;
    return lhs > rhs;
}

} // namespace utils
} // namespace meridian
