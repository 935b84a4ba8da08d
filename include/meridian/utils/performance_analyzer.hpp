// include/meridian/utils/performance_analyzer.hpp
#pragma once
#include <meridian/core/order.hpp>
#include <meridian/core/portfolio.hpp>
#include <utility>
#include <vector>

namespace meridian {
namespace utils {

// Ratios may be +infinity (see PerformanceAnalyzer); they are never NaN.
struct PerformanceResult {
    double initial_capital = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double max_drawdown = 0.0;    // <= 0, fraction of the running peak
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;
    int total_trades = 0;
    int round_trips = 0;          // completed BUY -> SELL pairs
    int winning_trades = 0;
    double win_rate = 0.0;        // winning_trades / round_trips
    double elapsed_days = 0.0;
};

class PerformanceAnalyzer {
private:
    double initial_capital_;
    int periods_per_year_ = 252;

public:
    explicit PerformanceAnalyzer(double initial_capital = 50000.0, int periods_per_year = 252)
        : initial_capital_(initial_capital), periods_per_year_(periods_per_year) {}

    PerformanceResult analyze(const std::vector<core::EquityPoint>& equity_curve,
                              const std::vector<core::Trade>& trades) const;

    // Helper methods

    // Bar-over-bar percentage change; one element shorter than the curve
    static std::vector<double> calculate_returns(const std::vector<core::EquityPoint>& equity_curve);

    // mean / sample std * sqrt(periods); 0 with fewer than two returns or zero std
    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    // mean / sample std of the negative returns * sqrt(periods).
    // A single negative return r uses |r| as the downside deviation.
    // +inf without downside or with zero downside deviation, 0 without returns.
    double calculate_sortino_ratio(const std::vector<double>& returns) const;

    static double calculate_max_drawdown(const std::vector<core::EquityPoint>& equity_curve);

    // (1 + total)^(365 / days) - 1; 0 when elapsed_days <= 0
    static double calculate_annualized_return(double total_return, double elapsed_days);

    // annualized / |max drawdown|; +inf when max drawdown is 0
    static double calculate_calmar_ratio(double annualized_return, double max_drawdown);

    // Pairs each BUY with the next SELL. Returns {round trips, wins}.
    static std::pair<int, int> count_round_trips(const std::vector<core::Trade>& trades);

    double initial_capital() const { return initial_capital_; }
};

// Strict weak ordering for ranking by ratio: descending, +inf ahead of every
// finite value, NaN last
bool ratio_greater(double lhs, double rhs);

} // namespace utils
} // namespace meridian
