#pragma once
#include <meridian/core/market_data.hpp>
#include <cmath>
#include <vector>

namespace meridian::indicators {

/**
 * Rolling and recursive statistics over a series.
 *
 * Every function returns a vector the same length as its input. Entries
 * without enough history are NaN; nothing throws. The value at index i is
 * computed from inputs at indices <= i only.
 */

inline bool is_defined(double value) { return !std::isnan(value); }

// Mean of the trailing `window` values; exactly the value itself when they are all equal
std::vector<double> sma(const std::vector<double>& values, int window);

// alpha = 2 / (span + 1), seeded with the first defined value
std::vector<double> ema(const std::vector<double>& values, int span);

// Sample standard deviation (n - 1) of the trailing `window` values; 0 for a constant window
std::vector<double> rolling_std(const std::vector<double>& values, int window);

std::vector<double> rolling_max(const std::vector<double>& values, int window);
std::vector<double> rolling_min(const std::vector<double>& values, int window);

// 100 - 100 / (1 + avg_gain / avg_loss) over `window` deltas; 100 when avg_loss == 0
std::vector<double> rsi(const std::vector<double>& closes, int window);

struct MacdSeries {
    std::vector<double> macd;
    std::vector<double> signal;
    std::vector<double> histogram;
};

MacdSeries macd(const std::vector<double>& closes, int fast, int slow, int signal);

struct BollingerSeries {
    std::vector<double> middle;
    std::vector<double> upper;
    std::vector<double> lower;
};

BollingerSeries bollinger_bands(const std::vector<double>& closes, int window, double k);

// max(high - low, |high - prev close|, |low - prev close|); the first bar uses high - low
std::vector<double> true_range(const core::PriceSeries& bars);

// Rolling mean of the true range
std::vector<double> atr(const core::PriceSeries& bars, int period);

} // namespace meridian::indicators
