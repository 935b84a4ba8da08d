#include <meridian/strategy/multi_factor_strategy.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/indicators/indicators.hpp>
#include <cmath>

namespace meridian::strategy {

namespace {

using indicators::is_defined;

constexpr int kStructureLookback = 20;

// Comparisons against NaN are false, so undefined inputs never add to a score
int trend_score(double ma5, double ma10, double ma20) {
    if (ma5 > ma10 && ma10 > ma20) return 2;
    if (ma5 < ma10 && ma10 < ma20) return -2;
    return 0;
}

int momentum_score(double macd_line, double macd_signal, double rsi_value) {
    int score = 0;
    if (macd_line > macd_signal) score += 1;
    if (rsi_value < 30.0) score += 1;
    if (rsi_value > 70.0) score -= 1;
    return score;
}

int band_position_score(double close, double upper, double lower) {
    if (!is_defined(upper) || !is_defined(lower) || upper <= lower) {
        return 0;
    }
    double position = (close - lower) / (upper - lower);
    if (position < 0.3) return 1;
    if (position > 0.7) return -1;
    return 0;
}

int volume_score(double volume, double volume_ma) {
    if (!is_defined(volume_ma) || volume_ma <= 0.0) {
        return 0;
    }
    double ratio = volume / volume_ma;
    if (ratio > 1.1) return 1;
    if (ratio < 0.9) return -1;
    return 0;
}

int candlestick_score(const core::Bar& bar) {
    double range = bar.high - bar.low;
    if (range <= 0.0) {
        return 0;
    }
    double body_ratio = std::abs(bar.close - bar.open) / range;
    if (body_ratio <= 0.6) {
        return 0;
    }
    if (bar.close > bar.open) return 1;
    if (bar.close < bar.open) return -1;
    return 0;
}

} // namespace

MultiFactorStrategy::MultiFactorStrategy(const MultiFactorParams& params) : params_(params) {
    if (params_.entry_threshold < 0.0) {
        throw core::ConfigError("multi-factor entry threshold must be non-negative");
    }
}

std::string MultiFactorStrategy::name() const {
    return "Multi-factor";
}

std::vector<FactorScores> MultiFactorStrategy::score(const core::PriceSeries& series) const {
    const size_t n = series.size();
    std::vector<double> prices = core::closes(series);

    std::vector<double> highs;
    std::vector<double> lows;
    highs.reserve(n);
    lows.reserve(n);
    for (const auto& bar : series) {
        highs.push_back(bar.high);
        lows.push_back(bar.low);
    }

    // Trend
    auto ma5 = indicators::sma(prices, 5);
    auto ma10 = indicators::sma(prices, 10);
    auto ma20 = indicators::sma(prices, 20);

    // Momentum
    auto macd = indicators::macd(prices, 6, 13, 4);
    auto rsi7 = indicators::rsi(prices, 7);

    // Volatility
    auto bands = indicators::bollinger_bands(prices, 10, 2.0);

    // Volume
    auto vols = core::volumes(series);
    auto vol_ma20 = indicators::sma(vols, 20);

    // Structure, evaluated against the window that ends on the previous bar
    auto resistance = indicators::rolling_max(highs, kStructureLookback);
    auto support = indicators::rolling_min(lows, kStructureLookback);

    const FactorWeights& w = params_.weights;
    std::vector<FactorScores> scores(n);
    for (size_t i = 0; i < n; ++i) {
        FactorScores& s = scores[i];
        s.trend = trend_score(ma5[i], ma10[i], ma20[i]);
        s.momentum = momentum_score(macd.macd[i], macd.signal[i], rsi7[i]);
        s.volatility = band_position_score(prices[i], bands.upper[i], bands.lower[i]);
        s.volume = volume_score(vols[i], vol_ma20[i]);
        if (i > 0) {
            if (prices[i] > resistance[i - 1]) {
                s.structure = 1;
            } else if (prices[i] < support[i - 1]) {
                s.structure = -1;
            }
        }
        s.candlestick = candlestick_score(series[i]);

        s.total = s.trend * w.trend +
                  s.momentum * w.momentum +
                  s.volatility * w.volatility +
                  s.volume * w.volume +
                  s.structure * w.structure +
                  s.candlestick * w.candlestick;
    }
    return scores;
}

std::vector<core::Signal> MultiFactorStrategy::generate_signals(const core::PriceSeries& series) const {
    std::vector<FactorScores> scores = score(series);

    std::vector<core::Signal> signals(series.size(), core::Signal::FLAT);
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i].total > params_.entry_threshold) {
            signals[i] = core::Signal::LONG;
        } else if (scores[i].total < -params_.entry_threshold) {
            signals[i] = core::Signal::SHORT;
        }
    }
    return signals;
}

} // namespace meridian::strategy
