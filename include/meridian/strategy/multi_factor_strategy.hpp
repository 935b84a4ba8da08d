#pragma once
#include <meridian/core/market_data.hpp>
#include <meridian/core/signal.hpp>
#include <string>
#include <vector>

namespace meridian::strategy {

struct FactorWeights {
    double trend = 0.20;
    double momentum = 0.35;
    double volatility = 0.20;
    double volume = 0.15;
    double structure = 0.05;
    double candlestick = 0.05;
};

struct MultiFactorParams {
    FactorWeights weights;
    double entry_threshold = 0.3;
};

// Per-bar factor scores. An undefined indicator input leaves its factor at zero.
struct FactorScores {
    int trend = 0;        // -2..+2
    int momentum = 0;     // -1..+2
    int volatility = 0;   // -1..+1
    int volume = 0;       // -1..+1
    int structure = 0;    // -1..+1
    int candlestick = 0;  // -1..+1
    double total = 0.0;
};

/**
 * Weighted composite of six independently thresholded factors:
 *  - trend: MA5/MA10/MA20 alignment
 *  - momentum: MACD(6,13) against its EMA(4) signal, RSI(7) extremes
 *  - volatility: position inside Bollinger(10, 2)
 *  - volume: volume relative to its 20-bar average
 *  - structure: close breaking the previous 20 bars' high/low
 *  - candlestick: direction of a large-bodied candle
 * LONG when the weighted total exceeds entry_threshold, SHORT below -entry_threshold.
 */
class MultiFactorStrategy {
public:
    explicit MultiFactorStrategy(const MultiFactorParams& params = {});

    std::string name() const;
    const MultiFactorParams& params() const { return params_; }

    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const;

    std::vector<FactorScores> score(const core::PriceSeries& series) const;

private:
    MultiFactorParams params_;
};

} // namespace meridian::strategy
