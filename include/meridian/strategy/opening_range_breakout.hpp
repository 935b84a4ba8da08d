#pragma once
#include <meridian/core/market_data.hpp>
#include <meridian/core/signal.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace meridian::strategy {

struct OpeningRangeBreakoutParams {
    int lookback_minutes = 90;
    int atr_period = 10;
    double atr_multiplier = 0.03;
    double cooldown_hours = 2.0;
    int64_t bar_interval_seconds = 0;  // 0 = infer from the median timestamp delta
};

/**
 * Opening-range breakout over UTC calendar days.
 *
 * The first lookback_minutes of bars of each day define [lowest low, highest high].
 * Once that window has closed, a close above upper + atr_multiplier * ATR is LONG
 * and a close below lower - atr_multiplier * ATR is SHORT. Bars inside the window,
 * and every bar of a day too short to complete it, are FLAT. After a signal fires,
 * further signals are suppressed for cooldown_hours.
 */
class OpeningRangeBreakoutStrategy {
public:
    explicit OpeningRangeBreakoutStrategy(const OpeningRangeBreakoutParams& params = {});

    std::string name() const;
    const OpeningRangeBreakoutParams& params() const { return params_; }

    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const;

    // Median delta between consecutive timestamps, 0 for fewer than two bars
    static double infer_bar_interval(const core::PriceSeries& series);

private:
    OpeningRangeBreakoutParams params_;

    double bar_interval(const core::PriceSeries& series) const;
};

// Zeroes every non-flat signal that fires fewer than cooldown_bars after the
// previous fired one. Shared with callers that post-process their own signals.
void apply_cooldown(std::vector<core::Signal>& signals, int64_t cooldown_bars);

} // namespace meridian::strategy
