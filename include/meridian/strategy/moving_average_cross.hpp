#pragma once
#include <meridian/core/market_data.hpp>
#include <meridian/core/signal.hpp>
#include <string>
#include <vector>

namespace meridian::strategy {

struct MovingAverageCrossParams {
    int short_window = 5;
    int long_window = 20;
};

// LONG while SMA(short) > SMA(long), SHORT while SMA(short) < SMA(long), FLAT on ties
// and while either average is still warming up.
class MovingAverageCrossStrategy {
public:
    explicit MovingAverageCrossStrategy(const MovingAverageCrossParams& params = {});

    std::string name() const;
    const MovingAverageCrossParams& params() const { return params_; }

    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const;

private:
    MovingAverageCrossParams params_;
};

} // namespace meridian::strategy
