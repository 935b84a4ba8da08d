#pragma once
#include <meridian/core/market_data.hpp>
#include <meridian/core/signal.hpp>
#include <string>
#include <vector>

namespace meridian::strategy {

struct RsiParams {
    int window = 14;
    double oversold = 30.0;
    double overbought = 70.0;
};

class RsiStrategy {
public:
    explicit RsiStrategy(const RsiParams& params = {});

    std::string name() const;
    const RsiParams& params() const { return params_; }

    // LONG below oversold, SHORT above overbought
    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const;

private:
    RsiParams params_;
};

} // namespace meridian::strategy
