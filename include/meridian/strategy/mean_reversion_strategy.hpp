#pragma once
#include <meridian/core/market_data.hpp>
#include <meridian/core/signal.hpp>
#include <string>
#include <vector>

namespace meridian::strategy {

struct MeanReversionParams {
    int window = 20;
    double z_score_threshold = 2.0;
};

// Buys when the close sits more than `z_score_threshold` rolling standard
// deviations below its rolling mean, sells when it sits as far above it.
class MeanReversionStrategy {
public:
    explicit MeanReversionStrategy(const MeanReversionParams& params = {});

    std::string name() const;
    const MeanReversionParams& params() const { return params_; }

    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const;

    // z-score per bar, NaN while warming up or when the window has zero variance
    std::vector<double> z_scores(const core::PriceSeries& series) const;

private:
    MeanReversionParams params_;
};

} // namespace meridian::strategy
