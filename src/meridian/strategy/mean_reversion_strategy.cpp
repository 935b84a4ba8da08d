#include <meridian/strategy/mean_reversion_strategy.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/indicators/indicators.hpp>
#include <limits>

namespace meridian::strategy {

MeanReversionStrategy::MeanReversionStrategy(const MeanReversionParams& params) : params_(params) {
    if (params_.window < 2) {
        throw core::ConfigError("mean reversion window must be at least 2");
    }
    if (params_.z_score_threshold < 0.0) {
        throw core::ConfigError("z-score threshold must be non-negative");
    }
}

std::string MeanReversionStrategy::name() const {
    return "Mean reversion (" + std::to_string(params_.window) + ")";
}

std::vector<double> MeanReversionStrategy::z_scores(const core::PriceSeries& series) const {
    std::vector<double> prices = core::closes(series);
    std::vector<double> mean = indicators::sma(prices, params_.window);
    std::vector<double> sd = indicators::rolling_std(prices, params_.window);

    std::vector<double> z(series.size(), std::numeric_limits<double>::quiet_NaN());
    for (size_t i = 0; i < series.size(); ++i) {
        if (indicators::is_defined(mean[i]) && indicators::is_defined(sd[i]) && sd[i] > 0.0) {
            z[i] = (prices[i] - mean[i]) / sd[i];
        }
    }
    return z;
}

std::vector<core::Signal> MeanReversionStrategy::generate_signals(const core::PriceSeries& series) const {
    std::vector<double> z = z_scores(series);

    std::vector<core::Signal> signals(series.size(), core::Signal::FLAT);
    for (size_t i = 0; i < series.size(); ++i) {
        if (z[i] < -params_.z_score_threshold) {
            signals[i] = core::Signal::LONG;
        } else if (z[i] > params_.z_score_threshold) {
            signals[i] = core::Signal::SHORT;
        }
    }
    return signals;
}

} // namespace meridian::strategy
