#include <meridian/strategy/moving_average_cross.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/indicators/indicators.hpp>

namespace meridian::strategy {

MovingAverageCrossStrategy::MovingAverageCrossStrategy(const MovingAverageCrossParams& params)
    : params_(params) {
    if (params_.short_window <= 0 || params_.long_window <= 0) {
        throw core::ConfigError("moving average windows must be positive");
    }
}

std::string MovingAverageCrossStrategy::name() const {
    return "MA cross (" + std::to_string(params_.short_window) + "/" +
           std::to_string(params_.long_window) + ")";
}

std::vector<core::Signal> MovingAverageCrossStrategy::generate_signals(const core::PriceSeries& series) const {
    std::vector<double> prices = core::closes(series);
    std::vector<double> short_ma = indicators::sma(prices, params_.short_window);
    std::vector<double> long_ma = indicators::sma(prices, params_.long_window);

    std::vector<core::Signal> signals(series.size(), core::Signal::FLAT);
    for (size_t i = 0; i < series.size(); ++i) {
        // NaN compares false both ways, so warm-up bars stay FLAT
        if (short_ma[i] > long_ma[i]) {
            signals[i] = core::Signal::LONG;
        } else if (short_ma[i] < long_ma[i]) {
            signals[i] = core::Signal::SHORT;
        }
    }
    return signals;
}

} // namespace meridian::strategy
