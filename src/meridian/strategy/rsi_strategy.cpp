#include <meridian/strategy/rsi_strategy.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/indicators/indicators.hpp>

namespace meridian::strategy {

RsiStrategy::RsiStrategy(const RsiParams& params) : params_(params) {
    if (params_.window <= 0) {
        throw core::ConfigError("RSI window must be positive");
    }
    if (params_.oversold > params_.overbought) {
        throw core::ConfigError("RSI oversold threshold above overbought threshold");
    }
}

std::string RsiStrategy::name() const {
    return "RSI (" + std::to_string(params_.window) + ")";
}

std::vector<core::Signal> RsiStrategy::generate_signals(const core::PriceSeries& series) const {
    std::vector<double> values = indicators::rsi(core::closes(series), params_.window);

    std::vector<core::Signal> signals(series.size(), core::Signal::FLAT);
    for (size_t i = 0; i < series.size(); ++i) {
        if (values[i] < params_.oversold) {
            signals[i] = core::Signal::LONG;
        } else if (values[i] > params_.overbought) {
            signals[i] = core::Signal::SHORT;
        }
    }
    return signals;
}

} // namespace meridian::strategy
