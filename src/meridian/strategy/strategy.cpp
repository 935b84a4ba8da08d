// src/meridian/strategy/strategy.cpp
#include "meridian/strategy/strategy.hpp"

namespace meridian {
namespace strategy {

std::string to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::MOVING_AVERAGE_CROSS: return "ma_cross";
        case StrategyKind::RSI: return "rsi";
        case StrategyKind::MEAN_REVERSION: return "mean_reversion";
        case StrategyKind::MULTI_FACTOR: return "multi_factor";
        case StrategyKind::OPENING_RANGE_BREAKOUT: return "orb";
        case StrategyKind::CUSTOM: return "custom";
    }
    return "custom";
}

std::string Strategy::name() const {
    return std::visit([](const auto& s) { return std::string(s.name()); }, impl_);
}

std::vector<core::Signal> Strategy::generate_signals(const core::PriceSeries& series) const {
    return std::visit([&series](const auto& s) { return s.generate_signals(series); }, impl_);
}

} // namespace strategy
} // namespace meridian
