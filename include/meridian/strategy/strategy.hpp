// include/meridian/strategy/strategy.hpp
#pragma once
#include <functional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "meridian/core/market_data.hpp"
#include "meridian/core/signal.hpp"
#include "meridian/strategy/moving_average_cross.hpp"
#include "meridian/strategy/rsi_strategy.hpp"
#include "meridian/strategy/mean_reversion_strategy.hpp"
#include "meridian/strategy/multi_factor_strategy.hpp"
#include "meridian/strategy/opening_range_breakout.hpp"

namespace meridian {
namespace strategy {

// Signal source supplied by the caller, e.g. signals computed outside the library
class CustomStrategy {
public:
    using SignalFunction = std::function<std::vector<core::Signal>(const core::PriceSeries&)>;

    CustomStrategy(std::string name, SignalFunction fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    const std::string& name() const { return name_; }

    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const {
        return fn_ ? fn_(series) : std::vector<core::Signal>{};
    }

private:
    std::string name_;
    SignalFunction fn_;
};

// Alternatives in the same order as StrategyKind
using StrategyVariant = std::variant<
    MovingAverageCrossStrategy,
    RsiStrategy,
    MeanReversionStrategy,
    MultiFactorStrategy,
    OpeningRangeBreakoutStrategy,
    CustomStrategy>;

enum class StrategyKind {
    MOVING_AVERAGE_CROSS,
    RSI,
    MEAN_REVERSION,
    MULTI_FACTOR,
    OPENING_RANGE_BREAKOUT,
    CUSTOM
};

std::string to_string(StrategyKind kind);

// Value type holding exactly one strategy. Copies share no state.
class Strategy {
private:
    StrategyVariant impl_;

public:
    template<typename T,
             typename = std::enable_if_t<std::is_constructible_v<StrategyVariant, T&&> &&
                                         !std::is_same_v<std::decay_t<T>, Strategy>>>
    Strategy(T&& impl) : impl_(std::forward<T>(impl)) {}

    std::string name() const;
    StrategyKind kind() const { return static_cast<StrategyKind>(impl_.index()); }

    // One signal per bar, aligned by index. Never modifies the series.
    std::vector<core::Signal> generate_signals(const core::PriceSeries& series) const;

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&impl_); }
};

} // namespace strategy
} // namespace meridian
