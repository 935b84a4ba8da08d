// src/meridian/strategy/strategy_factory.cpp
#include "meridian/strategy/strategy_factory.hpp"
#include "meridian/core/errors.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace meridian {
namespace strategy {

std::mutex StrategyFactory::factory_mutex_;

namespace {

// Typed access to a parameter map. finish() rejects keys nobody asked for,
// so a misspelt parameter fails loudly instead of silently using a default.
class ParamReader {
public:
    ParamReader(std::string type_name, const StrategyParams& params)
        : type_name_(std::move(type_name)), params_(params) {}

    template<typename T>
    T get(const std::string& key, T default_value) {
        seen_.insert(key);
        auto it = params_.find(key);
        if (it == params_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value) || !(iss >> std::ws).eof()) {
            throw core::ConfigError(type_name_ + ": invalid value for '" + key + "': '" + it->second + "'");
        }
        return value;
    }

    void finish() const {
        for (const auto& [key, value] : params_) {
            if (seen_.count(key) == 0) {
                throw core::ConfigError(type_name_ + ": unknown parameter '" + key + "'");
            }
        }
    }

private:
    std::string type_name_;
    const StrategyParams& params_;
    std::set<std::string> seen_;
};

Strategy make_ma_cross(const StrategyParams& params) {
    ParamReader reader("ma_cross", params);
    MovingAverageCrossParams p;
    p.short_window = reader.get("short_window", p.short_window);
    p.long_window = reader.get("long_window", p.long_window);
    reader.finish();
    return MovingAverageCrossStrategy(p);
}

Strategy make_rsi(const StrategyParams& params) {
    ParamReader reader("rsi", params);
    RsiParams p;
    p.window = reader.get("window", p.window);
    p.oversold = reader.get("oversold", p.oversold);
    p.overbought = reader.get("overbought", p.overbought);
    reader.finish();
    return RsiStrategy(p);
}

Strategy make_mean_reversion(const StrategyParams& params) {
    ParamReader reader("mean_reversion", params);
    MeanReversionParams p;
    p.window = reader.get("window", p.window);
    p.z_score_threshold = reader.get("z_score_threshold", p.z_score_threshold);
    reader.finish();
    return MeanReversionStrategy(p);
}

Strategy make_multi_factor(const StrategyParams& params) {
    ParamReader reader("multi_factor", params);
    MultiFactorParams p;
    p.entry_threshold = reader.get("entry_threshold", p.entry_threshold);
    p.weights.trend = reader.get("weight.trend", p.weights.trend);
    p.weights.momentum = reader.get("weight.momentum", p.weights.momentum);
    p.weights.volatility = reader.get("weight.volatility", p.weights.volatility);
    p.weights.volume = reader.get("weight.volume", p.weights.volume);
    p.weights.structure = reader.get("weight.structure", p.weights.structure);
    p.weights.candlestick = reader.get("weight.candlestick", p.weights.candlestick);
    reader.finish();
    return MultiFactorStrategy(p);
}

Strategy make_orb(const StrategyParams& params) {
    ParamReader reader("orb", params);
    OpeningRangeBreakoutParams p;
    p.lookback_minutes = reader.get("lookback_minutes", p.lookback_minutes);
    p.atr_period = reader.get("atr_period", p.atr_period);
    p.atr_multiplier = reader.get("atr_multiplier", p.atr_multiplier);
    p.cooldown_hours = reader.get("cooldown_hours", p.cooldown_hours);
    p.bar_interval_seconds = reader.get("bar_interval_seconds", p.bar_interval_seconds);
    reader.finish();
    return OpeningRangeBreakoutStrategy(p);
}

} // namespace

std::unordered_map<std::string, StrategyFactory::StrategyCreator>& StrategyFactory::creators() {
    static std::unordered_map<std::string, StrategyCreator> registry = {
        {"ma_cross", make_ma_cross},
        {"rsi", make_rsi},
        {"mean_reversion", make_mean_reversion},
        {"multi_factor", make_multi_factor},
        {"orb", make_orb},
    };
    return registry;
}

void StrategyFactory::register_type(const std::string& type_name, StrategyCreator creator) {
    std::lock_guard<std::mutex> lock(factory_mutex_);
    creators()[type_name] = std::move(creator);
}

std::optional<Strategy> StrategyFactory::create_strategy(const std::string& type_name,
                                                         const StrategyParams& params) {
    StrategyCreator creator;
    {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        auto it = creators().find(type_name);
        if (it == creators().end()) {
            return std::nullopt;
        }
        creator = it->second;
    }
    return creator(params);
}

bool StrategyFactory::is_registered(const std::string& type_name) {
    std::lock_guard<std::mutex> lock(factory_mutex_);
    return creators().count(type_name) > 0;
}

std::vector<std::string> StrategyFactory::get_registered_types() {
    std::lock_guard<std::mutex> lock(factory_mutex_);
    std::vector<std::string> types;
    for (const auto& [type, _] : creators()) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

} // namespace strategy
} // namespace meridian
