// include/meridian/strategy/strategy_factory.hpp
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "meridian/strategy/strategy.hpp"

namespace meridian {
namespace strategy {

using StrategyParams = std::unordered_map<std::string, std::string>;

// Builds strategies by type name from string parameters, e.g. the
// strategy.<type>.<param> keys of a config file. Built-in types:
// ma_cross, rsi, mean_reversion, multi_factor, orb.
class StrategyFactory {
public:
    using StrategyCreator = std::function<Strategy(const StrategyParams&)>;

    // Adds or replaces a creator
    static void register_type(const std::string& type_name, StrategyCreator creator);

    // std::nullopt for an unknown type; ConfigError for a malformed or unknown parameter
    static std::optional<Strategy> create_strategy(const std::string& type_name,
                                                   const StrategyParams& params = {});

    static bool is_registered(const std::string& type_name);

    // Sorted
    static std::vector<std::string> get_registered_types();

private:
    static std::unordered_map<std::string, StrategyCreator>& creators();
    static std::mutex factory_mutex_;
};

} // namespace strategy
} // namespace meridian
