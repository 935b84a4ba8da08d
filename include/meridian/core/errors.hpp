#pragma once
#include <stdexcept>
#include <string>

namespace meridian::core {

class MeridianError : public std::runtime_error {
public:
    explicit MeridianError(const std::string& what) : std::runtime_error(what) {}
};

// Bad input series: empty, unordered timestamps, non-positive prices, unparseable rows
class ValidationError : public MeridianError {
public:
    explicit ValidationError(const std::string& what) : MeridianError(what) {}
};

// Strategy produced no signals or a signal vector misaligned with the series
class StrategyError : public MeridianError {
public:
    explicit StrategyError(const std::string& what) : MeridianError(what) {}
};

// Unreadable configuration or malformed option / strategy parameter
class ConfigError : public MeridianError {
public:
    explicit ConfigError(const std::string& what) : MeridianError(what) {}
};

} // namespace meridian::core
