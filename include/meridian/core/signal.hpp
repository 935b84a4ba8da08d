#pragma once
#include <cstdint>
#include <string>

namespace meridian::core {

enum class Signal : int {
    SHORT = -1,
    FLAT = 0,
    LONG = 1
};

// One entry of the engine's signal log
struct SignalRecord {
    int64_t timestamp = 0;
    Signal signal = Signal::FLAT;
    double price = 0.0;  // execution price after slippage

    SignalRecord();
    SignalRecord(int64_t ts, Signal s, double p);
};

inline int to_int(Signal signal) { return static_cast<int>(signal); }

std::string to_string(Signal signal);

} // namespace meridian::core
