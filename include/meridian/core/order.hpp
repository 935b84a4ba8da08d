#pragma once

#include <meridian/core/signal.hpp>
#include <cstdint>
#include <string>

namespace meridian::core {

enum class TradeAction {
    BUY,
    SELL
};

// A filled trade. Recorded once by the portfolio and never modified afterwards.
struct Trade {
    int64_t timestamp;
    TradeAction action;
    double price;       // execution price after slippage
    double quantity;
    double value;       // notional, quantity * price
    double commission;
    Signal signal;      // signal that triggered the fill

    Trade();
    Trade(int64_t ts, TradeAction a, double p, double qty, double comm, Signal s);
};

std::string to_string(TradeAction action);

} // namespace meridian::core
