#include <meridian/core/order.hpp>

namespace meridian::core {

Trade::Trade()
    : timestamp(0), action(TradeAction::BUY), price(0.0), quantity(0.0),
      value(0.0), commission(0.0), signal(Signal::FLAT) {}

Trade::Trade(int64_t ts, TradeAction a, double p, double qty, double comm, Signal s)
    : timestamp(ts), action(a), price(p), quantity(qty),
      value(qty * p), commission(comm), signal(s) {}

std::string to_string(TradeAction action) {
    return action == TradeAction::BUY ? "BUY" : "SELL";
}

} // namespace meridian::core
