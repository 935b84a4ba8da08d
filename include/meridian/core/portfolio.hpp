#pragma once
#include <meridian/core/order.hpp>
#include <cstdint>
#include <vector>

namespace meridian::core {

// Portfolio snapshot taken once per bar
struct EquityPoint {
    int64_t timestamp = 0;
    double cash = 0.0;
    double position = 0.0;
    double price = 0.0;   // mark price
    double equity = 0.0;  // cash + position * price
};

// Single-asset, single-lot book: cash plus one long position (never negative).
class Portfolio {
private:
    double cash_;
    double position_;
    std::vector<Trade> trades_;

public:
    Portfolio();
    explicit Portfolio(double initial_cash);

    double cash() const;

    double position() const;
    bool has_position() const { return position_ > 0.0; }

    // Debits quantity * price * (1 + commission_rate). Throws std::logic_error
    // if a position is already open or cash would go negative.
    const Trade& open_position(int64_t timestamp, double quantity, double price,
                               double commission_rate, Signal signal);

    // Liquidates the whole position, credits notional * (1 - commission_rate).
    // Throws std::logic_error when flat.
    const Trade& close_position(int64_t timestamp, double price,
                                double commission_rate, Signal signal);

    double total_value(double mark_price) const;
    EquityPoint snapshot(int64_t timestamp, double mark_price) const;
    int trade_count() const;

    const std::vector<Trade>& get_trades() const {
        return trades_;
    }
};

} // namespace meridian::core
