#include <meridian/core/portfolio.hpp>
#include <meridian/utils/logger.hpp>
#include <stdexcept>

namespace meridian::core {

Portfolio::Portfolio() : cash_(0.0), position_(0.0) {}

Portfolio::Portfolio(double initial_cash) : cash_(initial_cash), position_(0.0) {}

double Portfolio::cash() const {
    return cash_;
}

double Portfolio::position() const {
    return position_;
}

const Trade& Portfolio::open_position(int64_t timestamp, double quantity, double price,
                                      double commission_rate, Signal signal) {
    if (position_ > 0.0) {
        throw std::logic_error("position already open, single-lot book cannot add to it");
    }
    if (quantity <= 0.0 || price <= 0.0) {
        throw std::logic_error("open_position requires positive quantity and price");
    }

    double notional = quantity * price;
    double commission = notional * commission_rate;
    if (notional + commission > cash_) {
        throw std::logic_error("insufficient cash for order");
    }

    cash_ -= notional + commission;
    position_ = quantity;
    trades_.emplace_back(timestamp, TradeAction::BUY, price, quantity, commission, signal);

    utils::Logger::debug() << "BUY " << quantity << " @ " << price
                           << " commission=" << commission << " cash=" << cash_ << utils::Logger::endl;
    return trades_.back();
}

const Trade& Portfolio::close_position(int64_t timestamp, double price,
                                       double commission_rate, Signal signal) {
    if (position_ <= 0.0) {
        throw std::logic_error("no open position to close");
    }

    double quantity = position_;
    double notional = quantity * price;
    double commission = notional * commission_rate;

    cash_ += notional - commission;
    position_ = 0.0;
    trades_.emplace_back(timestamp, TradeAction::SELL, price, quantity, commission, signal);

    utils::Logger::debug() << "SELL " << quantity << " @ " << price
                           << " commission=" << commission << " cash=" << cash_ << utils::Logger::endl;
    return trades_.back();
}

double Portfolio::total_value(double mark_price) const {
    return cash_ + position_ * mark_price;
}

EquityPoint Portfolio::snapshot(int64_t timestamp, double mark_price) const {
    EquityPoint point;
    point.timestamp = timestamp;
    point.cash = cash_;
    point.position = position_;
    point.price = mark_price;
    point.equity = total_value(mark_price);
    return point;
}

int Portfolio::trade_count() const {
    return static_cast<int>(trades_.size());
}

} // namespace meridian::core
