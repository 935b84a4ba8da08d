#include "meridian/core/signal.hpp"

namespace meridian::core {

SignalRecord::SignalRecord()
    : timestamp(0), signal(Signal::FLAT), price(0.0) {
}

SignalRecord::SignalRecord(int64_t ts, Signal s, double p)
    : timestamp(ts), signal(s), price(p) {
}

std::string to_string(Signal signal) {
    switch (signal) {
        case Signal::LONG:
            return "LONG";
        case Signal::SHORT:
            return "SHORT";
        case Signal::FLAT:
            break;
    }
    return "FLAT";
}

} // namespace meridian::core
