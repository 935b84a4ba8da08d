#include <meridian/core/market_data.hpp>
#include <meridian/core/errors.hpp>
#include <string>

namespace meridian::core {

Bar::Bar()
    : timestamp(0), open(0.0), high(0.0), low(0.0), close(0.0), volume(0.0) {}

Bar::Bar(int64_t ts, double o, double h, double l, double c, double vol)
    : timestamp(ts), open(o), high(h), low(l), close(c), volume(vol) {}

void validate_series(const PriceSeries& series) {
    if (series.empty()) {
        throw ValidationError("price series is empty");
    }

    for (size_t i = 0; i < series.size(); ++i) {
        const Bar& bar = series[i];

        // Negated comparisons so NaN prices are rejected too
        if (!(bar.open > 0.0) || !(bar.high > 0.0) || !(bar.low > 0.0) || !(bar.close > 0.0)) {
            throw ValidationError("non-positive price at bar " + std::to_string(i) +
                                  " (timestamp " + std::to_string(bar.timestamp) + ")");
        }
        if (bar.volume < 0.0) {
            throw ValidationError("negative volume at bar " + std::to_string(i));
        }
        if (i > 0 && bar.timestamp <= series[i - 1].timestamp) {
            throw ValidationError("timestamps not strictly increasing at bar " + std::to_string(i) +
                                  " (" + std::to_string(series[i - 1].timestamp) + " -> " +
                                  std::to_string(bar.timestamp) + ")");
        }
    }
}

std::vector<double> closes(const PriceSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& bar : series) {
        out.push_back(bar.close);
    }
    return out;
}

std::vector<double> volumes(const PriceSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& bar : series) {
        out.push_back(bar.volume);
    }
    return out;
}

} // namespace meridian::core
