#pragma once
#include <cstdint>
#include <vector>

namespace meridian::core {

// One OHLCV sample. Timestamp is seconds since the Unix epoch (UTC).
struct Bar {
    int64_t timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar();
    Bar(int64_t ts, double o, double h, double l, double c, double vol = 0.0);
};

using PriceSeries = std::vector<Bar>;

// Throws ValidationError for an empty series, non-increasing timestamps,
// non-positive prices or negative volume.
void validate_series(const PriceSeries& series);

std::vector<double> closes(const PriceSeries& series);
std::vector<double> volumes(const PriceSeries& series);

} // namespace meridian::core
