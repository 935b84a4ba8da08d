#include <meridian/strategy/opening_range_breakout.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/indicators/indicators.hpp>
#include <algorithm>
#include <cmath>
#include <optional>

namespace meridian::strategy {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t utc_day(int64_t timestamp) {
    // Floor division so pre-epoch timestamps land on the right day
    int64_t day = timestamp / kSecondsPerDay;
    if (timestamp % kSecondsPerDay < 0) {
        --day;
    }
    return day;
}

} // namespace

OpeningRangeBreakoutStrategy::OpeningRangeBreakoutStrategy(const OpeningRangeBreakoutParams& params)
    : params_(params) {
    if (params_.lookback_minutes <= 0) {
        throw core::ConfigError("opening range lookback must be positive");
    }
    if (params_.atr_period <= 0) {
        throw core::ConfigError("ATR period must be positive");
    }
    if (params_.cooldown_hours < 0.0) {
        throw core::ConfigError("cooldown must be non-negative");
    }
    if (params_.bar_interval_seconds < 0) {
        throw core::ConfigError("bar interval must be non-negative");
    }
}

std::string OpeningRangeBreakoutStrategy::name() const {
    return "Opening range breakout (" + std::to_string(params_.lookback_minutes) + "m)";
}

double OpeningRangeBreakoutStrategy::infer_bar_interval(const core::PriceSeries& series) {
    if (series.size() < 2) {
        return 0.0;
    }

    std::vector<double> deltas;
    deltas.reserve(series.size() - 1);
    for (size_t i = 1; i < series.size(); ++i) {
        deltas.push_back(static_cast<double>(series[i].timestamp - series[i - 1].timestamp));
    }

    size_t mid = deltas.size() / 2;
    std::nth_element(deltas.begin(), deltas.begin() + mid, deltas.end());
    double upper = deltas[mid];
    if (deltas.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(deltas.begin(), deltas.begin() + mid);
    return (lower + upper) / 2.0;
}

double OpeningRangeBreakoutStrategy::bar_interval(const core::PriceSeries& series) const {
    if (params_.bar_interval_seconds > 0) {
        return static_cast<double>(params_.bar_interval_seconds);
    }
    return infer_bar_interval(series);
}

std::vector<core::Signal> OpeningRangeBreakoutStrategy::generate_signals(const core::PriceSeries& series) const {
    const size_t n = series.size();
    std::vector<core::Signal> signals(n, core::Signal::FLAT);

    double interval = bar_interval(series);
    if (n < 2 || interval <= 0.0) {
        return signals;
    }

    const size_t range_bars = std::max<size_t>(
        1, static_cast<size_t>(std::floor(params_.lookback_minutes * 60.0 / interval)));
    const auto cooldown_bars = static_cast<int64_t>(std::floor(params_.cooldown_hours * 3600.0 / interval));

    std::vector<double> atr = indicators::atr(series, params_.atr_period);

    size_t day_start = 0;
    while (day_start < n) {
        int64_t day = utc_day(series[day_start].timestamp);
        size_t day_end = day_start;
        while (day_end < n && utc_day(series[day_end].timestamp) == day) {
            ++day_end;
        }

        // A day that never completes its opening window has no tradeable range
        if (day_end - day_start > range_bars) {
            double upper = series[day_start].high;
            double lower = series[day_start].low;
            for (size_t i = day_start + 1; i < day_start + range_bars; ++i) {
                upper = std::max(upper, series[i].high);
                lower = std::min(lower, series[i].low);
            }

            for (size_t i = day_start + range_bars; i < day_end; ++i) {
                if (!indicators::is_defined(atr[i])) {
                    continue;
                }
                double band = params_.atr_multiplier * atr[i];
                if (series[i].close > upper + band) {
                    signals[i] = core::Signal::LONG;
                } else if (series[i].close < lower - band) {
                    signals[i] = core::Signal::SHORT;
                }
            }
        }

        day_start = day_end;
    }

    apply_cooldown(signals, cooldown_bars);
    return signals;
}

void apply_cooldown(std::vector<core::Signal>& signals, int64_t cooldown_bars) {
    if (cooldown_bars <= 0) {
        return;
    }

    std::optional<size_t> last_fired;
    for (size_t i = 0; i < signals.size(); ++i) {
        if (signals[i] == core::Signal::FLAT) {
            continue;
        }
        if (last_fired && static_cast<int64_t>(i - *last_fired) < cooldown_bars) {
            signals[i] = core::Signal::FLAT;
        } else {
            last_fired = i;
        }
    }
}

} // namespace meridian::strategy
