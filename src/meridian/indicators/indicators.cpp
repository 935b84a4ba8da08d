#include <meridian/indicators/indicators.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace meridian::indicators {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Applies fn to each full trailing window that contains no NaN
template<typename Fn>
std::vector<double> rolling(const std::vector<double>& values, int window, Fn fn) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) {
        return out;
    }

    const size_t w = static_cast<size_t>(window);
    size_t valid_run = 0;  // consecutive defined values ending at i
    for (size_t i = 0; i < values.size(); ++i) {
        valid_run = is_defined(values[i]) ? valid_run + 1 : 0;
        if (valid_run >= w) {
            out[i] = fn(values.begin() + (i + 1 - w), values.begin() + (i + 1));
        }
    }
    return out;
}

} // namespace

std::vector<double> sma(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) {
        return out;
    }

    // Compensated running sum, reset whenever a NaN breaks the window.
    // A window of identical values averages to that value exactly.
    const size_t w = static_cast<size_t>(window);
    double sum = 0.0;
    double compensation = 0.0;
    size_t valid_run = 0;
    size_t equal_run = 0;  // consecutive values equal to values[i]

    // Neumaier summation: keeps the low-order bits lost to large terms
    auto add = [&sum, &compensation](double x) {
        double t = sum + x;
        if (std::abs(sum) >= std::abs(x)) {
            compensation += (sum - t) + x;
        } else {
            compensation += (x - t) + sum;
        }
        sum = t;
    };

    for (size_t i = 0; i < values.size(); ++i) {
        if (!is_defined(values[i])) {
            sum = 0.0;
            compensation = 0.0;
            valid_run = 0;
            equal_run = 0;
            continue;
        }
        equal_run = (valid_run > 0 && values[i] == values[i - 1]) ? equal_run + 1 : 1;
        add(values[i]);
        ++valid_run;
        if (valid_run > w) {
            add(-values[i - w]);
        }
        if (valid_run >= w) {
            out[i] = equal_run >= w ? values[i] : (sum + compensation) / window;
        }
    }
    return out;
}

std::vector<double> ema(const std::vector<double>& values, int span) {
    std::vector<double> out(values.size(), kNaN);
    if (span <= 0) {
        return out;
    }

    const double alpha = 2.0 / (span + 1.0);
    bool seeded = false;
    double prev = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!is_defined(values[i])) {
            if (seeded) {
                out[i] = prev;  // carry the last value across gaps
            }
            continue;
        }
        // An unchanged input leaves the average exactly where it is
        prev = (seeded && values[i] != prev) ? alpha * values[i] + (1.0 - alpha) * prev : values[i];
        seeded = true;
        out[i] = prev;
    }
    return out;
}

std::vector<double> rolling_std(const std::vector<double>& values, int window) {
    if (window < 2) {
        return std::vector<double>(values.size(), kNaN);
    }
    return rolling(values, window, [window](auto first, auto last) {
        if (std::all_of(first, last, [first](double v) { return v == *first; })) {
            return 0.0;
        }

        double mean = 0.0;
        for (auto it = first; it != last; ++it) mean += *it;
        mean /= window;

        double sq_sum = 0.0;
        for (auto it = first; it != last; ++it) sq_sum += (*it - mean) * (*it - mean);
        return std::sqrt(sq_sum / (window - 1));
    });
}

std::vector<double> rolling_max(const std::vector<double>& values, int window) {
    return rolling(values, window, [](auto first, auto last) {
        return *std::max_element(first, last);
    });
}

std::vector<double> rolling_min(const std::vector<double>& values, int window) {
    return rolling(values, window, [](auto first, auto last) {
        return *std::min_element(first, last);
    });
}

std::vector<double> rsi(const std::vector<double>& closes, int window) {
    std::vector<double> out(closes.size(), kNaN);
    if (window <= 0 || closes.size() < 2) {
        return out;
    }

    std::vector<double> gains(closes.size(), kNaN);
    std::vector<double> losses(closes.size(), kNaN);
    for (size_t i = 1; i < closes.size(); ++i) {
        if (!is_defined(closes[i]) || !is_defined(closes[i - 1])) {
            continue;
        }
        double change = closes[i] - closes[i - 1];
        gains[i] = std::max(change, 0.0);
        losses[i] = std::max(-change, 0.0);
    }

    std::vector<double> avg_gain = sma(gains, window);
    std::vector<double> avg_loss = sma(losses, window);

    for (size_t i = 0; i < closes.size(); ++i) {
        if (!is_defined(avg_gain[i]) || !is_defined(avg_loss[i])) {
            continue;
        }
        if (avg_loss[i] == 0.0) {
            out[i] = 100.0;
        } else {
            double rs = avg_gain[i] / avg_loss[i];
            out[i] = 100.0 - (100.0 / (1.0 + rs));
        }
    }
    return out;
}

MacdSeries macd(const std::vector<double>& closes, int fast, int slow, int signal) {
    MacdSeries result;
    std::vector<double> fast_ema = ema(closes, fast);
    std::vector<double> slow_ema = ema(closes, slow);

    result.macd.assign(closes.size(), kNaN);
    for (size_t i = 0; i < closes.size(); ++i) {
        if (is_defined(fast_ema[i]) && is_defined(slow_ema[i])) {
            result.macd[i] = fast_ema[i] - slow_ema[i];
        }
    }

    result.signal = ema(result.macd, signal);
    result.histogram.assign(closes.size(), kNaN);
    for (size_t i = 0; i < closes.size(); ++i) {
        if (is_defined(result.macd[i]) && is_defined(result.signal[i])) {
            result.histogram[i] = result.macd[i] - result.signal[i];
        }
    }
    return result;
}

BollingerSeries bollinger_bands(const std::vector<double>& closes, int window, double k) {
    BollingerSeries bands;
    bands.middle = sma(closes, window);
    std::vector<double> sd = rolling_std(closes, window);

    bands.upper.assign(closes.size(), kNaN);
    bands.lower.assign(closes.size(), kNaN);
    for (size_t i = 0; i < closes.size(); ++i) {
        if (is_defined(bands.middle[i]) && is_defined(sd[i])) {
            bands.upper[i] = bands.middle[i] + k * sd[i];
            bands.lower[i] = bands.middle[i] - k * sd[i];
        }
    }
    return bands;
}

std::vector<double> true_range(const core::PriceSeries& bars) {
    std::vector<double> tr(bars.size(), kNaN);
    if (!bars.empty()) {
        tr[0] = bars[0].high - bars[0].low;  // no previous close yet
    }
    for (size_t i = 1; i < bars.size(); ++i) {
        double prev_close = bars[i - 1].close;
        double high_low = bars[i].high - bars[i].low;
        double high_close = std::abs(bars[i].high - prev_close);
        double low_close = std::abs(bars[i].low - prev_close);
        tr[i] = std::max({high_low, high_close, low_close});
    }
    return tr;
}

std::vector<double> atr(const core::PriceSeries& bars, int period) {
    return sma(true_range(bars), period);
}

} // namespace meridian::indicators
