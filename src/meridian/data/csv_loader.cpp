#include <meridian/data/csv_loader.hpp>
#include <meridian/core/errors.hpp>
#include <meridian/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <vector>

namespace meridian::data {

namespace {

constexpr int64_t kMillisecondThreshold = 1000000000000LL;  // values above are epoch ms

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\"");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

int find_column(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

double parse_number(const std::string& field, const std::string& column, const std::string& where) {
    try {
        size_t consumed = 0;
        double value = std::stod(field, &consumed);
        if (consumed != field.size()) {
            throw std::invalid_argument(field);
        }
        return value;
    } catch (const std::exception&) {
        throw core::ValidationError(where + ": invalid " + column + " '" + field + "'");
    }
}

} // namespace

std::optional<int64_t> CsvLoader::parse_timestamp(const std::string& field) {
    std::string s = trim(field);
    if (s.empty()) {
        return std::nullopt;
    }

    if (all_digits(s)) {
        try {
            int64_t value = std::stoll(s);
            return value > kMillisecondThreshold ? value / 1000 : value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    // YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z]
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }
    std::string year = s.substr(0, 4);
    std::string month = s.substr(5, 2);
    std::string day = s.substr(8, 2);
    if (!all_digits(year) || !all_digits(month) || !all_digits(day)) {
        return std::nullopt;
    }

    int y = std::stoi(year);
    int m = std::stoi(month);
    int d = std::stoi(day);
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    if (s.size() > 10) {
        if (s[10] != 'T' && s[10] != ' ') {
            return std::nullopt;
        }
        std::string time_part = s.substr(11);
        if (!time_part.empty() && time_part.back() == 'Z') {
            time_part.pop_back();
        }
        auto fields = split(time_part, ':');
        if (fields.size() < 2 || fields.size() > 3) {
            return std::nullopt;
        }
        if (fields.size() == 3) {
            // Drop fractional seconds
            fields[2] = fields[2].substr(0, fields[2].find('.'));
        }
        for (const auto& f : fields) {
            if (!all_digits(f)) return std::nullopt;
        }
        hour = std::stoi(fields[0]);
        minute = std::stoi(fields[1]);
        second = fields.size() == 3 ? std::stoi(fields[2]) : 0;
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
    }

    int64_t days = days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    return days * 86400 + hour * 3600 + minute * 60 + second;
}

core::PriceSeries CsvLoader::parse(std::istream& in, const std::string& source) {
    std::string line;
    if (!std::getline(in, line)) {
        throw core::ValidationError(source + ": missing header row");
    }

    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) h = to_lower(h);

    int i_time = find_column(headers, {"timestamp", "date", "datetime", "time"});
    int i_open = find_column(headers, {"open", "o"});
    int i_high = find_column(headers, {"high", "h"});
    int i_low = find_column(headers, {"low", "l"});
    int i_close = find_column(headers, {"close", "c"});
    int i_volume = find_column(headers, {"volume", "vol", "v"});

    if (i_time < 0 || i_open < 0 || i_high < 0 || i_low < 0 || i_close < 0) {
        throw core::ValidationError(source + ": header must name timestamp, open, high, low and close columns");
    }
    int required = std::max({i_time, i_open, i_high, i_low, i_close});

    core::PriceSeries series;
    int line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }

        std::string where = source + ":" + std::to_string(line_number);
        std::vector<std::string> fields = split(line, ',');
        if (static_cast<int>(fields.size()) <= required) {
            throw core::ValidationError(where + ": expected at least " + std::to_string(required + 1) +
                                        " fields, got " + std::to_string(fields.size()));
        }

        auto timestamp = parse_timestamp(fields[i_time]);
        if (!timestamp) {
            throw core::ValidationError(where + ": invalid timestamp '" + fields[i_time] + "'");
        }

        core::Bar bar;
        bar.timestamp = *timestamp;
        bar.open = parse_number(fields[i_open], "open", where);
        bar.high = parse_number(fields[i_high], "high", where);
        bar.low = parse_number(fields[i_low], "low", where);
        bar.close = parse_number(fields[i_close], "close", where);
        if (i_volume >= 0 && i_volume < static_cast<int>(fields.size()) && !fields[i_volume].empty()) {
            bar.volume = parse_number(fields[i_volume], "volume", where);
        }
        series.push_back(bar);
    }

    std::stable_sort(series.begin(), series.end(), [](const core::Bar& a, const core::Bar& b) {
        return a.timestamp < b.timestamp;
    });

    core::validate_series(series);
    return series;
}

core::PriceSeries CsvLoader::load(const std::string& path) {
    auto start_time = std::chrono::steady_clock::now();

    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::ValidationError("failed to open CSV file: " + path);
    }

    core::PriceSeries series = parse(file, path);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    utils::Logger::info() << "Loaded " << series.size() << " bars from " << path
                          << " (" << duration << "ms)" << utils::Logger::endl;
    return series;
}

} // namespace meridian::data
