#include <meridian/report/report.hpp>
#include <meridian/utils/logger.hpp>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace meridian::report {

namespace {

std::string percent(double fraction, bool show_sign = true) {
    std::ostringstream oss;
    if (show_sign) oss << std::showpos;
    oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return oss.str();
}

// Shortest decimal form that reads back as the same double
std::string exact_number(double value) {
    std::ostringstream oss;
    for (int precision = 6; precision < std::numeric_limits<double>::max_digits10; ++precision) {
        oss.str("");
        oss << std::setprecision(precision) << value;
        if (std::stod(oss.str()) == value) {
            return oss.str();
        }
    }
    oss.str("");
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

std::string money(double value) {
    std::ostringstream oss;
    oss << "$" << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace

std::string format_ratio(double value, int precision) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (std::isnan(value)) {
        return "nan";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void print_summary(const backtest::BacktestResult& result, std::ostream& out) {
    const auto& perf = result.performance;
    out << std::string(60, '=') << "\n"
        << "Backtest report: " << result.strategy_name << "\n"
        << std::string(60, '=') << "\n"
        << "Data points:        " << result.data_points << "\n"
        << "Initial capital:    " << money(perf.initial_capital) << "\n"
        << "Final equity:       " << money(perf.final_equity) << "\n"
        << "Total return:       " << percent(perf.total_return) << "\n"
        << "Annualized return:  " << percent(perf.annualized_return) << "\n"
        << "Max drawdown:       " << percent(perf.max_drawdown) << "\n"
        << "Sharpe ratio:       " << format_ratio(perf.sharpe_ratio) << "\n"
        << "Sortino ratio:      " << format_ratio(perf.sortino_ratio) << "\n"
        << "Calmar ratio:       " << format_ratio(perf.calmar_ratio) << "\n"
        << "Total trades:       " << perf.total_trades << "\n"
        << "Round trips:        " << perf.round_trips << "\n"
        << "Win rate:           " << percent(perf.win_rate, false) << "\n";
}

void print_comparison(const std::vector<backtest::RunOutcome>& outcomes, std::ostream& out) {
    out << std::left << std::setw(32) << "Strategy"
        << std::right << std::setw(12) << "Return"
        << std::setw(12) << "Max DD"
        << std::setw(10) << "Sharpe"
        << std::setw(10) << "Sortino"
        << std::setw(10) << "Calmar"
        << std::setw(8) << "Trades"
        << std::setw(10) << "Win rate" << "\n";
    out << std::string(104, '-') << "\n";

    const backtest::RunOutcome* best = nullptr;
    for (const auto& outcome : outcomes) {
        out << std::left << std::setw(32) << outcome.strategy_name << std::right;
        if (!outcome.ok()) {
            out << "  failed: " << outcome.error << "\n";
            continue;
        }

        const auto& perf = outcome.result->performance;
        out << std::setw(12) << percent(perf.total_return)
            << std::setw(12) << percent(perf.max_drawdown)
            << std::setw(10) << format_ratio(perf.sharpe_ratio)
            << std::setw(10) << format_ratio(perf.sortino_ratio)
            << std::setw(10) << format_ratio(perf.calmar_ratio)
            << std::setw(8) << perf.total_trades
            << std::setw(10) << percent(perf.win_rate, false) << "\n";

        if (!best || utils::ratio_greater(perf.sortino_ratio, best->result->performance.sortino_ratio)) {
            best = &outcome;
        }
    }

    out << std::string(104, '-') << "\n";
    if (best) {
        out << "Best strategy (Sortino): " << best->strategy_name << " ("
            << format_ratio(best->result->performance.sortino_ratio) << ")\n";
    } else {
        out << "No strategy completed\n";
    }
}

bool write_trade_log(const backtest::BacktestResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to create CSV file: " << path << utils::Logger::endl;
        return false;
    }

    file << "timestamp,action,price,quantity,value,commission,signal\n";
    for (const auto& trade : result.trades) {
        file << trade.timestamp << ","
             << core::to_string(trade.action) << ","
             << std::fixed << std::setprecision(6) << trade.price << ","
             << exact_number(trade.quantity) << ","
             << trade.value << ","
             << trade.commission << ","
             << core::to_int(trade.signal) << "\n";
    }

    if (!file) {
        utils::Logger::error() << "Failed writing trade log: " << path << utils::Logger::endl;
        return false;
    }
    utils::Logger::info() << "Exported " << result.trades.size() << " trades to " << path << utils::Logger::endl;
    return true;
}

bool write_equity_curve(const backtest::BacktestResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to create CSV file: " << path << utils::Logger::endl;
        return false;
    }

    file << "timestamp,cash,position,price,equity\n";
    for (const auto& point : result.equity_curve) {
        file << point.timestamp << ","
             << std::fixed << std::setprecision(6) << point.cash << ","
             << point.position << ","
             << point.price << ","
             << point.equity << "\n";
    }

    if (!file) {
        utils::Logger::error() << "Failed writing equity curve: " << path << utils::Logger::endl;
        return false;
    }
    return true;
}

} // namespace meridian::report
