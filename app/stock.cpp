#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "csv_export.hpp"
#include "dashboard_config.hpp"
#include "indicator_table.hpp"
#include "yfinance.hpp"

struct Defer {
    std::function<void()> f;
    explicit Defer(std::function<void()> f)
        : f(std::move(f)) {}
    ~Defer() {
        if (f) {
            f();
        }
    }
};

static void printOptional(const std::optional<double>& value, int width) {
    if (value) {
        std::clog << std::setw(width) << *value;
    } else {
        std::clog << std::setw(width) << "-";
    }
}

void printOverview(const StockInfo& data) {
    const auto overview = marketOverview(data);
    if (!overview) {
        return;
    }

    // clang-format off
    std::clog << "\n"
        << "=== " << data.ticker << " (" << data.exchangeName << ", " << data.currency << ") ===" << "\n"
        << std::fixed << std::setprecision(2)
        << "Last close:     $" << overview->lastClose
            << " (" << (overview->changePct >= 0.0 ? "+" : "") << overview->changePct << "%)" << "\n";
    // clang-format on
    if (overview->lastVolume) {
        std::clog << "Volume:         " << *overview->lastVolume << "\n";
    }
    std::clog << std::endl;
}

void printTable(const IndicatorTable& table) {
    // clang-format off
    std::clog << std::left
        << std::setw(12) << "(Date)"
        << std::setw(11) << "(Close)"
        << std::setw(11) << ("(" + table.smaColumn() + ")")
        << std::setw(11) << ("(" + table.emaColumn() + ")")
        << std::setw(9)  << "(RSI)"
        << std::setw(10) << "(MACD)"
        << std::setw(10) << "(Signal)"
        << std::setw(10) << "(Hist)"
        << std::setw(10) << "(Chg %)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (std::size_t i = 0; i < table.timestamps.size(); ++i) {
        std::clog << std::left << std::setw(12) << csv::formatDate(table.timestamps[i]) << std::fixed
                  << std::setprecision(2) << std::setw(11) << table.close[i];
        printOptional(table.sma[i], 11);
        printOptional(table.ema[i], 11);
        printOptional(table.rsi[i], 9);
        printOptional(table.macd[i], 10);
        printOptional(table.macdSignal[i], 10);
        printOptional(table.macdHistogram[i], 10);
        printOptional(table.dailyChangePct[i], 10);
        std::clog << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string              configPath;
    std::string              csvPath;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            csvPath = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    DashboardConfig config;
    {
        const bool explicitPath = !configPath.empty();
        const auto loaded       = loadConfig(explicitPath ? configPath : resolveFromExe("config/dashboard.json"));
        if (loaded) {
            config = loaded.value();
        } else if (explicitPath || loaded.error().kind != ErrorKind::NotFound) {
            std::cerr << "Error: " << loaded.error().message << std::endl;
            return 1;
        }
    }

    /* parse arguments */
    const auto ticker   = (positional.size() > 0) ? positional[0] : config.ticker;
    const auto period   = (positional.size() > 1) ? positional[1] : config.period;
    const auto interval = (positional.size() > 2) ? positional[2] : config.interval;

    yFinance::init();
    Defer _cleanup([] { yFinance::close(); });
    yFinance::setTimeout(config.requestTimeout);

    YahooFinanceProvider provider;

    /* get stock info */
    const auto data = provider.fetch(ticker, period, interval);
    if (!data) {
        std::cerr << toString(data.error().kind) << ": " << data.error().message << std::endl;
        return 1;
    }

    const auto table = buildIndicatorTable(*data, config.smaWindow, config.emaWindow, config.rsiPeriod);

    printOverview(*data);
    printTable(table);

    if (!csvPath.empty()) {
        std::ofstream out(csvPath);
        if (!out.is_open()) {
            std::cerr << "Error: Cannot open " << csvPath << " for writing" << std::endl;
            return 1;
        }
        csv::writeIndicators(out, table);
        std::clog << "Wrote " << table.timestamps.size() << " rows to " << csvPath << std::endl;
    }

    return 0;
}
