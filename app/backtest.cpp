#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "backtest/backtest_engine.hpp"
#include "csv_export.hpp"
#include "dashboard_config.hpp"
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

void printSummary(const BacktestResult& result) {
    const auto& stats = result.statistics;
    const auto& frame = result.frame;

    // clang-format off
    std::clog << "\n"
        << "=== Backtest Result: " << result.strategyName << " ===" << "\n"
        << "Ticker:          " << result.ticker << "\n"
        << "Period:          "
            << csv::formatDate(frame.timestamps.front()) << " ~ "
            << csv::formatDate(frame.timestamps.back())
            << " (" << frame.size() << " bars)" << "\n"
        << std::fixed << std::setprecision(2)
        << "Initial:         $" << result.initialCapital << "\n"
        << "Final:           $" << result.finalCapital << "\n"
        << "Buy & Hold:      $" << result.initialCapital * frame.cumulativeMarket.back() << "\n"
        << "-" << "\n"
        << "Strategy Return: " << stats.strategyReturnPct << "%" << "\n"
        << "Market Return:   " << stats.marketReturnPct << "%" << "\n"
        << "Trades:          " << stats.totalTrades << "\n"
        << "Win Rate:        " << (stats.winRate * 100.0) << "%" << "\n"
        << "Max Drawdown:    " << stats.maxDrawdownPct << "%" << "\n"
        << "Sharpe Ratio:    " << stats.sharpeRatio << "\n"
        << std::endl;
    // clang-format on
}

void printPositionChanges(const BacktestResult& result) {
    const auto& frame = result.frame;

    std::size_t changes = 0;
    for (std::size_t t = 1; t < frame.size(); ++t) {
        if (frame.position[t] == frame.position[t - 1]) {
            continue;
        }
        if (changes++ == 0) {
            // clang-format off
            std::clog << "=== Position Changes ===" << "\n"
                << std::left
                << std::setw(14) << "(Date)"
                << std::setw(10) << "(Action)"
                << std::setw(12) << "(Close)"
                << "\n-"
                << std::endl;
            // clang-format on
        }

        // clang-format off
        std::clog << std::left
            << std::setw(14) << csv::formatDate(frame.timestamps[t])
            << std::setw(10) << (frame.position[t] > frame.position[t - 1] ? "ENTER" : "EXIT")
            << std::fixed << std::setprecision(2)
            << "$" << std::setw(11) << frame.close[t]
            << std::endl;
        // clang-format on
    }

    if (changes == 0) {
        std::clog << "(No trades executed)" << std::endl;
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

    const auto  ticker = (positional.size() > 0) ? positional[0] : config.ticker;
    std::size_t fast   = config.fastWindow;
    std::size_t slow   = config.slowWindow;
    try {
        if (positional.size() > 1) {
            fast = std::stoul(positional[1]);
        }
        if (positional.size() > 2) {
            slow = std::stoul(positional[2]);
        }
    } catch (const std::logic_error&) {
        std::cerr << "Usage: backtest [TICKER] [FAST_WINDOW] [SLOW_WINDOW] [--config PATH] [--csv PATH]" << std::endl;
        return 1;
    }

    yFinance::init();
    Defer _cleanup([] { yFinance::close(); });
    yFinance::setTimeout(config.requestTimeout);

    YahooFinanceProvider provider;

    const auto data = provider.fetch(ticker, config.period, config.interval);
    if (!data) {
        std::cerr << "Failed to fetch stock data: " << data.error().message << std::endl;
        return 1;
    }

    std::clog << "Fetched " << data->close.size() << " data points for " << data->ticker << std::endl;

    const auto result = runCrossoverBacktest(*data, fast, slow, config.initialCapital);
    if (!result) {
        std::cerr << toString(result.error().kind) << ": " << result.error().message << std::endl;
        return 1;
    }

    printSummary(*result);
    printPositionChanges(*result);

    if (!csvPath.empty()) {
        std::ofstream out(csvPath);
        if (!out.is_open()) {
            std::cerr << "Error: Cannot open " << csvPath << " for writing" << std::endl;
            return 1;
        }
        csv::writeBacktest(out, result->frame);
        std::clog << "Wrote " << result->frame.size() << " rows to " << csvPath << std::endl;
    }

    return 0;
}
