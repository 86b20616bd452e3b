#include <algorithm>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "csv_export.hpp"
#include "dashboard_config.hpp"
#include "portfolio/ledger_store.hpp"
#include "portfolio/portfolio_manager.hpp"
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

static void printUsage() {
    std::cerr << "Usage:\n"
              << "  portfolio add SYMBOL YYYY-MM-DD QUANTITY PRICE BUY|SELL [FEES]\n"
              << "  portfolio list [--csv PATH]\n"
              << "  portfolio summary [SYMBOL=PRICE ...] [--csv PATH]\n"
              << "  portfolio clear\n"
              << "Options: --config PATH" << std::endl;
}

static void printOptional(const std::optional<double>& value, int width) {
    if (value) {
        std::clog << std::setw(width) << *value;
    } else {
        std::clog << std::setw(width) << "-";
    }
}

void printTrades(const std::vector<Trade>& trades) {
    if (trades.empty()) {
        std::clog << "No trades recorded yet." << std::endl;
        return;
    }

    // clang-format off
    std::clog << "=== Trade History ===" << "\n"
        << std::left
        << std::setw(10) << "(Symbol)"
        << std::setw(14) << "(Date)"
        << std::setw(8)  << "(Side)"
        << std::setw(12) << "(Quantity)"
        << std::setw(12) << "(Price)"
        << std::setw(10) << "(Fees)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (const auto& trade : trades) {
        // clang-format off
        std::clog << std::left
            << std::setw(10) << trade.symbol
            << std::setw(14) << trade.tradeDate
            << std::setw(8)  << toString(trade.side)
            << std::fixed << std::setprecision(2)
            << std::setw(12) << trade.quantity
            << "$" << std::setw(11) << trade.price
            << "$" << std::setw(9) << trade.fees
            << std::endl;
        // clang-format on
    }
}

void printSummary(const std::vector<PortfolioRow>& rows) {
    // clang-format off
    std::clog << "=== Positions Overview ===" << "\n"
        << std::left
        << std::setw(10) << "(Symbol)"
        << std::setw(12) << "(Net Qty)"
        << std::setw(12) << "(Avg Cost)"
        << std::setw(12) << "(Price)"
        << std::setw(14) << "(Value)"
        << std::setw(14) << "(Realized)"
        << std::setw(14) << "(Unrealized)"
        << std::setw(14) << "(Total)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (const auto& row : rows) {
        const auto& p = row.position;
        std::clog << std::left << std::setw(10) << row.symbol << std::fixed << std::setprecision(2) << std::setw(12)
                  << p.netQuantity << std::setw(12) << p.averageCost;
        printOptional(p.marketPrice, 12);
        printOptional(p.marketValue, 14);
        std::clog << std::setw(14) << p.realizedPl;
        printOptional(p.unrealizedPl, 14);
        printOptional(p.totalPl, 14);
        std::clog << std::endl;
    }

    const auto totals = PortfolioManager::totals(rows);

    // clang-format off
    std::clog << "-" << "\n"
        << std::fixed << std::setprecision(2)
        << "Portfolio market value: $" << totals.marketValue << "\n"
        << "Unrealized P&L:         $" << totals.unrealizedPl << "\n"
        << "Realized P&L:           $" << totals.realizedPl << "\n"
        << std::endl;
    // clang-format on
}

static bool writeCsv(const std::string& path, const std::function<void(std::ostream&)>& writer) {
    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "Error: Cannot open " << path << " for writing" << std::endl;
        return false;
    }
    writer(out);
    std::clog << "Wrote " << path << std::endl;
    return true;
}

int main(int argc, char* argv[]) {
    std::string              configPath;
    std::string              csvPath;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            csvPath = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return 1;
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

    yFinance::init();
    Defer _cleanup([] { yFinance::close(); });
    // Keep late quote requests short; the manager still joins them on exit
    yFinance::setTimeout(std::min(config.requestTimeout, config.quoteTimeout));

    auto store  = std::make_shared<JsonLedgerStore>(config.ledgerPath);
    auto quotes = std::make_shared<YahooFinanceProvider>();

    // Declared after _cleanup: its quote workers are joined before curl_global_cleanup()
    PortfolioManager manager(store, quotes, config.quoteTimeout);

    const auto& command = args[0];

    if (command == "add") {
        if (args.size() < 6) {
            printUsage();
            return 1;
        }

        TradeRequest request;
        request.symbol    = args[1];
        request.tradeDate = args[2];
        request.side      = args[5];
        try {
            request.quantity = std::stod(args[3]);
            request.price    = std::stod(args[4]);
            request.fees     = args.size() > 6 ? std::stod(args[6]) : 0.0;
        } catch (const std::logic_error&) {
            std::cerr << "Error: quantity, price and fees must be numbers" << std::endl;
            return 1;
        }

        const auto stored = manager.addTrade(request);
        if (!stored) {
            std::cerr << toString(stored.error().kind) << ": " << stored.error().message << std::endl;
            return 1;
        }
        std::clog << "Trade saved: " << toString(stored->side) << " " << stored->quantity << " " << stored->symbol
                  << " @ " << stored->price << std::endl;
        return 0;
    }

    if (command == "clear") {
        const auto cleared = manager.clearTrades();
        if (!cleared) {
            std::cerr << toString(cleared.error().kind) << ": " << cleared.error().message << std::endl;
            return 1;
        }
        std::clog << "Trade history cleared." << std::endl;
        return 0;
    }

    if (command == "list") {
        const auto trades = manager.trades();
        if (!trades) {
            std::cerr << toString(trades.error().kind) << ": " << trades.error().message << std::endl;
            return 1;
        }
        printTrades(*trades);
        if (!csvPath.empty() && !writeCsv(csvPath, [&](std::ostream& os) { csv::writeTrades(os, *trades); })) {
            return 1;
        }
        return 0;
    }

    if (command == "summary") {
        std::map<std::string, double> latestPrices;
        for (std::size_t i = 1; i < args.size(); ++i) {
            const auto pos = args[i].find('=');
            if (pos == std::string::npos) {
                printUsage();
                return 1;
            }
            try {
                latestPrices[normalizeSymbol(args[i].substr(0, pos))] = std::stod(args[i].substr(pos + 1));
            } catch (const std::logic_error&) {
                std::cerr << "Error: invalid price in " << args[i] << std::endl;
                return 1;
            }
        }

        const auto rows = manager.summary(latestPrices);
        if (!rows) {
            std::cerr << toString(rows.error().kind) << ": " << rows.error().message << std::endl;
            return 1;
        }
        if (rows->empty()) {
            std::clog << "No trades recorded yet." << std::endl;
            return 0;
        }
        printSummary(*rows);
        if (!csvPath.empty() && !writeCsv(csvPath, [&](std::ostream& os) { csv::writePortfolio(os, *rows); })) {
            return 1;
        }
        return 0;
    }

    printUsage();
    return 1;
}
