#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"

/**
 * @brief Settings shared by the stock, backtest and portfolio programs.
 *
 * @example config/dashboard.json
 * {
 *   "ticker": "AAPL", "period": "6mo", "interval": "1d",
 *   "indicators":  {"sma_window": 20, "ema_window": 50, "rsi_period": 14},
 *   "backtest":    {"fast_window": 20, "slow_window": 50, "initial_capital": 10000.0},
 *   "portfolio":   {"ledger_path": "data/portfolio.json"},
 *   "market_data": {"quote_timeout_ms": 5000, "request_timeout_ms": 10000, "cache_ttl_s": 300}
 * }
 */
struct DashboardConfig {
    std::string ticker   = "AAPL";
    std::string period   = "6mo";
    std::string interval = "1d";

    std::size_t smaWindow = 20;
    std::size_t emaWindow = 50;
    std::size_t rsiPeriod = 14;

    std::size_t fastWindow     = 20;
    std::size_t slowWindow     = 50;
    double      initialCapital = 10000.0;

    std::string ledgerPath = "data/portfolio.json";

    std::chrono::milliseconds quoteTimeout{5000};
    std::chrono::milliseconds requestTimeout{10000};
    std::chrono::seconds      cacheTtl{300};
};

/**
 * @brief Read settings from a parsed document. Absent keys keep defaults.
 * @return InvalidParameter when a present key has the wrong type.
 */
[[nodiscard]] Result<DashboardConfig> parseConfig(const nlohmann::json& doc);

/**
 * @brief Load settings from a JSON file.
 * @return NotFound when the file cannot be opened, InvalidParameter when it
 *         does not parse.
 */
[[nodiscard]] Result<DashboardConfig> loadConfig(const std::string& path);

/**
 * @brief Resolve a path relative to the project root, found by walking up
 *        from the executable (build/<type>/app/<exe>).
 *        e.g., resolveFromExe("config/x.json") -> <root>/config/x.json
 */
[[nodiscard]] std::string resolveFromExe(const std::string& relativePath);
