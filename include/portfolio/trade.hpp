#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"

enum class Side
{
    BUY,
    SELL,
};

[[nodiscard]] const char* toString(Side side);

/**
 * @brief Parse "buy"/"SELL"/" Sell " etc. into a Side.
 */
[[nodiscard]] std::optional<Side> parseSide(const std::string& side);

/**
 * @brief Trim surrounding whitespace and upper-case.
 * @example " aapl " -> "AAPL"
 */
[[nodiscard]] std::string normalizeSymbol(const std::string& symbol);

/**
 * @brief True for a real calendar date written as YYYY-MM-DD.
 */
[[nodiscard]] bool isIsoDate(const std::string& date);

/**
 * @brief A validated ledger entry. Never mutated once stored.
 */
struct Trade {
    /**
     * @brief Normalized ticker.
     * @example "AAPL"
     */
    std::string symbol;

    /**
     * @brief
     * @example "2024-03-15"
     */
    std::string tradeDate;

    double quantity = 0.0;  // > 0
    double price    = 0.0;  // > 0
    Side   side     = Side::BUY;
    double fees     = 0.0;  // >= 0

    /**
     * @brief Insertion order, assigned by the ledger store.
     */
    std::uint64_t sequence = 0;
};

/**
 * @brief Raw trade as entered by the user, before validation.
 */
struct TradeRequest {
    std::string symbol;
    std::string tradeDate;
    double      quantity = 0.0;
    double      price    = 0.0;
    std::string side     = "BUY";
    double      fees     = 0.0;
};

/**
 * @brief Validate and normalize a trade request.
 * @return The trade (sequence 0) or InvalidParameter.
 */
[[nodiscard]] Result<Trade> makeTrade(const TradeRequest& request);

/**
 * @brief Order trades by tradeDate, ties by sequence (stable).
 */
void sortLedger(std::vector<Trade>& trades);
