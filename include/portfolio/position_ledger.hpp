#pragma once

#include <optional>
#include <vector>

#include "portfolio/trade.hpp"

/**
 * @brief Derived position for one symbol. Recomputed from the full trade
 *        history on every query, never stored.
 */
struct PositionState {
    double netQuantity = 0.0;  // > 0 long, < 0 short
    double averageCost = 0.0;  // cost basis per unit of the open position, 0 when flat
    double realizedPl  = 0.0;

    // Empty when no market price is known. Zero is a real P&L value.
    std::optional<double> marketPrice;
    std::optional<double> marketValue;
    std::optional<double> unrealizedPl;
    std::optional<double> totalPl;
};

/**
 * @brief Replay one symbol's trades into a position.
 * @param trades       Trades of a single symbol, in any order. They are
 *                     replayed by tradeDate, ties by sequence then list order.
 * @param currentPrice Mark price for unrealized P&L, if known.
 *
 * BUY: weighted-average cost including fees.
 * SELL against a long: realizes (price - avg) * closed qty - fees; any excess
 * quantity flips the position short at avg = sale price.
 * SELL while flat or short: opens/extends a short at avg = sale price and
 * charges fees to realized P&L. This is a simplified short convention, not
 * lot accounting.
 */
[[nodiscard]] PositionState summarize(const std::vector<Trade>& trades,
                                      std::optional<double> currentPrice = std::nullopt);
