#include "portfolio/position_ledger.hpp"

#include <algorithm>
#include <cmath>

namespace {

// Quantities closer than this are equal; fractional shares leave rounding dust.
constexpr double kQtyEpsilon = 1e-9;

}  // namespace

PositionState summarize(const std::vector<Trade>& trades, std::optional<double> currentPrice) {
    std::vector<Trade> ordered(trades);
    sortLedger(ordered);

    double netQty   = 0.0;
    double avgCost  = 0.0;
    double realized = 0.0;

    for (const auto& trade : ordered) {
        const double qty   = trade.quantity;
        const double price = trade.price;
        const double fees  = trade.fees;

        if (trade.side == Side::BUY) {
            const double totalCost = avgCost * netQty + price * qty + fees;
            netQty += qty;
            avgCost = (std::abs(netQty) > kQtyEpsilon) ? totalCost / netQty : 0.0;
        } else if (netQty <= 0.0) {
            // Flat or short: open/extend a short, basis reset to this sale
            netQty -= qty;
            avgCost = price;
            realized -= fees;
        } else {
            const double excess  = qty - netQty;
            const double sellQty = std::min(qty, netQty);
            realized += (price - avgCost) * sellQty - fees;

            if (excess > kQtyEpsilon) {
                // Excess quantity flips the position short
                netQty  = -excess;
                avgCost = price;
            } else if (excess >= -kQtyEpsilon) {
                netQty = 0.0;
            } else {
                netQty -= qty;
            }
        }

        if (std::abs(netQty) <= kQtyEpsilon) {
            netQty  = 0.0;
            avgCost = 0.0;
        }
    }

    PositionState state;
    state.netQuantity = netQty;
    state.averageCost = avgCost;
    state.realizedPl  = realized;

    if (currentPrice) {
        state.marketPrice  = *currentPrice;
        state.marketValue  = *currentPrice * netQty;
        state.unrealizedPl = (*currentPrice - avgCost) * netQty;
        state.totalPl      = realized + *state.unrealizedPl;
    }

    return state;
}
