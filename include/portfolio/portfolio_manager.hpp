#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "market_data.hpp"
#include "portfolio/ledger_store.hpp"
#include "portfolio/position_ledger.hpp"
#include "portfolio/trade.hpp"
#include "result.hpp"

struct PortfolioRow {
    std::string   symbol;
    PositionState position;
};

struct PortfolioTotals {
    double marketValue  = 0.0;
    double unrealizedPl = 0.0;
    double realizedPl   = 0.0;
};

/**
 * @brief Trade ledger plus per-symbol position summaries.
 *
 * The store is the source of truth; every summary is recomputed from the
 * full trade list. Quote lookups that outlive a summary's deadline are
 * joined when the manager is destroyed.
 */
class PortfolioManager {
   public:
    /**
     * @param store        Ledger storage.
     * @param quotes       Live price lookup for symbols without a supplied
     *                     price. May be null (prices stay unknown).
     * @param quoteTimeout Deadline for all live lookups of one summary.
     */
    PortfolioManager(std::shared_ptr<ILedgerStore> store, std::shared_ptr<IQuoteProvider> quotes = nullptr,
                     std::chrono::milliseconds quoteTimeout = std::chrono::milliseconds(5000));

    /**
     * @brief Validate and store a trade.
     * @return The stored trade, InvalidParameter, or the store's error.
     */
    [[nodiscard]] Result<Trade> addTrade(const TradeRequest& request);

    /**
     * @brief Remove all stored trades.
     */
    [[nodiscard]] Result<void> clearTrades();

    /**
     * @brief The trade ledger, ordered by trade date.
     */
    [[nodiscard]] Result<std::vector<Trade>> trades() const;

    /**
     * @brief Summarize every symbol in the ledger, one row per symbol in
     *        order of first appearance.
     * @param latestPrices Known prices by symbol (normalized before matching).
     *                     Missing symbols are looked up through the quote
     *                     provider.
     */
    [[nodiscard]] Result<std::vector<PortfolioRow>>
    summary(const std::map<std::string, double>& latestPrices = {}) const;

    /**
     * @brief Column sums over a summary; unknown values count as 0.
     */
    [[nodiscard]] static PortfolioTotals totals(const std::vector<PortfolioRow>& rows);

   private:
    std::shared_ptr<ILedgerStore>   store_;
    std::shared_ptr<IQuoteProvider> quotes_;
    std::chrono::milliseconds       quoteTimeout_;
    std::unique_ptr<QuoteWorkers>   workers_;
};
