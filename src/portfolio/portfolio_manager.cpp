#include "portfolio/portfolio_manager.hpp"

PortfolioManager::PortfolioManager(std::shared_ptr<ILedgerStore> store, std::shared_ptr<IQuoteProvider> quotes,
                                   std::chrono::milliseconds quoteTimeout)
    : store_(std::move(store))
    , quotes_(std::move(quotes))
    , quoteTimeout_(quoteTimeout)
    , workers_(std::make_unique<QuoteWorkers>()) {}

Result<Trade> PortfolioManager::addTrade(const TradeRequest& request) {
    auto trade = makeTrade(request);
    if (!trade) {
        return trade;
    }
    return store_->append(trade.value());
}

Result<void> PortfolioManager::clearTrades() {
    return store_->clear();
}

Result<std::vector<Trade>> PortfolioManager::trades() const {
    return store_->listAll();
}

Result<std::vector<PortfolioRow>> PortfolioManager::summary(const std::map<std::string, double>& latestPrices) const {
    const auto ledger = store_->listAll();
    if (!ledger) {
        return ledger.error();
    }

    // Group by symbol, keeping ledger order inside each group
    std::vector<std::string>                  symbols;
    std::map<std::string, std::vector<Trade>> bySymbol;
    for (const auto& trade : ledger.value()) {
        auto& group = bySymbol[trade.symbol];
        if (group.empty()) {
            symbols.push_back(trade.symbol);
        }
        group.push_back(trade);
    }

    std::map<std::string, double> known;
    for (const auto& [symbol, price] : latestPrices) {
        known[normalizeSymbol(symbol)] = price;
    }

    std::map<std::string, std::optional<double>> prices;
    std::vector<std::string>                     missing;
    for (const auto& symbol : symbols) {
        const auto it = known.find(symbol);
        if (it != known.end()) {
            prices[symbol] = it->second;
        } else {
            missing.push_back(symbol);
        }
    }

    if (!missing.empty()) {
        const auto fetched = fetchQuotes(quotes_, missing, quoteTimeout_, *workers_);
        prices.insert(fetched.begin(), fetched.end());
    }

    std::vector<PortfolioRow> rows;
    rows.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        rows.push_back(PortfolioRow{symbol, summarize(bySymbol[symbol], prices[symbol])});
    }

    return rows;
}

PortfolioTotals PortfolioManager::totals(const std::vector<PortfolioRow>& rows) {
    PortfolioTotals totals;
    for (const auto& row : rows) {
        totals.marketValue += row.position.marketValue.value_or(0.0);
        totals.unrealizedPl += row.position.unrealizedPl.value_or(0.0);
        totals.realizedPl += row.position.realizedPl;
    }
    return totals;
}
