#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "portfolio/portfolio_manager.hpp"

using namespace std::chrono_literals;

namespace {

struct FixedQuotes: IQuoteProvider {
    explicit FixedQuotes(std::map<std::string, double> prices)
        : prices(std::move(prices)) {}

    std::optional<double> latest(const std::string& symbol) override {
        ++calls;
        const auto it = prices.find(symbol);
        if (it == prices.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, double> prices;
    std::atomic<int>              calls{0};
};

struct SlowQuotes: IQuoteProvider {
    std::optional<double> latest(const std::string&) override {
        std::this_thread::sleep_for(300ms);
        finished = true;
        return 1.0;
    }

    std::atomic<bool> finished{false};
};

struct FlakyQuotes: IQuoteProvider {
    std::optional<double> latest(const std::string& symbol) override {
        if (symbol == "BAD") {
            throw std::runtime_error("connection reset");
        }
        if (symbol == "SLOW") {
            std::this_thread::sleep_for(500ms);
            return 1.0;
        }
        return 50.0;
    }
};

TradeRequest request(const std::string& symbol, const std::string& date, double qty, double price,
                     const std::string& side, double fees = 0.0) {
    TradeRequest req;
    req.symbol    = symbol;
    req.tradeDate = date;
    req.quantity  = qty;
    req.price     = price;
    req.side      = side;
    req.fees      = fees;
    return req;
}

}  // namespace

TEST(PortfolioManager, RejectsInvalidTradesWithoutStoring) {
    auto             store = std::make_shared<InMemoryLedgerStore>();
    PortfolioManager manager(store);

    const TradeRequest invalid[] = {
        request("", "2024-01-02", 1, 10.0, "BUY"),
        request("AAPL", "2024-01-02", 0, 10.0, "BUY"),
        request("AAPL", "2024-01-02", 1, -1.0, "BUY"),
        request("AAPL", "2024-01-02", 1, 10.0, "HOLD"),
        request("AAPL", "2024-01-02", 1, 10.0, "BUY", -0.5),
        request("AAPL", "2024-02-30", 1, 10.0, "BUY"),
    };

    for (const auto& req : invalid) {
        const auto result = manager.addTrade(req);
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidParameter);
    }

    const auto stored = manager.trades();
    ASSERT_TRUE(stored.ok());
    EXPECT_TRUE(stored->empty());
}

TEST(PortfolioManager, NormalizesSymbolAndSide) {
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>());

    const auto trade = manager.addTrade(request("  msft ", "2024-01-02", 2, 300.0, " sell "));
    ASSERT_TRUE(trade.ok());
    EXPECT_EQ(trade->symbol, "MSFT");
    EXPECT_EQ(trade->side, Side::SELL);
    EXPECT_EQ(trade->sequence, 1u);
}

TEST(PortfolioManager, SummaryRowsFollowFirstAppearance) {
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>());
    ASSERT_TRUE(manager.addTrade(request("MSFT", "2024-01-05", 1, 300.0, "BUY")).ok());
    ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-02", 10, 100.0, "BUY")).ok());
    ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-03", 4, 120.0, "SELL")).ok());

    const auto rows = manager.summary({{"AAPL", 110.0}, {"MSFT", 310.0}});
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 2u);

    // AAPL's first trade is dated earlier, so it leads
    const auto& aapl = (*rows)[0];
    EXPECT_EQ(aapl.symbol, "AAPL");
    EXPECT_DOUBLE_EQ(aapl.position.netQuantity, 6.0);
    EXPECT_DOUBLE_EQ(aapl.position.realizedPl, 80.0);
    EXPECT_DOUBLE_EQ(*aapl.position.unrealizedPl, 60.0);
    EXPECT_DOUBLE_EQ(*aapl.position.marketValue, 660.0);

    const auto& msft = (*rows)[1];
    EXPECT_EQ(msft.symbol, "MSFT");
    EXPECT_DOUBLE_EQ(*msft.position.unrealizedPl, 10.0);

    const auto totals = PortfolioManager::totals(rows.value());
    EXPECT_DOUBLE_EQ(totals.marketValue, 970.0);
    EXPECT_DOUBLE_EQ(totals.unrealizedPl, 70.0);
    EXPECT_DOUBLE_EQ(totals.realizedPl, 80.0);
}

TEST(PortfolioManager, SuppliedPricesAreNotLookedUp) {
    auto             quotes = std::make_shared<FixedQuotes>(std::map<std::string, double>{{"AAPL", 1.0}, {"MSFT", 2.0}});
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>(), quotes);
    ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-02", 1, 100.0, "BUY")).ok());
    ASSERT_TRUE(manager.addTrade(request("MSFT", "2024-01-02", 1, 100.0, "BUY")).ok());

    const auto rows = manager.summary({{"AAPL", 150.0}});
    ASSERT_TRUE(rows.ok());
    EXPECT_EQ(quotes->calls.load(), 1);

    EXPECT_DOUBLE_EQ(*(*rows)[0].position.marketPrice, 150.0);
    EXPECT_DOUBLE_EQ(*(*rows)[1].position.marketPrice, 2.0);
}

TEST(PortfolioManager, SuppliedPriceKeysAreNormalized) {
    auto             quotes = std::make_shared<FixedQuotes>(std::map<std::string, double>{{"AAPL", 1.0}});
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>(), quotes);
    ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-02", 1, 100.0, "BUY")).ok());

    const auto rows = manager.summary({{" aapl ", 190.0}});
    ASSERT_TRUE(rows.ok());
    EXPECT_EQ(quotes->calls.load(), 0);
    ASSERT_TRUE((*rows)[0].position.marketPrice.has_value());
    EXPECT_DOUBLE_EQ(*(*rows)[0].position.marketPrice, 190.0);
}

TEST(PortfolioManager, DestructionWaitsForLateLookups) {
    auto quotes = std::make_shared<SlowQuotes>();
    {
        PortfolioManager manager(std::make_shared<InMemoryLedgerStore>(), quotes, 20ms);
        ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-02", 1, 100.0, "BUY")).ok());

        const auto rows = manager.summary();
        ASSERT_TRUE(rows.ok());
        EXPECT_FALSE((*rows)[0].position.marketPrice.has_value());
        EXPECT_FALSE(quotes->finished.load());
    }

    EXPECT_TRUE(quotes->finished.load());
}

TEST(PortfolioManager, FailedLookupOnlyBlanksThatSymbol) {
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>(), std::make_shared<FlakyQuotes>(), 100ms);
    ASSERT_TRUE(manager.addTrade(request("GOOD", "2024-01-02", 2, 40.0, "BUY")).ok());
    ASSERT_TRUE(manager.addTrade(request("BAD", "2024-01-02", 1, 10.0, "BUY")).ok());
    ASSERT_TRUE(manager.addTrade(request("SLOW", "2024-01-02", 1, 10.0, "SELL", 1.0)).ok());

    const auto start = std::chrono::steady_clock::now();
    const auto rows  = manager.summary();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 450ms);

    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 3u);

    const auto& good = (*rows)[0];
    ASSERT_TRUE(good.position.unrealizedPl.has_value());
    EXPECT_DOUBLE_EQ(*good.position.unrealizedPl, 20.0);

    const auto& bad = (*rows)[1];
    EXPECT_DOUBLE_EQ(bad.position.netQuantity, 1.0);
    EXPECT_DOUBLE_EQ(bad.position.averageCost, 10.0);
    EXPECT_FALSE(bad.position.marketPrice.has_value());
    EXPECT_FALSE(bad.position.totalPl.has_value());

    const auto& slow = (*rows)[2];
    EXPECT_DOUBLE_EQ(slow.position.netQuantity, -1.0);
    EXPECT_DOUBLE_EQ(slow.position.realizedPl, -1.0);
    EXPECT_FALSE(slow.position.marketPrice.has_value());

    const auto totals = PortfolioManager::totals(rows.value());
    EXPECT_DOUBLE_EQ(totals.marketValue, 100.0);
    EXPECT_DOUBLE_EQ(totals.unrealizedPl, 20.0);
    EXPECT_DOUBLE_EQ(totals.realizedPl, -1.0);
}

TEST(PortfolioManager, WithoutProviderPricesStayUnknown) {
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>());
    ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-02", 1, 100.0, "BUY")).ok());

    const auto rows = manager.summary();
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 1u);
    EXPECT_FALSE((*rows)[0].position.marketPrice.has_value());
    EXPECT_FALSE((*rows)[0].position.unrealizedPl.has_value());
}

TEST(PortfolioManager, EmptyLedgerHasNoRows) {
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>());

    const auto rows = manager.summary();
    ASSERT_TRUE(rows.ok());
    EXPECT_TRUE(rows->empty());

    const auto totals = PortfolioManager::totals(rows.value());
    EXPECT_DOUBLE_EQ(totals.marketValue, 0.0);
    EXPECT_DOUBLE_EQ(totals.realizedPl, 0.0);
}

TEST(PortfolioManager, ClearEmptiesTheLedger) {
    PortfolioManager manager(std::make_shared<InMemoryLedgerStore>());
    ASSERT_TRUE(manager.addTrade(request("AAPL", "2024-01-02", 1, 100.0, "BUY")).ok());
    ASSERT_TRUE(manager.clearTrades().ok());

    const auto stored = manager.trades();
    ASSERT_TRUE(stored.ok());
    EXPECT_TRUE(stored->empty());
}
