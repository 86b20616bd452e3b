#include <gtest/gtest.h>

#include <vector>

#include "portfolio/position_ledger.hpp"
#include "test_helpers.hpp"

using test::makeTrade;

TEST(Summarize, BuyThenPartialSell) {
    std::vector<Trade> trades = {makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1)};

    auto state = summarize(trades);
    EXPECT_DOUBLE_EQ(state.netQuantity, 10.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 100.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, 0.0);

    trades.push_back(makeTrade("2024-01-03", Side::SELL, 4, 120.0, 0.0, 2));

    state = summarize(trades);
    EXPECT_DOUBLE_EQ(state.realizedPl, 80.0);
    EXPECT_DOUBLE_EQ(state.netQuantity, 6.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 100.0);
}

TEST(Summarize, SellFromFlatOpensShort) {
    const auto state = summarize({makeTrade("2024-01-02", Side::SELL, 5, 50.0, 1.5, 1)});

    EXPECT_DOUBLE_EQ(state.netQuantity, -5.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 50.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, -1.5);
}

TEST(Summarize, ExtendingShortResetsBasisToLatestSale) {
    const auto state = summarize({
        makeTrade("2024-01-02", Side::SELL, 5, 50.0, 0.0, 1),
        makeTrade("2024-01-03", Side::SELL, 5, 40.0, 0.0, 2),
    });

    EXPECT_DOUBLE_EQ(state.netQuantity, -10.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 40.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, 0.0);
}

TEST(Summarize, BuyFeesAreCapitalizedIntoCost) {
    const auto state = summarize({
        makeTrade("2024-01-02", Side::BUY, 10, 100.0, 10.0, 1),
        makeTrade("2024-01-03", Side::BUY, 10, 110.0, 0.0, 2),
    });

    EXPECT_DOUBLE_EQ(state.netQuantity, 20.0);
    EXPECT_DOUBLE_EQ(state.averageCost, (1010.0 + 1100.0) / 20.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, 0.0);
}

TEST(Summarize, BuyNeverChangesRealized) {
    const auto afterSell = summarize({
        makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1),
        makeTrade("2024-01-03", Side::SELL, 5, 90.0, 2.0, 2),
    });
    const auto afterBuy = summarize({
        makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1),
        makeTrade("2024-01-03", Side::SELL, 5, 90.0, 2.0, 2),
        makeTrade("2024-01-04", Side::BUY, 7, 80.0, 3.0, 3),
    });

    EXPECT_DOUBLE_EQ(afterSell.realizedPl, -52.0);
    EXPECT_DOUBLE_EQ(afterBuy.realizedPl, afterSell.realizedPl);
}

TEST(Summarize, ClosingFullyResetsAverageCost) {
    const auto state = summarize(
        {
            makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1),
            makeTrade("2024-01-03", Side::SELL, 10, 110.0, 0.0, 2),
        },
        200.0);

    EXPECT_DOUBLE_EQ(state.netQuantity, 0.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 0.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, 100.0);

    ASSERT_TRUE(state.unrealizedPl.has_value());
    EXPECT_DOUBLE_EQ(*state.unrealizedPl, 0.0);
    ASSERT_TRUE(state.marketValue.has_value());
    EXPECT_DOUBLE_EQ(*state.marketValue, 0.0);
    ASSERT_TRUE(state.totalPl.has_value());
    EXPECT_DOUBLE_EQ(*state.totalPl, 100.0);
}

TEST(Summarize, OversizedSellFlipsShortAndChargesWholeFeeToLong) {
    const auto state = summarize(
        {
            makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1),
            makeTrade("2024-01-03", Side::SELL, 15, 120.0, 5.0, 2),
        },
        110.0);

    EXPECT_DOUBLE_EQ(state.netQuantity, -5.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 120.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, 20.0 * 10.0 - 5.0);

    ASSERT_TRUE(state.unrealizedPl && state.marketValue && state.totalPl);
    EXPECT_DOUBLE_EQ(*state.unrealizedPl, 50.0);
    EXPECT_DOUBLE_EQ(*state.marketValue, -550.0);
    EXPECT_DOUBLE_EQ(*state.totalPl, 245.0);
}

TEST(Summarize, FractionalSellsCloseExactly) {
    // 0.3 - 0.1 leaves 0.19999999999999998 behind
    const auto split = summarize(
        {
            makeTrade("2024-01-02", Side::BUY, 0.3, 100.0, 0.0, 1),
            makeTrade("2024-01-03", Side::SELL, 0.1, 110.0, 0.0, 2),
            makeTrade("2024-01-04", Side::SELL, 0.2, 120.0, 0.0, 3),
        },
        130.0);

    EXPECT_EQ(split.netQuantity, 0.0);
    EXPECT_EQ(split.averageCost, 0.0);
    EXPECT_NEAR(split.realizedPl, 5.0, 1e-9);
    ASSERT_TRUE(split.unrealizedPl && split.marketValue);
    EXPECT_EQ(*split.unrealizedPl, 0.0);
    EXPECT_EQ(*split.marketValue, 0.0);

    // 0.1 + 0.2 overshoots 0.3
    const auto merged = summarize({
        makeTrade("2024-01-02", Side::BUY, 0.1, 100.0, 0.0, 1),
        makeTrade("2024-01-03", Side::BUY, 0.2, 100.0, 0.0, 2),
        makeTrade("2024-01-04", Side::SELL, 0.3, 100.0, 0.0, 3),
    });

    EXPECT_EQ(merged.netQuantity, 0.0);
    EXPECT_EQ(merged.averageCost, 0.0);
    EXPECT_NEAR(merged.realizedPl, 0.0, 1e-9);

    // A real excess still flips short
    const auto flipped = summarize({
        makeTrade("2024-01-02", Side::BUY, 0.3, 100.0, 0.0, 1),
        makeTrade("2024-01-03", Side::SELL, 0.5, 90.0, 0.0, 2),
    });
    EXPECT_NEAR(flipped.netQuantity, -0.2, 1e-12);
    EXPECT_DOUBLE_EQ(flipped.averageCost, 90.0);
}

TEST(Summarize, MarksToMarketWhenPriceKnown) {
    const auto state = summarize({makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1)}, 95.0);

    ASSERT_TRUE(state.marketPrice.has_value());
    EXPECT_DOUBLE_EQ(*state.marketPrice, 95.0);
    EXPECT_DOUBLE_EQ(*state.marketValue, 950.0);
    EXPECT_DOUBLE_EQ(*state.unrealizedPl, -50.0);
    EXPECT_DOUBLE_EQ(*state.totalPl, -50.0);
}

TEST(Summarize, UnknownPriceLeavesMarkToMarketEmpty) {
    const auto state = summarize({
        makeTrade("2024-01-02", Side::BUY, 10, 100.0, 0.0, 1),
        makeTrade("2024-01-03", Side::SELL, 4, 120.0, 0.0, 2),
    });

    EXPECT_DOUBLE_EQ(state.realizedPl, 80.0);
    EXPECT_FALSE(state.marketPrice.has_value());
    EXPECT_FALSE(state.marketValue.has_value());
    EXPECT_FALSE(state.unrealizedPl.has_value());
    EXPECT_FALSE(state.totalPl.has_value());
}

TEST(Summarize, ReplaysByDateThenInsertionOrder) {
    // Listed out of order: the SELL is dated after the BUY.
    const auto byDate = summarize({
        makeTrade("2024-02-01", Side::SELL, 4, 120.0, 0.0, 1),
        makeTrade("2024-01-15", Side::BUY, 10, 100.0, 0.0, 2),
    });
    EXPECT_DOUBLE_EQ(byDate.netQuantity, 6.0);
    EXPECT_DOUBLE_EQ(byDate.realizedPl, 80.0);

    // Same date: lower sequence first, whatever the list order.
    const auto bySequence = summarize({
        makeTrade("2024-01-15", Side::SELL, 4, 120.0, 0.0, 2),
        makeTrade("2024-01-15", Side::BUY, 10, 100.0, 0.0, 1),
    });
    EXPECT_DOUBLE_EQ(bySequence.netQuantity, 6.0);
    EXPECT_DOUBLE_EQ(bySequence.averageCost, 100.0);
    EXPECT_DOUBLE_EQ(bySequence.realizedPl, 80.0);
}

TEST(Summarize, RepeatedCallsAgree) {
    const std::vector<Trade> trades = {
        makeTrade("2024-01-02", Side::BUY, 3, 10.0, 0.25, 1),
        makeTrade("2024-01-05", Side::SELL, 1, 12.0, 0.25, 2),
        makeTrade("2024-01-09", Side::BUY, 2, 9.5, 0.0, 3),
    };

    const auto first = summarize(trades, 11.0);
    for (int i = 0; i < 5; ++i) {
        const auto again = summarize(trades, 11.0);
        EXPECT_EQ(again.netQuantity, first.netQuantity);
        EXPECT_EQ(again.averageCost, first.averageCost);
        EXPECT_EQ(again.realizedPl, first.realizedPl);
        EXPECT_EQ(again.unrealizedPl, first.unrealizedPl);
        EXPECT_EQ(again.totalPl, first.totalPl);
    }
}

TEST(Summarize, EmptyHistoryIsFlat) {
    const auto state = summarize({}, 10.0);
    EXPECT_DOUBLE_EQ(state.netQuantity, 0.0);
    EXPECT_DOUBLE_EQ(state.averageCost, 0.0);
    EXPECT_DOUBLE_EQ(state.realizedPl, 0.0);
    ASSERT_TRUE(state.totalPl.has_value());
    EXPECT_DOUBLE_EQ(*state.totalPl, 0.0);
}
