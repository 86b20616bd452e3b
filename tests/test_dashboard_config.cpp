#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "dashboard_config.hpp"

namespace fs = std::filesystem;

TEST(ParseConfig, EmptyDocumentKeepsDefaults) {
    const auto config = parseConfig(nlohmann::json::object());
    ASSERT_TRUE(config.ok());

    EXPECT_EQ(config->ticker, "AAPL");
    EXPECT_EQ(config->period, "6mo");
    EXPECT_EQ(config->interval, "1d");
    EXPECT_EQ(config->smaWindow, 20u);
    EXPECT_EQ(config->emaWindow, 50u);
    EXPECT_EQ(config->rsiPeriod, 14u);
    EXPECT_EQ(config->fastWindow, 20u);
    EXPECT_EQ(config->slowWindow, 50u);
    EXPECT_DOUBLE_EQ(config->initialCapital, 10000.0);
    EXPECT_EQ(config->ledgerPath, "data/portfolio.json");
    EXPECT_EQ(config->quoteTimeout.count(), 5000);
    EXPECT_EQ(config->requestTimeout.count(), 10000);
    EXPECT_EQ(config->cacheTtl.count(), 300);
}

TEST(ParseConfig, OverridesPresentKeysOnly) {
    const auto doc = nlohmann::json::parse(R"({
        "ticker": "MSFT",
        "indicators": {"rsi_period": 7},
        "backtest": {"fast_window": 5, "slow_window": 30},
        "market_data": {"quote_timeout_ms": 250}
    })");

    const auto config = parseConfig(doc);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->ticker, "MSFT");
    EXPECT_EQ(config->period, "6mo");
    EXPECT_EQ(config->rsiPeriod, 7u);
    EXPECT_EQ(config->smaWindow, 20u);
    EXPECT_EQ(config->fastWindow, 5u);
    EXPECT_EQ(config->slowWindow, 30u);
    EXPECT_DOUBLE_EQ(config->initialCapital, 10000.0);
    EXPECT_EQ(config->quoteTimeout.count(), 250);
    EXPECT_EQ(config->requestTimeout.count(), 10000);
}

TEST(ParseConfig, WrongTypeIsInvalidParameter) {
    const auto config = parseConfig(nlohmann::json::parse(R"({"backtest": {"fast_window": "twenty"}})"));
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidParameter);
}

TEST(LoadConfig, MissingFileIsNotFound) {
    const auto config = loadConfig((fs::temp_directory_path() / "stockdash_no_such_config.json").string());
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().kind, ErrorKind::NotFound);
}

TEST(LoadConfig, ReadsFileAndRejectsGarbage) {
    const auto path = (fs::temp_directory_path() / "stockdash_config_test.json").string();

    std::ofstream(path) << R"({"ticker": "NVDA", "portfolio": {"ledger_path": "/tmp/ledger.json"}})";
    const auto config = loadConfig(path);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->ticker, "NVDA");
    EXPECT_EQ(config->ledgerPath, "/tmp/ledger.json");

    std::ofstream(path) << "{ticker: NVDA";
    const auto broken = loadConfig(path);
    ASSERT_FALSE(broken.ok());
    EXPECT_EQ(broken.error().kind, ErrorKind::InvalidParameter);

    fs::remove(path);
}
