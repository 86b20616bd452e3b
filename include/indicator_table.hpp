#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "indicator.hpp"
#include "stock_info.hpp"

/**
 * @brief Price series joined with the indicators shown on the dashboard.
 *
 * Every column has one entry per bar of the source series.
 */
struct IndicatorTable {
    std::string ticker;

    std::size_t smaWindow = 0;
    std::size_t emaWindow = 0;
    std::size_t rsiPeriod = 0;

    std::vector<int64_t> timestamps;
    std::vector<double>  close;
    std::vector<int64_t> volume;

    indicator::Series sma;
    indicator::Series ema;
    indicator::Series rsi;
    indicator::Series macd;
    indicator::Series macdSignal;
    indicator::Series macdHistogram;
    indicator::Series dailyChangePct;  // percent, 1.0 = 1%

    [[nodiscard]] std::string smaColumn() const { return "SMA_" + std::to_string(smaWindow); }
    [[nodiscard]] std::string emaColumn() const { return "EMA_" + std::to_string(emaWindow); }
};

/**
 * @brief Headline numbers for the latest bar.
 */
struct MarketOverview {
    double                 lastClose     = 0.0;
    double                 previousClose = 0.0;
    double                 changePct     = 0.0;
    std::optional<int64_t> lastVolume;
};

/**
 * @brief Compute SMA, EMA, RSI, MACD(12/26/9) and daily change for a series.
 */
[[nodiscard]] IndicatorTable buildIndicatorTable(const StockInfo& data, std::size_t smaWindow, std::size_t emaWindow,
                                                 std::size_t rsiPeriod);

/**
 * @brief Summarize the last bar against the one before it.
 * @return Empty when the series has no bars.
 */
[[nodiscard]] std::optional<MarketOverview> marketOverview(const StockInfo& data);
