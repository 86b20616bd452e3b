#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

/**
 * @brief Price series for one symbol, stored as parallel OHLCV columns.
 *
 * Bar i is (timestamps[i], open[i], high[i], low[i], close[i], volume[i]).
 * Timestamps are strictly increasing.
 */
struct StockInfo {
    /**
     * @brief
     * @example "AAPL", "GOOGL", etc.
     */
    std::string ticker = "";

    /**
     * @brief
     * @example "USD", "KRW", etc.
     */
    std::string currency = "";

    /**
     * @brief
     * @example "NMS", "NYQ", etc.
     */
    std::string exchangeName = "";

    /**
     * @brief
     * @example "EQUITY", "ETF", etc.
     */
    std::string instrumentType = "";

    /**
     * @brief
     * @example "America/New_York", "Asia/Seoul", etc.
     */
    std::string timezone = "";

    /**
     * @brief
     * @example 264.35
     */
    double regularMarketPrice = 0.0;

    /* HISTORICAL DATA */

    /**
     * @brief Unix seconds.
     * @example [1705641600, 1705728000, ...]
     */
    std::vector<int64_t> timestamps;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> open;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> high;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> low;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> close;

    /**
     * @brief
     * @example [52164500, 48201000, ...]
     */
    std::vector<int64_t> volume;

    [[nodiscard]] std::size_t size() const { return timestamps.size(); }
    [[nodiscard]] bool        empty() const { return timestamps.empty(); }
};

/**
 * @brief Check the column layout and ordering of a price series.
 *
 * open/high/low/volume may be empty (close-only series), otherwise every
 * column must match the timestamp count. Timestamps must be strictly increasing.
 */
[[nodiscard]] inline Result<void> validateSeries(const StockInfo& data) {
    const auto n = data.timestamps.size();

    if (data.close.size() != n) {
        return Result<void>::fail(ErrorKind::InvalidParameter, "price data must contain a close price for every bar");
    }

    const auto aligned = [n](std::size_t columnSize) { return columnSize == 0 || columnSize == n; };
    if (!aligned(data.open.size()) || !aligned(data.high.size()) || !aligned(data.low.size())
        || !aligned(data.volume.size())) {
        return Result<void>::fail(ErrorKind::InvalidParameter, "price columns are not aligned with timestamps");
    }

    for (std::size_t i = 1; i < n; ++i) {
        if (data.timestamps[i] <= data.timestamps[i - 1]) {
            return Result<void>::fail(ErrorKind::InvalidParameter, "timestamps must be strictly increasing");
        }
    }

    return {};
}
