#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "indicator.hpp"
#include "stock_info.hpp"

/**
 * @brief Desired exposure for a bar. The numeric value is the position size.
 */
enum class Signal
{
    FLAT = 0,
    LONG = 1,
};

/**
 * @brief Named indicator column a strategy exposes for reporting.
 */
struct StrategyColumn {
    std::string       name;
    indicator::Series values;  // aligned with the input series
};

/**
 * @brief Abstract interface for investment strategies.
 *
 * A strategy turns bar i of a price series into a target exposure.
 * Bars before warmupPeriod() have no defined signal and are dropped by
 * the backtest engine.
 */
struct IStrategy {
    virtual ~IStrategy() = default;

    /**
     * @brief Strategy display name.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Initialize strategy with stock data (e.g., precompute indicators).
     * @param data Historical stock data.
     */
    virtual void init(const StockInfo& data) = 0;

    /**
     * @brief Number of leading bars for which the strategy cannot produce
     *        a signal (insufficient indicator history).
     */
    [[nodiscard]] virtual std::size_t warmupPeriod() const = 0;

    /**
     * @brief Evaluate the strategy at a given time index.
     * @param data  Historical stock data.
     * @param index Current time step index (0-based), >= warmupPeriod().
     * @return Signal computed from data up to and including index.
     */
    [[nodiscard]] virtual Signal evaluate(const StockInfo& data, std::size_t index) const = 0;

    /**
     * @brief Indicator columns computed by init(), for the backtest frame.
     */
    [[nodiscard]] virtual std::vector<StrategyColumn> columns() const = 0;
};
