#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "result.hpp"
#include "stock_info.hpp"
#include "strategy/istrategy.hpp"

/**
 * @brief Per-bar backtest columns, one entry per retained bar.
 *
 * Bars before the strategy's indicators are defined are not retained.
 */
struct BacktestFrame {
    std::vector<int64_t> timestamps;
    std::vector<double>  close;

    // Strategy indicator columns (e.g. FastMA, SlowMA), same length as close.
    std::vector<std::pair<std::string, std::vector<double>>> indicators;

    std::vector<int>    signal;
    std::vector<int>    position;  // signal of the previous bar, 0 on the first
    std::vector<double> marketReturn;
    std::vector<double> strategyReturn;
    std::vector<double> cumulativeMarket;
    std::vector<double> cumulativeStrategy;

    [[nodiscard]] std::size_t size() const { return close.size(); }
    [[nodiscard]] bool        empty() const { return close.empty(); }

    /**
     * @brief Look up an indicator column by name.
     * @return nullptr if the strategy did not provide it.
     */
    [[nodiscard]] const std::vector<double>* indicator(const std::string& name) const;
};

struct BacktestStatistics {
    std::size_t totalTrades       = 0;    // sum of |position change|, round trip = 2
    double      strategyReturnPct = 0.0;  // (final cumulative strategy - 1) * 100
    double      marketReturnPct   = 0.0;  // (final cumulative market - 1) * 100
    double      maxDrawdownPct    = 0.0;  // Maximum drawdown percentage (<= 0)
    double      winRate           = 0.0;  // Winning bars / bars in position (0~1)
    double      sharpeRatio       = 0.0;  // Annualized Sharpe ratio
};

struct BacktestResult {
    std::string ticker;
    std::string strategyName;

    double initialCapital = 0.0;
    double finalCapital   = 0.0;

    BacktestFrame      frame;
    BacktestStatistics statistics;
};

/**
 * @brief Vectorized backtesting engine.
 *
 * Runs a strategy against StockInfo: position on bar t is the signal of
 * bar t-1, so no bar trades on information it has not seen yet.
 * Strategy returns are position * close-to-close market return.
 */
class BacktestEngine {
   public:
    /**
     * @param initialCapital Starting capital, used to report final equity (default: $10,000).
     */
    explicit BacktestEngine(double initialCapital = 10000.0);

    /**
     * @brief Run the backtest.
     * @param strategy The investment strategy to evaluate.
     * @param data     Historical stock data.
     * @return BacktestResult, InvalidParameter for malformed data, or
     *         InsufficientData if no bar has a defined signal.
     */
    [[nodiscard]] Result<BacktestResult> run(IStrategy& strategy, const StockInfo& data) const;

    /**
     * @brief Compute summary statistics from a filled frame.
     */
    [[nodiscard]] static BacktestStatistics computeStatistics(const BacktestFrame& frame);

    /**
     * @brief Worst peak-to-trough decline of a cumulative series, in percent (<= 0).
     */
    [[nodiscard]] static double maxDrawdownPct(const std::vector<double>& cumulative);

    /**
     * @brief mean / sample stddev * sqrt(252). 0 when undefined.
     */
    [[nodiscard]] static double sharpeRatio(const std::vector<double>& returns);

   private:
    double initialCapital_;
};

/**
 * @brief Run the long-only moving average crossover backtest.
 * @param data        Price series (close is required).
 * @param fastWindow  Fast SMA window, must be > 0 and < slowWindow.
 * @param slowWindow  Slow SMA window.
 * @param initialCapital Starting capital for the reported final equity.
 */
[[nodiscard]] Result<BacktestResult> runCrossoverBacktest(const StockInfo& data, std::size_t fastWindow = 20,
                                                          std::size_t slowWindow = 50,
                                                          double      initialCapital = 10000.0);
