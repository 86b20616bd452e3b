#include "backtest/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>

#include "sma_crossover.hpp"

const std::vector<double>* BacktestFrame::indicator(const std::string& name) const {
    const auto it = std::find_if(indicators.begin(), indicators.end(),
                                 [&name](const auto& column) { return column.first == name; });
    return it == indicators.end() ? nullptr : &it->second;
}

BacktestEngine::BacktestEngine(double initialCapital)
    : initialCapital_(initialCapital) {}

Result<BacktestResult> BacktestEngine::run(IStrategy& strategy, const StockInfo& data) const {
    if (const auto valid = validateSeries(data); !valid) {
        return valid.error();
    }

    // Initialize strategy (precompute indicators)
    strategy.init(data);
    const auto columns = strategy.columns();

    const auto n = data.close.size();

    // Drop leading bars until every indicator column is defined
    std::size_t first = strategy.warmupPeriod();
    while (first < n && std::any_of(columns.begin(), columns.end(), [first](const StrategyColumn& column) {
               return first >= column.values.size() || !column.values[first];
           })) {
        ++first;
    }

    if (first >= n) {
        return Result<BacktestResult>::fail(ErrorKind::InsufficientData,
                                            "Not enough data to compute the moving averages.");
    }

    BacktestResult result;
    result.ticker         = data.ticker;
    result.strategyName   = strategy.name();
    result.initialCapital = initialCapital_;

    auto&      frame = result.frame;
    const auto rows  = n - first;

    frame.timestamps.assign(data.timestamps.begin() + static_cast<long>(first), data.timestamps.end());
    frame.close.assign(data.close.begin() + static_cast<long>(first), data.close.end());

    for (const auto& column : columns) {
        std::vector<double> values;
        values.reserve(rows);
        for (std::size_t i = first; i < n; ++i) {
            values.push_back(column.values[i].value_or(0.0));
        }
        frame.indicators.emplace_back(column.name, std::move(values));
    }

    frame.signal.reserve(rows);
    frame.position.reserve(rows);
    frame.marketReturn.reserve(rows);
    frame.strategyReturn.reserve(rows);
    frame.cumulativeMarket.reserve(rows);
    frame.cumulativeStrategy.reserve(rows);

    double cumMarket   = 1.0;
    double cumStrategy = 1.0;

    for (std::size_t t = 0; t < rows; ++t) {
        const auto index = first + t;

        frame.signal.push_back(static_cast<int>(strategy.evaluate(data, index)));

        // One-bar lag: trade on yesterday's signal
        const int position = (t == 0) ? 0 : frame.signal[t - 1];
        frame.position.push_back(position);

        const double prevClose    = (t == 0) ? 0.0 : frame.close[t - 1];
        const double marketReturn = (t == 0 || prevClose == 0.0) ? 0.0 : frame.close[t] / prevClose - 1.0;
        const double stratReturn  = static_cast<double>(position) * marketReturn;
        frame.marketReturn.push_back(marketReturn);
        frame.strategyReturn.push_back(stratReturn);

        cumMarket *= (1.0 + marketReturn);
        cumStrategy *= (1.0 + stratReturn);
        frame.cumulativeMarket.push_back(cumMarket);
        frame.cumulativeStrategy.push_back(cumStrategy);
    }

    result.statistics   = computeStatistics(frame);
    result.finalCapital = initialCapital_ * frame.cumulativeStrategy.back();

    return result;
}

BacktestStatistics BacktestEngine::computeStatistics(const BacktestFrame& frame) {
    BacktestStatistics stats;
    if (frame.empty()) {
        return stats;
    }

    // 1. Trades: every change of position counts once
    for (std::size_t t = 1; t < frame.position.size(); ++t) {
        stats.totalTrades += static_cast<std::size_t>(std::abs(frame.position[t] - frame.position[t - 1]));
    }

    // 2. Returns
    stats.strategyReturnPct = (frame.cumulativeStrategy.back() - 1.0) * 100.0;
    stats.marketReturnPct   = (frame.cumulativeMarket.back() - 1.0) * 100.0;

    // 3. Max Drawdown
    stats.maxDrawdownPct = maxDrawdownPct(frame.cumulativeStrategy);

    // 4. Win Rate over bars spent in the market
    std::size_t active = 0;
    std::size_t wins   = 0;
    for (std::size_t t = 0; t < frame.position.size(); ++t) {
        if (frame.position[t] == 0) {
            continue;
        }
        ++active;
        if (frame.strategyReturn[t] > 0.0) {
            ++wins;
        }
    }
    if (active > 0) {
        stats.winRate = static_cast<double>(wins) / static_cast<double>(active);
    }

    // 5. Sharpe Ratio (annualized, assuming daily data, risk-free = 0)
    stats.sharpeRatio = sharpeRatio(frame.strategyReturn);

    return stats;
}

double BacktestEngine::maxDrawdownPct(const std::vector<double>& cumulative) {
    if (cumulative.empty()) {
        return 0.0;
    }

    double peak  = cumulative[0];
    double maxDD = 0.0;
    for (const auto& value : cumulative) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            maxDD = std::min(maxDD, (value / peak - 1.0) * 100.0);
        }
    }
    return maxDD;
}

double BacktestEngine::sharpeRatio(const std::vector<double>& returns) {
    if (returns.size() < 2) {
        return 0.0;
    }

    const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());

    double variance = 0.0;
    for (const auto& r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= static_cast<double>(returns.size() - 1);

    const double stdDev = std::sqrt(variance);
    if (!(stdDev > 1e-12)) {
        return 0.0;
    }

    // Annualize: multiply by sqrt(252 trading days)
    return (mean / stdDev) * std::sqrt(252.0);
}

Result<BacktestResult> runCrossoverBacktest(const StockInfo& data, std::size_t fastWindow, std::size_t slowWindow,
                                            double initialCapital) {
    if (fastWindow == 0) {
        return Result<BacktestResult>::fail(ErrorKind::InvalidParameter, "fast_window must be positive");
    }
    if (fastWindow >= slowWindow) {
        return Result<BacktestResult>::fail(ErrorKind::InvalidParameter,
                                            "fast_window should be smaller than slow_window");
    }

    SmaCrossover   strategy(fastWindow, slowWindow);
    BacktestEngine engine(initialCapital);
    return engine.run(strategy, data);
}
