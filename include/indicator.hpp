#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace indicator {

/**
 * @brief Indicator output aligned 1:1 with its input.
 *        An empty optional marks a point without enough history.
 */
using Series = std::vector<std::optional<double>>;

struct Macd {
    Series line;
    Series signal;
    Series histogram;
};

/**
 * @brief Compute Simple Moving Average (SMA).
 * @param prices  Input price series.
 * @param window  Window size for the moving average.
 * @return        SMA values, same size as prices. The first (window - 1)
 *                points are undefined. Every point is undefined if
 *                window is 0 or larger than prices.size().
 */
[[nodiscard]] inline Series sma(const std::vector<double>& prices, std::size_t window) {
    Series result(prices.size());
    if (window == 0 || prices.size() < window) {
        return result;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        sum += prices[i];
    }
    result[window - 1] = sum / static_cast<double>(window);

    for (std::size_t i = window; i < prices.size(); ++i) {
        sum += prices[i] - prices[i - window];
        result[i] = sum / static_cast<double>(window);
    }

    return result;
}

/**
 * @brief Compute Exponential Moving Average (EMA) over a series that may
 *        contain undefined points.
 * @param values  Input series.
 * @param window  Span; smoothing factor is 2 / (window + 1).
 * @return        EMA values, same size as values. Seeded from the first
 *                defined input and defined wherever the input is defined
 *                from there on. Undefined inputs stay undefined and leave
 *                the recursion untouched.
 */
[[nodiscard]] inline Series ema(const Series& values, std::size_t window) {
    Series result(values.size());
    if (window == 0 || values.size() < window) {
        return result;
    }

    const double alpha = 2.0 / (static_cast<double>(window) + 1.0);

    std::optional<double> prev;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!values[i]) {
            continue;
        }
        prev      = prev ? alpha * *values[i] + (1.0 - alpha) * *prev : *values[i];
        result[i] = prev;
    }

    return result;
}

/**
 * @brief Compute Exponential Moving Average (EMA).
 * @param prices  Input price series.
 * @param window  Span; smoothing factor is 2 / (window + 1).
 * @return        EMA values, same size as prices, defined from the first point.
 */
[[nodiscard]] inline Series ema(const std::vector<double>& prices, std::size_t window) {
    return ema(Series(prices.begin(), prices.end()), window);
}

/**
 * @brief Compute Relative Strength Index (RSI).
 * @param prices  Input price series.
 * @param period  Lookback period (typically 14).
 * @return        RSI values (0~100), same size as prices. The first
 *                'period' points are undefined.
 *
 * Gains and losses are smoothed with Wilder's method (alpha = 1 / period),
 * seeded from the first price change. A zero average loss yields 100.
 */
[[nodiscard]] inline Series rsi(const std::vector<double>& prices, std::size_t period) {
    Series result(prices.size());
    if (period == 0 || prices.size() <= period) {
        return result;
    }

    const double alpha = 1.0 / static_cast<double>(period);

    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain   = change > 0.0 ? change : 0.0;
        const double loss   = change < 0.0 ? -change : 0.0;

        if (i == 1) {
            avgGain = gain;
            avgLoss = loss;
        } else {
            avgGain = alpha * gain + (1.0 - alpha) * avgGain;
            avgLoss = alpha * loss + (1.0 - alpha) * avgLoss;
        }

        if (i < period) {
            continue;
        }

        if (avgLoss <= 0.0) {
            result[i] = 100.0;
        } else {
            const double rs = avgGain / avgLoss;
            result[i]       = 100.0 - (100.0 / (1.0 + rs));
        }
    }

    return result;
}

/**
 * @brief Compute MACD line, signal line and histogram.
 * @param prices  Input price series.
 * @param fast    Fast EMA span (default: 12).
 * @param slow    Slow EMA span (default: 26).
 * @param signal  Signal EMA span over the MACD line (default: 9).
 */
[[nodiscard]] inline Macd macd(const std::vector<double>& prices, std::size_t fast = 12, std::size_t slow = 26,
                               std::size_t signal = 9) {
    const auto fastEma = ema(prices, fast);
    const auto slowEma = ema(prices, slow);

    Macd result;
    result.line.resize(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (fastEma[i] && slowEma[i]) {
            result.line[i] = *fastEma[i] - *slowEma[i];
        }
    }

    result.signal = ema(result.line, signal);

    result.histogram.resize(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (result.line[i] && result.signal[i]) {
            result.histogram[i] = *result.line[i] - *result.signal[i];
        }
    }

    return result;
}

/**
 * @brief Bar-to-bar change as a fraction (0.01 = 1%).
 *        Undefined at index 0 and wherever the previous price is 0.
 */
[[nodiscard]] inline Series pctChange(const std::vector<double>& prices) {
    Series result(prices.size());
    for (std::size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] != 0.0) {
            result[i] = prices[i] / prices[i - 1] - 1.0;
        }
    }
    return result;
}

}  // namespace indicator
