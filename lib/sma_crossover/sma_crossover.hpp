#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "indicator.hpp"
#include "strategy/istrategy.hpp"

/**
 * @brief SMA Crossover strategy.
 *
 * Long while the short SMA is strictly above the long SMA, flat otherwise
 * (a tie is flat).
 */
class SmaCrossover: public IStrategy {
   public:
    /**
     * @param shortWindow Short-term SMA window (default: 20 days).
     * @param longWindow  Long-term SMA window (default: 50 days).
     */
    explicit SmaCrossover(std::size_t shortWindow = 20, std::size_t longWindow = 50);

    [[nodiscard]] std::string name() const override;

    void init(const StockInfo& data) override;

    [[nodiscard]] std::size_t warmupPeriod() const override;

    [[nodiscard]] Signal evaluate(const StockInfo& data, std::size_t index) const override;

    [[nodiscard]] std::vector<StrategyColumn> columns() const override;

    static constexpr const char* kFastColumn = "FastMA";
    static constexpr const char* kSlowColumn = "SlowMA";

   private:
    std::size_t shortWindow_;
    std::size_t longWindow_;

    // Cached SMA values aligned to data indices.
    indicator::Series shortSma_;
    indicator::Series longSma_;
};
