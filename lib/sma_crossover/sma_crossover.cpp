#include "sma_crossover.hpp"

#include <algorithm>

SmaCrossover::SmaCrossover(std::size_t shortWindow, std::size_t longWindow)
    : shortWindow_(shortWindow)
    , longWindow_(longWindow) {}

std::string SmaCrossover::name() const {
    return "SMA Crossover (" + std::to_string(shortWindow_) + "/" + std::to_string(longWindow_) + ")";
}

void SmaCrossover::init(const StockInfo& data) {
    shortSma_ = indicator::sma(data.close, shortWindow_);
    longSma_  = indicator::sma(data.close, longWindow_);
}

std::size_t SmaCrossover::warmupPeriod() const {
    // Both SMAs are defined from index (max window - 1) onward.
    const auto widest = std::max(shortWindow_, longWindow_);
    return widest == 0 ? 0 : widest - 1;
}

Signal SmaCrossover::evaluate(const StockInfo& /* data */, std::size_t index) const {
    if (index >= shortSma_.size() || index >= longSma_.size()) {
        return Signal::FLAT;
    }

    const auto& fast = shortSma_[index];
    const auto& slow = longSma_[index];
    if (!fast || !slow) {
        return Signal::FLAT;
    }

    return *fast > *slow ? Signal::LONG : Signal::FLAT;
}

std::vector<StrategyColumn> SmaCrossover::columns() const {
    return {
        {kFastColumn, shortSma_},
        {kSlowColumn, longSma_},
    };
}
