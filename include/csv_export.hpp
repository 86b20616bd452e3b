#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "backtest/backtest_engine.hpp"
#include "indicator_table.hpp"
#include "portfolio/portfolio_manager.hpp"
#include "portfolio/trade.hpp"

/**
 * @brief CSV writers for the tables the programs display.
 *
 * First column is the date (UTC, YYYY-MM-DD). Undefined values are written
 * as empty cells.
 */
namespace csv {

/**
 * @brief Format a Unix timestamp as YYYY-MM-DD (UTC).
 * @return Empty if the date cannot be written in that form.
 */
[[nodiscard]] std::string formatDate(int64_t timestamp);

void writeIndicators(std::ostream& os, const IndicatorTable& table);

void writeBacktest(std::ostream& os, const BacktestFrame& frame);

void writeTrades(std::ostream& os, const std::vector<Trade>& trades);

void writePortfolio(std::ostream& os, const std::vector<PortfolioRow>& rows);

}  // namespace csv
