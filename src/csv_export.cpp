#include "csv_export.hpp"

#include <ctime>
#include <optional>

namespace csv {

namespace {

constexpr int kPrecision = 10;

void cell(std::ostream& os, const std::optional<double>& value) {
    os << ',';
    if (value) {
        os << *value;
    }
}

void cell(std::ostream& os, double value) {
    os << ',' << value;
}

}  // namespace

std::string formatDate(int64_t timestamp) {
    const std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm           tm{};
    if (gmtime_r(&t, &tm) == nullptr) {
        return "";
    }

    // Years past 9999 do not fit; leave the cell empty
    char buf[11];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm) == 0) {
        return "";
    }
    return buf;
}

void writeIndicators(std::ostream& os, const IndicatorTable& table) {
    const auto precision = os.precision(kPrecision);

    os << "Date,Close,Volume," << table.smaColumn() << ',' << table.emaColumn()
       << ",RSI,MACD,MACD_Signal,MACD_Hist,Daily Change %\n";

    for (std::size_t i = 0; i < table.timestamps.size(); ++i) {
        os << formatDate(table.timestamps[i]);
        cell(os, table.close[i]);
        os << ',';
        if (i < table.volume.size()) {
            os << table.volume[i];
        }
        cell(os, table.sma[i]);
        cell(os, table.ema[i]);
        cell(os, table.rsi[i]);
        cell(os, table.macd[i]);
        cell(os, table.macdSignal[i]);
        cell(os, table.macdHistogram[i]);
        cell(os, table.dailyChangePct[i]);
        os << '\n';
    }

    os.precision(precision);
}

void writeBacktest(std::ostream& os, const BacktestFrame& frame) {
    const auto precision = os.precision(kPrecision);

    os << "Date,Close";
    for (const auto& [name, values] : frame.indicators) {
        os << ',' << name;
    }
    os << ",Signal,Position,Market Return,Strategy Return,Cumulative Market,Cumulative Strategy\n";

    for (std::size_t t = 0; t < frame.size(); ++t) {
        os << formatDate(frame.timestamps[t]);
        cell(os, frame.close[t]);
        for (const auto& [name, values] : frame.indicators) {
            cell(os, values[t]);
        }
        os << ',' << frame.signal[t] << ',' << frame.position[t];
        cell(os, frame.marketReturn[t]);
        cell(os, frame.strategyReturn[t]);
        cell(os, frame.cumulativeMarket[t]);
        cell(os, frame.cumulativeStrategy[t]);
        os << '\n';
    }

    os.precision(precision);
}

void writeTrades(std::ostream& os, const std::vector<Trade>& trades) {
    const auto precision = os.precision(kPrecision);

    os << "symbol,trade_date,quantity,price,side,fees\n";
    for (const auto& trade : trades) {
        os << trade.symbol << ',' << trade.tradeDate;
        cell(os, trade.quantity);
        cell(os, trade.price);
        os << ',' << toString(trade.side);
        cell(os, trade.fees);
        os << '\n';
    }

    os.precision(precision);
}

void writePortfolio(std::ostream& os, const std::vector<PortfolioRow>& rows) {
    const auto precision = os.precision(kPrecision);

    os << "symbol,net_quantity,average_cost,market_price,market_value,realized_pl,unrealized_pl,total_pl\n";
    for (const auto& row : rows) {
        const auto& p = row.position;
        os << row.symbol;
        cell(os, p.netQuantity);
        cell(os, p.averageCost);
        cell(os, p.marketPrice);
        cell(os, p.marketValue);
        cell(os, p.realizedPl);
        cell(os, p.unrealizedPl);
        cell(os, p.totalPl);
        os << '\n';
    }

    os.precision(precision);
}

}  // namespace csv
