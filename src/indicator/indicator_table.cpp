#include "indicator_table.hpp"

IndicatorTable buildIndicatorTable(const StockInfo& data, std::size_t smaWindow, std::size_t emaWindow,
                                   std::size_t rsiPeriod) {
    IndicatorTable table;
    table.ticker     = data.ticker;
    table.smaWindow  = smaWindow;
    table.emaWindow  = emaWindow;
    table.rsiPeriod  = rsiPeriod;
    table.timestamps = data.timestamps;
    table.close      = data.close;
    table.volume     = data.volume;

    table.sma = indicator::sma(data.close, smaWindow);
    table.ema = indicator::ema(data.close, emaWindow);
    table.rsi = indicator::rsi(data.close, rsiPeriod);

    auto macd           = indicator::macd(data.close);
    table.macd          = std::move(macd.line);
    table.macdSignal    = std::move(macd.signal);
    table.macdHistogram = std::move(macd.histogram);

    table.dailyChangePct = indicator::pctChange(data.close);
    for (auto& change : table.dailyChangePct) {
        if (change) {
            *change *= 100.0;
        }
    }

    return table;
}

std::optional<MarketOverview> marketOverview(const StockInfo& data) {
    if (data.close.empty()) {
        return std::nullopt;
    }

    MarketOverview overview;
    overview.lastClose     = data.close.back();
    overview.previousClose = data.close.size() > 1 ? data.close[data.close.size() - 2] : overview.lastClose;
    overview.changePct     = overview.previousClose != 0.0
                               ? (overview.lastClose - overview.previousClose) / overview.previousClose * 100.0
                               : 0.0;

    if (!data.volume.empty()) {
        overview.lastVolume = data.volume.back();
    }

    return overview;
}
