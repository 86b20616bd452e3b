#include <iostream>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "portfolio/trade.hpp"
#include "yfinance.hpp"

void yFinance::init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void yFinance::close() {
    curl_global_cleanup();
}

void yFinance::setTimeout(std::chrono::milliseconds timeout) {
    timeout_ms_ = static_cast<long>(timeout.count());
}

Result<StockInfo> yFinance::getStockInfo(const std::string& ticker, const std::string& interval,
                                         const std::string& range) {
    const auto symbol = normalizeSymbol(ticker);
    if (symbol.empty()) {
        return Result<StockInfo>::fail(ErrorKind::InvalidParameter,
                                       "A ticker symbol is required to download price data.");
    }

    long       status  = 0;
    const auto fetched = fetch(std::string(url_base_) + symbol + "?interval=" + interval + "&range=" + range, status);
    if (!fetched) {
        return Result<StockInfo>::fail(ErrorKind::UpstreamUnavailable,
                                       "Could not download data for " + symbol + ": " + fetched.error().message);
    }

    // Yahoo answers 404 with a chart.error body for unknown tickers
    if (status >= 500 || status == 429) {
        return Result<StockInfo>::fail(ErrorKind::UpstreamUnavailable, "Could not download data for " + symbol
                                                                            + ": HTTP " + std::to_string(status));
    }

    return parseChart(symbol, fetched.value());
}

std::optional<double> yFinance::getLatestPrice(const std::string& ticker) {
    const auto data = getStockInfo(ticker, "1d", "5d");
    if (!data || data->close.empty()) {
        return std::nullopt;
    }
    return data->close.back();
}

Result<StockInfo> yFinance::parseChart(const std::string& ticker, const std::string& body) {
    const auto noData = [&ticker] {
        return Result<StockInfo>::fail(ErrorKind::NotFound,
                                       "Yahoo Finance returned no data for " + ticker
                                           + ". Double check the ticker symbol and interval.");
    };

    StockInfo data;
    data.ticker = ticker;

    try {
        const auto parsed = nlohmann::json::parse(body);
        if (!parsed.contains("chart") || !parsed["chart"].contains("result") || parsed["chart"]["result"].is_null()
            || parsed["chart"]["result"].empty()) {
            return noData();
        }

        const auto& result = parsed["chart"]["result"][0];
        const auto  meta   = result.value("meta", nlohmann::json::object());

        /**
         * @note CURRENCY
         * @example "USD", "KRW", etc.
         */
        if (meta.contains("currency") && !meta["currency"].is_null()) {
            data.currency = meta["currency"].get<std::string>();
        }

        /**
         * @note EXCHANGE-NAME
         * @example "NMS", "NYQ", "KSC", etc.
         */
        if (meta.contains("exchangeName") && !meta["exchangeName"].is_null()) {
            data.exchangeName = meta["exchangeName"].get<std::string>();
        }

        /**
         * @note INSTRUMENT-TYPE
         * @example "EQUITY", "ETF", "INDEX", etc.
         */
        if (meta.contains("instrumentType") && !meta["instrumentType"].is_null()) {
            data.instrumentType = meta["instrumentType"].get<std::string>();
        }

        /**
         * @note REGULAR-MARKET-PRICE
         * @example 264.35 (Double)
         */
        if (meta.contains("regularMarketPrice") && meta["regularMarketPrice"].is_number()) {
            data.regularMarketPrice = meta["regularMarketPrice"].get<double>();
        }

        /**
         * @note TIMEZONE
         * @example "America/New_York"
         */
        if (meta.contains("exchangeTimezoneName") && !meta["exchangeTimezoneName"].is_null()) {
            data.timezone = meta["exchangeTimezoneName"].get<std::string>();
        }

        if (!result.contains("timestamp") || !result.contains("indicators")
            || !result["indicators"].contains("quote") || result["indicators"]["quote"].empty()) {
            return noData();
        }

        /**
         * @note QUOTE
         * @example {
         *  "open":   [264.35, null, ...],
         *  "high":   [265.10, null, ...],
         *  "low":    [262.80, null, ...],
         *  "close":  [264.00, null, ...],
         *  "volume": [52164500, null, ...]
         * }
         */
        const auto& timestamps = result["timestamp"];
        const auto& quote      = result["indicators"]["quote"][0];

        const auto column = [&quote](const char* name, std::size_t i) -> const nlohmann::json* {
            if (!quote.contains(name) || i >= quote[name].size()) {
                return nullptr;
            }
            return &quote[name][i];
        };

        for (std::size_t i = 0; i < timestamps.size(); ++i) {
            const auto* open   = column("open", i);
            const auto* high   = column("high", i);
            const auto* low    = column("low", i);
            const auto* close  = column("close", i);
            const auto* volume = column("volume", i);

            const auto isNumber = [](const nlohmann::json* v) { return v != nullptr && v->is_number(); };
            if (!isNumber(open) || !isNumber(high) || !isNumber(low) || !isNumber(close)) {
                continue;
            }

            const auto timestamp = timestamps[i].get<int64_t>();
            if (!data.timestamps.empty() && timestamp <= data.timestamps.back()) {
                // Yahoo occasionally repeats the live bar; keep the first
                continue;
            }

            data.timestamps.push_back(timestamp);
            data.open.push_back(open->get<double>());
            data.high.push_back(high->get<double>());
            data.low.push_back(low->get<double>());
            data.close.push_back(close->get<double>());
            data.volume.push_back(isNumber(volume) ? volume->get<int64_t>() : 0);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << e.what() << std::endl;
        return Result<StockInfo>::fail(ErrorKind::UpstreamUnavailable,
                                       "Malformed response for " + ticker + ": " + e.what());
    }

    if (data.empty()) {
        return noData();
    }

    return data;
}

Result<std::string> yFinance::fetch(const std::string& url, long& httpStatus) {
    CURL*    curl = nullptr;
    CURLcode res  = CURLE_OK;

    std::string buffer("");

    curl = curl_easy_init();
    if (!curl) {
        return Result<std::string>::fail(ErrorKind::UpstreamUnavailable, "curl_easy_init() failed");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_.load());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT,
                     "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
                     "Chrome/58.0.3029.110 Safari/537.3");

    res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::cerr << "curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
        const std::string reason = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        return Result<std::string>::fail(ErrorKind::UpstreamUnavailable, reason);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);
    curl_easy_cleanup(curl);

    return buffer;
}

std::size_t yFinance::write(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

/* ----- YahooFinanceProvider ----- */

Result<StockInfo> YahooFinanceProvider::fetch(const std::string& symbol, const std::string& period,
                                              const std::string& interval) {
    return yFinance::getStockInfo(symbol, interval, period);
}

std::optional<double> YahooFinanceProvider::latest(const std::string& symbol) {
    return yFinance::getLatestPrice(symbol);
}
