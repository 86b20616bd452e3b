#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "market_data.hpp"
#include "result.hpp"
#include "stock_info.hpp"

class yFinance {
   public:
    static void init();
    static void close();

    yFinance()  = delete;
    ~yFinance() = delete;

    yFinance(const yFinance& other) = delete;
    yFinance(yFinance&& other)      = delete;

    yFinance& operator=(const yFinance& other) = delete;
    yFinance& operator=(yFinance&& other) = delete;

    /**
     * @brief Fetch historical stock data.
     * @param ticker Stock ticker (e.g., "AAPL"), normalized before the request
     * @param interval Data interval (e.g., "1d", "1wk", "1mo")
     * @param range Data range (e.g., "1y", "5y", "max")
     * @return StockInfo containing historical time-series, InvalidParameter for
     *         a blank ticker, NotFound when Yahoo has no bars, UpstreamUnavailable
     *         when the request or the response fails.
     */
    [[nodiscard]] static Result<StockInfo> getStockInfo(const std::string& ticker, const std::string& interval = "1d",
                                                        const std::string& range = "6mo");

    /**
     * @brief Latest close from the last 5 daily bars.
     * @return Empty if the ticker is blank or nothing could be fetched.
     */
    [[nodiscard]] static std::optional<double> getLatestPrice(const std::string& ticker);

    /**
     * @brief Parse a Yahoo chart API response body.
     *
     * Bars with a null open/high/low/close are skipped; a null volume reads as 0.
     */
    [[nodiscard]] static Result<StockInfo> parseChart(const std::string& ticker, const std::string& body);

    /**
     * @brief Transfer timeout applied to every request (default: 10s).
     */
    static void setTimeout(std::chrono::milliseconds timeout);

   private:
    static constexpr std::string_view url_base_ = "https://query1.finance.yahoo.com/v8/finance/chart/";

    static inline std::atomic<long> timeout_ms_{10000};

    /**
     * @param url Request URL.
     * @param httpStatus Set to the response code when a response arrives.
     * @return Response body, or UpstreamUnavailable on transport failure.
     */
    [[nodiscard]] static Result<std::string> fetch(const std::string& url, long& httpStatus);

    static std::size_t write(void* contents, std::size_t size, std::size_t nmemb, void* userp);
};

/**
 * @brief Yahoo Finance behind the provider interfaces used by the core.
 *
 * yFinance::init() must have been called before the first request.
 */
class YahooFinanceProvider: public IPriceDataProvider, public IQuoteProvider {
   public:
    [[nodiscard]] Result<StockInfo> fetch(const std::string& symbol, const std::string& period,
                                          const std::string& interval) override;

    [[nodiscard]] std::optional<double> latest(const std::string& symbol) override;
};
