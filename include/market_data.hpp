#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "result.hpp"
#include "stock_info.hpp"

/**
 * @brief Source of historical OHLCV bars.
 */
struct IPriceDataProvider {
    virtual ~IPriceDataProvider() = default;

    /**
     * @param symbol   Ticker (e.g., "AAPL")
     * @param period   Look-back range (e.g., "1mo", "6mo", "1y")
     * @param interval Bar size (e.g., "1d", "1h")
     * @return Series, NotFound when no bars exist, UpstreamUnavailable when
     *         the source cannot be reached.
     */
    [[nodiscard]] virtual Result<StockInfo> fetch(const std::string& symbol, const std::string& period,
                                                  const std::string& interval) = 0;
};

/**
 * @brief Source of the latest traded price of a symbol.
 */
struct IQuoteProvider {
    virtual ~IQuoteProvider() = default;

    /**
     * @return Latest price, or empty if it cannot be determined.
     */
    [[nodiscard]] virtual std::optional<double> latest(const std::string& symbol) = 0;
};

/**
 * @brief Keeps successful fetches for a fixed time-to-live.
 *        Failures are not cached.
 */
class CachingPriceDataProvider: public IPriceDataProvider {
   public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CachingPriceDataProvider(std::shared_ptr<IPriceDataProvider> upstream,
                                      std::chrono::seconds ttl   = std::chrono::seconds(300),
                                      Clock                clock = [] { return std::chrono::steady_clock::now(); });

    [[nodiscard]] Result<StockInfo> fetch(const std::string& symbol, const std::string& period,
                                          const std::string& interval) override;

    /**
     * @brief Drop every cached entry.
     */
    void invalidate();

   private:
    struct Entry {
        StockInfo                             data;
        std::chrono::steady_clock::time_point expiresAt;
    };

    std::shared_ptr<IPriceDataProvider> upstream_;
    std::chrono::seconds                ttl_;
    Clock                               clock_;

    std::mutex                   mutex_;
    std::map<std::string, Entry> entries_;
};

/**
 * @brief Owner of the quote lookup threads.
 *
 * A lookup that misses its deadline keeps running here instead of being
 * detached. The destructor joins every worker, so an owner destroyed before
 * yFinance::close() guarantees no worker is still inside libcurl.
 */
class QuoteWorkers {
   public:
    QuoteWorkers() = default;
    ~QuoteWorkers();

    QuoteWorkers(const QuoteWorkers& other) = delete;
    QuoteWorkers& operator=(const QuoteWorkers& other) = delete;

    /**
     * @brief Start a worker. Finished workers are joined first.
     */
    void spawn(std::function<void()> job);

    /**
     * @brief Block until every worker has finished.
     */
    void join();

    /**
     * @brief Workers started and not yet joined.
     */
    [[nodiscard]] std::size_t size() const;

   private:
    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex  mutex_;
    std::vector<Worker> workers_;
};

/**
 * @brief Look up quotes for several symbols concurrently.
 *
 * One worker per symbol, owned by `workers`. Each result is awaited until a
 * shared deadline; a late, failed or throwing lookup yields an empty price
 * for that symbol only. A late worker finishes in the background and is
 * joined by `workers`.
 *
 * @return One entry per requested symbol.
 */
[[nodiscard]] std::map<std::string, std::optional<double>>
fetchQuotes(const std::shared_ptr<IQuoteProvider>& quotes, const std::vector<std::string>& symbols,
            std::chrono::milliseconds timeout, QuoteWorkers& workers);
