#include "market_data.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <thread>

#include "portfolio/trade.hpp"

CachingPriceDataProvider::CachingPriceDataProvider(std::shared_ptr<IPriceDataProvider> upstream,
                                                   std::chrono::seconds ttl, Clock clock)
    : upstream_(std::move(upstream))
    , ttl_(ttl)
    , clock_(std::move(clock)) {}

Result<StockInfo> CachingPriceDataProvider::fetch(const std::string& symbol, const std::string& period,
                                                  const std::string& interval) {
    const auto key = normalizeSymbol(symbol) + "|" + period + "|" + interval;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = entries_.find(key);
        if (it != entries_.end() && clock_() < it->second.expiresAt) {
            return it->second.data;
        }
    }

    auto fetched = upstream_->fetch(symbol, period, interval);
    if (fetched) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{fetched.value(), clock_() + ttl_};
    }
    return fetched;
}

void CachingPriceDataProvider::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

QuoteWorkers::~QuoteWorkers() {
    join();
}

void QuoteWorkers::spawn(std::function<void()> job) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(mutex_);

    // Reap workers that already finished
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }

    workers_.push_back(Worker{std::thread([job = std::move(job), done] {
                                  job();
                                  done->store(true);
                              }),
                              done});
}

void QuoteWorkers::join() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::size_t QuoteWorkers::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::map<std::string, std::optional<double>> fetchQuotes(const std::shared_ptr<IQuoteProvider>& quotes,
                                                         const std::vector<std::string>& symbols,
                                                         std::chrono::milliseconds timeout, QuoteWorkers& workers) {
    std::map<std::string, std::optional<double>> prices;
    if (!quotes) {
        for (const auto& symbol : symbols) {
            prices[symbol] = std::nullopt;
        }
        return prices;
    }

    using Task = std::packaged_task<std::optional<double>()>;

    std::vector<std::pair<std::string, std::future<std::optional<double>>>> pending;
    pending.reserve(symbols.size());

    for (const auto& symbol : symbols) {
        auto task = std::make_shared<Task>([quotes, symbol] { return quotes->latest(symbol); });
        pending.emplace_back(symbol, task->get_future());
        workers.spawn([task] { (*task)(); });
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (auto& [symbol, future] : pending) {
        if (future.wait_until(deadline) != std::future_status::ready) {
            std::cerr << "Quote lookup for " << symbol << " timed out" << std::endl;
            prices[symbol] = std::nullopt;
            continue;
        }

        try {
            prices[symbol] = future.get();
        } catch (const std::exception& e) {
            std::cerr << "Quote lookup for " << symbol << " failed: " << e.what() << std::endl;
            prices[symbol] = std::nullopt;
        }
    }

    return prices;
}
