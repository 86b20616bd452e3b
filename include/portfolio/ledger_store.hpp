#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "portfolio/trade.hpp"
#include "result.hpp"

/**
 * @brief Ordered trade ledger. Append-only apart from a full clear.
 */
struct ILedgerStore {
    virtual ~ILedgerStore() = default;

    /**
     * @brief Store a validated trade and assign its sequence number.
     * @return The stored trade.
     */
    [[nodiscard]] virtual Result<Trade> append(const Trade& trade) = 0;

    /**
     * @brief All trades ordered by tradeDate, ties by insertion order.
     */
    [[nodiscard]] virtual Result<std::vector<Trade>> listAll() const = 0;

    /**
     * @brief Remove every trade.
     */
    [[nodiscard]] virtual Result<void> clear() = 0;
};

class InMemoryLedgerStore: public ILedgerStore {
   public:
    [[nodiscard]] Result<Trade>              append(const Trade& trade) override;
    [[nodiscard]] Result<std::vector<Trade>> listAll() const override;
    [[nodiscard]] Result<void>               clear() override;

   private:
    mutable std::mutex mutex_;
    std::vector<Trade> trades_;
    std::uint64_t      nextSequence_ = 1;
};

/**
 * @brief Ledger persisted as a JSON document.
 *
 * The whole file is rewritten (temp file + rename) on every change, so a
 * reader never sees a partial ledger. Writers within one process are
 * serialized; separate processes must not write the same file concurrently.
 *
 * @example
 * {
 *   "next_sequence": 3,
 *   "trades": [
 *     {"sequence": 1, "symbol": "AAPL", "trade_date": "2024-03-15",
 *      "quantity": 10.0, "price": 172.5, "side": "BUY", "fees": 1.0},
 *     ...
 *   ]
 * }
 */
class JsonLedgerStore: public ILedgerStore {
   public:
    explicit JsonLedgerStore(std::string path);

    [[nodiscard]] Result<Trade>              append(const Trade& trade) override;
    [[nodiscard]] Result<std::vector<Trade>> listAll() const override;
    [[nodiscard]] Result<void>               clear() override;

    [[nodiscard]] const std::string& path() const { return path_; }

   private:
    struct Document {
        std::uint64_t      nextSequence = 1;
        std::vector<Trade> trades;
    };

    std::string        path_;
    mutable std::mutex mutex_;

    [[nodiscard]] Result<Document> load() const;
    [[nodiscard]] Result<void>     save(const Document& doc) const;
};
