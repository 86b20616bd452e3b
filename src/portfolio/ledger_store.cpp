#include "portfolio/ledger_store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace {

nlohmann::json toJson(const Trade& trade) {
    return {
        {"sequence", trade.sequence},
        {"symbol", trade.symbol},
        {"trade_date", trade.tradeDate},
        {"quantity", trade.quantity},
        {"price", trade.price},
        {"side", toString(trade.side)},
        {"fees", trade.fees},
    };
}

/**
 * @note Stored trades are re-validated so a hand-edited file cannot inject
 *       a negative quantity or an unknown side.
 */
Result<Trade> fromJson(const nlohmann::json& entry) {
    TradeRequest request;
    request.symbol    = entry.at("symbol").get<std::string>();
    request.tradeDate = entry.at("trade_date").get<std::string>();
    request.quantity  = entry.at("quantity").get<double>();
    request.price     = entry.at("price").get<double>();
    request.side      = entry.at("side").get<std::string>();
    request.fees      = entry.value("fees", 0.0);

    auto trade = makeTrade(request);
    if (!trade) {
        return trade;
    }
    trade.value().sequence = entry.at("sequence").get<std::uint64_t>();
    return trade;
}

}  // namespace

/* ----- InMemoryLedgerStore ----- */

Result<Trade> InMemoryLedgerStore::append(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);

    Trade stored    = trade;
    stored.sequence = nextSequence_++;
    trades_.push_back(stored);
    return stored;
}

Result<std::vector<Trade>> InMemoryLedgerStore::listAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto trades = trades_;
    sortLedger(trades);
    return trades;
}

Result<void> InMemoryLedgerStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    trades_.clear();
    return {};
}

/* ----- JsonLedgerStore ----- */

JsonLedgerStore::JsonLedgerStore(std::string path)
    : path_(std::move(path)) {}

Result<JsonLedgerStore::Document> JsonLedgerStore::load() const {
    Document doc;

    std::ifstream f(path_);
    if (!f.is_open()) {
        // No file yet: empty ledger
        return doc;
    }

    try {
        nlohmann::json parsed;
        f >> parsed;

        doc.nextSequence = parsed.value("next_sequence", static_cast<std::uint64_t>(1));
        if (parsed.contains("trades")) {
            for (const auto& entry : parsed["trades"]) {
                auto trade = fromJson(entry);
                if (!trade) {
                    return Result<Document>::fail(ErrorKind::InvalidParameter,
                                                  "Corrupt ledger entry in " + path_ + ": " + trade.error().message);
                }
                doc.nextSequence = std::max(doc.nextSequence, trade->sequence + 1);
                doc.trades.push_back(std::move(trade).value());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Failed to read ledger " << path_ << ": " << e.what() << std::endl;
        return Result<Document>::fail(ErrorKind::UpstreamUnavailable, "Cannot read ledger file: " + path_);
    }

    return doc;
}

Result<void> JsonLedgerStore::save(const Document& doc) const {
    nlohmann::json out;
    out["next_sequence"] = doc.nextSequence;
    out["trades"]        = nlohmann::json::array();
    for (const auto& trade : doc.trades) {
        out["trades"].push_back(toJson(trade));
    }

    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Error: Cannot create " << parent << ": " << ec.message() << std::endl;
            return Result<void>::fail(ErrorKind::UpstreamUnavailable, "Cannot write ledger file: " + path_);
        }
    }

    const auto tmpPath = path_ + ".tmp";
    {
        std::ofstream f(tmpPath, std::ios::trunc);
        if (!f.is_open()) {
            std::cerr << "Error: Cannot open ledger for writing: " << tmpPath << std::endl;
            return Result<void>::fail(ErrorKind::UpstreamUnavailable, "Cannot write ledger file: " + path_);
        }
        f << out.dump(2) << std::endl;
        if (!f) {
            return Result<void>::fail(ErrorKind::UpstreamUnavailable, "Cannot write ledger file: " + path_);
        }
    }

    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        std::cerr << "Error: Cannot replace ledger file: " << path_ << std::endl;
        std::remove(tmpPath.c_str());
        return Result<void>::fail(ErrorKind::UpstreamUnavailable, "Cannot write ledger file: " + path_);
    }

    return {};
}

Result<Trade> JsonLedgerStore::append(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    if (!doc) {
        return doc.error();
    }

    Trade stored    = trade;
    stored.sequence = doc->nextSequence;

    auto updated = std::move(doc).value();
    updated.trades.push_back(stored);
    updated.nextSequence = stored.sequence + 1;

    if (const auto saved = save(updated); !saved) {
        return saved.error();
    }
    return stored;
}

Result<std::vector<Trade>> JsonLedgerStore::listAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    if (!doc) {
        return doc.error();
    }

    auto trades = std::move(doc).value().trades;
    sortLedger(trades);
    return trades;
}

Result<void> JsonLedgerStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    if (!doc) {
        return doc.error();
    }

    // Sequence numbers keep increasing across clears
    auto cleared = std::move(doc).value();
    cleared.trades.clear();
    return save(cleared);
}
