#include "portfolio/trade.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

std::string trim(const std::string& text) {
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end   = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool           leap    = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : kDays[month - 1];
}

}  // namespace

const char* toString(Side side) {
    return side == Side::BUY ? "BUY" : "SELL";
}

std::optional<Side> parseSide(const std::string& side) {
    const auto normalized = upper(trim(side));
    if (normalized == "BUY") {
        return Side::BUY;
    }
    if (normalized == "SELL") {
        return Side::SELL;
    }
    return std::nullopt;
}

std::string normalizeSymbol(const std::string& symbol) {
    return upper(trim(symbol));
}

bool isIsoDate(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < date.size(); ++i) {
        if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(date[i]))) {
            return false;
        }
    }

    const int year  = std::stoi(date.substr(0, 4));
    const int month = std::stoi(date.substr(5, 2));
    const int day   = std::stoi(date.substr(8, 2));

    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

Result<Trade> makeTrade(const TradeRequest& request) {
    const auto fail = [](const std::string& message) {
        return Result<Trade>::fail(ErrorKind::InvalidParameter, message);
    };

    Trade trade;

    trade.symbol = normalizeSymbol(request.symbol);
    if (trade.symbol.empty()) {
        return fail("A ticker symbol is required.");
    }

    const auto side = parseSide(request.side);
    if (!side) {
        return fail("Trade side must be either 'BUY' or 'SELL'.");
    }
    trade.side = *side;

    if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
        return fail("Quantity must be positive.");
    }
    if (!std::isfinite(request.price) || request.price <= 0.0) {
        return fail("Price must be positive.");
    }
    if (!std::isfinite(request.fees) || request.fees < 0.0) {
        return fail("Fees cannot be negative.");
    }

    trade.tradeDate = trim(request.tradeDate);
    if (!isIsoDate(trade.tradeDate)) {
        return fail("Trade date must be a valid YYYY-MM-DD date.");
    }

    trade.quantity = request.quantity;
    trade.price    = request.price;
    trade.fees     = request.fees;

    return trade;
}

void sortLedger(std::vector<Trade>& trades) {
    std::stable_sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        if (a.tradeDate != b.tradeDate) {
            return a.tradeDate < b.tradeDate;
        }
        return a.sequence < b.sequence;
    });
}
