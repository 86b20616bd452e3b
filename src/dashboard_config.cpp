#include "dashboard_config.hpp"

#include <fstream>
#include <iostream>

#include <unistd.h>

Result<DashboardConfig> parseConfig(const nlohmann::json& doc) {
    DashboardConfig config;

    try {
        config.ticker   = doc.value("ticker", config.ticker);
        config.period   = doc.value("period", config.period);
        config.interval = doc.value("interval", config.interval);

        config.smaWindow = doc.value("/indicators/sma_window"_json_pointer, config.smaWindow);
        config.emaWindow = doc.value("/indicators/ema_window"_json_pointer, config.emaWindow);
        config.rsiPeriod = doc.value("/indicators/rsi_period"_json_pointer, config.rsiPeriod);

        config.fastWindow     = doc.value("/backtest/fast_window"_json_pointer, config.fastWindow);
        config.slowWindow     = doc.value("/backtest/slow_window"_json_pointer, config.slowWindow);
        config.initialCapital = doc.value("/backtest/initial_capital"_json_pointer, config.initialCapital);

        config.ledgerPath = doc.value("/portfolio/ledger_path"_json_pointer, config.ledgerPath);

        config.quoteTimeout = std::chrono::milliseconds(
            doc.value("/market_data/quote_timeout_ms"_json_pointer, static_cast<long>(config.quoteTimeout.count())));
        config.requestTimeout = std::chrono::milliseconds(doc.value(
            "/market_data/request_timeout_ms"_json_pointer, static_cast<long>(config.requestTimeout.count())));
        config.cacheTtl = std::chrono::seconds(
            doc.value("/market_data/cache_ttl_s"_json_pointer, static_cast<long>(config.cacheTtl.count())));
    } catch (const nlohmann::json::exception& e) {
        return Result<DashboardConfig>::fail(ErrorKind::InvalidParameter, std::string("Invalid config: ") + e.what());
    }

    return config;
}

Result<DashboardConfig> loadConfig(const std::string& path) {
    nlohmann::json doc;
    {
        std::ifstream f(path);
        if (!f.is_open()) {
            return Result<DashboardConfig>::fail(ErrorKind::NotFound, "Cannot open config: " + path);
        }

        try {
            f >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << e.what() << std::endl;
            return Result<DashboardConfig>::fail(ErrorKind::InvalidParameter, "Cannot parse config: " + path);
        }
    }

    return parseConfig(doc);
}

std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return relativePath;  // fallback
    }
    buf[len] = '\0';
    std::string exePath(buf);

    // Walk up from exe dir to project root (exe is in build/<type>/app/)
    for (int i = 0; i < 4; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos) {
            return relativePath;
        }
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}
