#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>

namespace bourse {

struct EngineConfig {
    std::string quote_currency = "RUB";
    // Per-unit price assumed when pre-checking an unpriced MARKET BUY
    int64_t market_buy_reference_price = 1;
    std::string default_instruments = "RUB,USD";

    std::vector<std::string> instrument_list() const;
};

struct LedgerConfig {
    uint32_t max_attempts = 3;
    uint32_t backoff_min_ms = 10;
    uint32_t backoff_max_ms = 100;
};

struct BookConfig {
    uint32_t default_depth = 10;
    uint32_t max_depth = 25;
    uint32_t default_trade_limit = 10;
    uint32_t max_trade_limit = 100;
};

struct LoggingConfig {
    std::string level = "INFO";
    uint32_t rate_limit_ms = 0;
    bool enable_structured = false;
};

struct Config {
    EngineConfig engine;
    LedgerConfig ledger;
    BookConfig book;
    LoggingConfig logging;

    static std::unique_ptr<Config> defaults();
    static std::unique_ptr<Config> load_from_file(const std::string& path);
    static std::unique_ptr<Config> load_from_string(const std::string& content);
};

} // namespace bourse
