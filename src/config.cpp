#include "bourse/config.hpp"
#include "bourse/logger.hpp"
#include "bourse/security_utils.hpp"
#include "bourse/input_validation.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bourse {

// Flat JSON extractor for config (minimal implementation).
// Keys are unique across sections, so lookups ignore nesting.
class JsonParser {
public:
    static std::unique_ptr<Config> parse(const std::string& content) {
        auto config = Config::defaults();

        // Parse engine section
        extract_string(content, "quote_currency", config->engine.quote_currency);
        extract_int64(content, "market_buy_reference_price", config->engine.market_buy_reference_price);
        extract_string(content, "default_instruments", config->engine.default_instruments);

        // Parse ledger section
        extract_uint32(content, "max_attempts", config->ledger.max_attempts);
        extract_uint32(content, "backoff_min_ms", config->ledger.backoff_min_ms);
        extract_uint32(content, "backoff_max_ms", config->ledger.backoff_max_ms);

        // Parse book section
        extract_uint32(content, "default_depth", config->book.default_depth);
        extract_uint32(content, "max_depth", config->book.max_depth);
        extract_uint32(content, "default_trade_limit", config->book.default_trade_limit);
        extract_uint32(content, "max_trade_limit", config->book.max_trade_limit);

        // Parse logging section
        extract_string(content, "level", config->logging.level);
        extract_uint32(content, "rate_limit_ms", config->logging.rate_limit_ms);
        extract_bool(content, "enable_structured", config->logging.enable_structured);

        return config;
    }

private:
    // Position just past the ':' following "key", or npos when absent
    static size_t value_position(const std::string& json, const std::string& key) {
        auto pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos) return std::string::npos;

        pos = json.find(':', pos + key.size() + 2);
        if (pos == std::string::npos) return std::string::npos;

        ++pos;
        while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
        return pos;
    }

    static void extract_string(const std::string& json, const std::string& key, std::string& out) {
        auto pos = value_position(json, key);
        if (pos == std::string::npos) return;
        if (pos >= json.length() || json[pos] != '"') {
            throw std::runtime_error("Expected string for key: " + key);
        }

        auto end = json.find('"', pos + 1);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated string for key: " + key);
        }
        out = json.substr(pos + 1, end - pos - 1);
    }

    static void extract_uint32(const std::string& json, const std::string& key, uint32_t& out) {
        int64_t value = out;
        extract_int64(json, key, value);
        if (value < 0 || value > static_cast<int64_t>(UINT32_MAX)) {
            throw std::runtime_error("Value out of range for key: " + key);
        }
        out = static_cast<uint32_t>(value);
    }

    static void extract_int64(const std::string& json, const std::string& key, int64_t& out) {
        auto pos = value_position(json, key);
        if (pos == std::string::npos) return;

        auto end = pos;
        if (end < json.length() && json[end] == '-') end++;
        while (end < json.length() && std::isdigit(static_cast<unsigned char>(json[end]))) end++;

        if (end == pos) {
            throw std::runtime_error("Expected number for key: " + key);
        }
        out = std::stoll(json.substr(pos, end - pos));
    }

    static void extract_bool(const std::string& json, const std::string& key, bool& out) {
        auto pos = value_position(json, key);
        if (pos == std::string::npos) return;

        if (json.compare(pos, 4, "true") == 0) {
            out = true;
        } else if (json.compare(pos, 5, "false") == 0) {
            out = false;
        } else {
            throw std::runtime_error("Expected boolean for key: " + key);
        }
    }
};

std::vector<std::string> EngineConfig::instrument_list() const {
    std::vector<std::string> tickers;
    std::stringstream ss(default_instruments);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        auto last = item.find_last_not_of(" \t");
        tickers.push_back(SecurityUtils::normalize_ticker(item.substr(first, last - first + 1)));
    }
    return tickers;
}

std::unique_ptr<Config> Config::defaults() {
    return std::make_unique<Config>();
}

std::unique_ptr<Config> Config::load_from_string(const std::string& content) {
    std::unique_ptr<Config> config;
    try {
        config = JsonParser::parse(content);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse config: " + SecurityUtils::sanitize_log_input(e.what()));
    }

    auto validation_result = ConfigurationValidator::validate_full_config(*config);
    if (validation_result.has_error()) {
        throw std::runtime_error("Configuration validation failed: " +
                                 validation_result.error().message());
    }

    LOG_INFO("Configuration validation passed");
    return config;
}

std::unique_ptr<Config> Config::load_from_file(const std::string& path) {
    std::string normalized_path = SecurityUtils::normalize_path(path);
    if (normalized_path.empty() || !SecurityUtils::is_regular_file(normalized_path)) {
        throw std::runtime_error("Cannot open config file: " + SecurityUtils::sanitize_log_input(path));
    }

    std::ifstream file(normalized_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + SecurityUtils::sanitize_log_input(normalized_path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_from_string(buffer.str());
}

} // namespace bourse
