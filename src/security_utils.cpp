/**
 * @file security_utils.cpp
 * @brief Input sanitization and validation helpers
 *
 * Provides:
 * - Log injection prevention (CWE-117)
 * - Ticker normalization (case-folded to uppercase on every path)
 * - Configuration path normalization
 */

#include "bourse/security_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace bourse {

// Control characters to filter (security: prevent injection)
const std::unordered_set<char> SecurityUtils::CONTROL_CHARS = {
    '\x00', '\x01', '\x02', '\x03', '\x04', '\x05', '\x06', '\x07',
    '\x08', '\x0B', '\x0C', '\x0E', '\x0F', '\x10', '\x11', '\x12',
    '\x13', '\x14', '\x15', '\x16', '\x17', '\x18', '\x19', '\x1A',
    '\x1B', '\x1C', '\x1D', '\x1E', '\x1F', '\x7F'
};

/**
 * @brief Sanitize input for logging (prevent log injection)
 * @param input Raw input string
 * @return Sanitized string safe for logging
 *
 * Removes control characters and escapes newlines, carriage returns,
 * tabs, backslashes and quotes so a user-supplied name can never
 * fabricate an extra log line.
 */
std::string SecurityUtils::sanitize_log_input(std::string_view input) {
    std::string sanitized;
    sanitized.reserve(input.size() * 2);

    for (char c : input) {
        switch (c) {
            case '\n': sanitized += "\\n"; continue;
            case '\r': sanitized += "\\r"; continue;
            case '\t': sanitized += "\\t"; continue;
            case '\\': sanitized += "\\\\"; continue;
            case '"':  sanitized += "\\\""; continue;
            default: break;
        }
        if (CONTROL_CHARS.contains(c)) {
            continue;
        }
        sanitized += c;
    }

    return sanitized;
}

std::string SecurityUtils::normalize_path(std::string_view path) {
    try {
        return std::filesystem::weakly_canonical(std::filesystem::path(path)).string();
    } catch (const std::filesystem::filesystem_error&) {
        return "";
    }
}

bool SecurityUtils::is_regular_file(std::string_view path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec);
}

std::string SecurityUtils::normalize_ticker(std::string_view ticker) {
    std::string normalized(ticker);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

/**
 * @brief Validate an already-normalized ticker
 *
 * Tickers are 1..16 characters of uppercase letters and digits.
 */
bool SecurityUtils::is_valid_ticker(std::string_view ticker) {
    if (ticker.empty() || ticker.size() > MAX_TICKER_LENGTH) {
        return false;
    }
    return std::all_of(ticker.begin(), ticker.end(), [](unsigned char c) {
        return std::isdigit(c) || (std::isalpha(c) && std::isupper(c));
    });
}

bool SecurityUtils::is_safe_string(std::string_view input) {
    if (input.empty() || input.size() > MAX_NAME_LENGTH) {
        return false;
    }
    return std::none_of(input.begin(), input.end(),
                        [](char c) { return CONTROL_CHARS.contains(c) || c == '\n' ||
                                            c == '\r' || c == '\t'; });
}

} // namespace bourse
