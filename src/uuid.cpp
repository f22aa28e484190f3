#include "bourse/uuid.hpp"
#include "bourse/logger.hpp"
#include <openssl/rand.h>
#include <cctype>

namespace bourse {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

/**
 * @brief Generate a version 4 identifier from OpenSSL's CSPRNG
 * @return New identifier or ENTROPY_UNAVAILABLE if RAND_bytes fails
 */
Result<Uuid> Uuid::generate() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        LOG_ERROR("Failed to generate secure random bytes");
        return ErrorCode::ENTROPY_UNAVAILABLE;
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return Uuid(bytes);
}

/**
 * @brief Parse the canonical 8-4-4-4-12 hexadecimal form
 *
 * Hex digits may be upper or lower case; anything else is
 * INVALID_IDENTIFIER.
 */
Result<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) {
        return ErrorCode::INVALID_IDENTIFIER;
    }

    std::array<uint8_t, 16> bytes{};
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return ErrorCode::INVALID_IDENTIFIER;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return ErrorCode::INVALID_IDENTIFIER;
        bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char digits[] = "0123456789abcdef";

    std::string text;
    text.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text += '-';
        }
        text += digits[bytes_[i] >> 4];
        text += digits[bytes_[i] & 0x0F];
    }
    return text;
}

bool Uuid::is_nil() const {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace bourse
