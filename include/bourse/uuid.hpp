#pragma once

#include "bourse/error_handling.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace bourse {

// 128-bit random identifier (RFC 4122 version 4)
class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<uint8_t, 16>& bytes) : bytes_(bytes) {}

    static Result<Uuid> generate();
    static Result<Uuid> parse(std::string_view text);

    std::string to_string() const;
    bool is_nil() const;
    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    auto operator<=>(const Uuid&) const = default;

private:
    std::array<uint8_t, 16> bytes_{};
};

inline std::ostream& operator<<(std::ostream& os, const Uuid& id) {
    return os << id.to_string();
}

} // namespace bourse

namespace std {
template<>
struct hash<bourse::Uuid> {
    size_t operator()(const bourse::Uuid& id) const noexcept {
        // Version 4 identifiers are uniformly random, so folding the halves is enough
        uint64_t hi = 0;
        uint64_t lo = 0;
        const auto& b = id.bytes();
        for (int i = 0; i < 8; ++i) {
            hi = (hi << 8) | b[i];
            lo = (lo << 8) | b[i + 8];
        }
        return static_cast<size_t>(hi ^ (lo * 0x9E3779B97F4A7C15ULL));
    }
};
}
