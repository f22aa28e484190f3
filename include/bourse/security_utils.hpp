#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <unordered_set>

namespace bourse {

class SecurityUtils {
public:
    // Log input sanitization (CWE-117)
    static std::string sanitize_log_input(std::string_view input);

    // Path normalization for configuration files
    static std::string normalize_path(std::string_view path);
    static bool is_regular_file(std::string_view path);

    // Positional "{}" formatting; surplus arguments are appended, missing ones left as "{}"
    template<typename... Args>
    static std::string safe_format(std::string_view format_str, const Args&... args) {
        std::ostringstream out;
        size_t pos = 0;
        (append_next(out, format_str, pos, args), ...);
        out << format_str.substr(pos);
        return out.str();
    }

    // Input validation
    static std::string normalize_ticker(std::string_view ticker);
    static bool is_valid_ticker(std::string_view ticker);
    static bool is_safe_string(std::string_view input);

    static constexpr size_t MAX_TICKER_LENGTH = 16;
    static constexpr size_t MAX_NAME_LENGTH = 128;

private:
    static const std::unordered_set<char> CONTROL_CHARS;

    template<typename T>
    static void append_next(std::ostringstream& out, std::string_view format_str,
                            size_t& pos, const T& arg) {
        auto slot = format_str.find("{}", pos);
        if (slot == std::string_view::npos) {
            out << format_str.substr(pos) << ' ' << arg;
            pos = format_str.size();
            return;
        }
        out << format_str.substr(pos, slot - pos) << arg;
        pos = slot + 2;
    }
};

} // namespace bourse
