#include "util.hpp"
#include <charconv>
#include <cstdlib>

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::optional<int64_t> parse_int_string(const std::string& s) {
    std::string text = trim(s);
    if (!text.empty() && text[0] == '+') {
        text.erase(0, 1);
        if (!text.empty() && text[0] == '-') return std::nullopt;
    }
    if (text.empty()) return std::nullopt;

    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    std::from_chars_result result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_float_string(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) return std::nullopt;

    // Overflow yields +/-inf, which the query checks reject as non-finite.
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}
