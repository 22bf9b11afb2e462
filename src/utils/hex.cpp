#include "utils/hex.hpp"
#include <cctype>

namespace nbtcpp::utils {

// Helper to convert a hex character to its integer value
static unsigned char hex_char_to_int(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw std::runtime_error("Invalid hex character");
}

std::string hex_decode(std::string_view hex_string) {
    std::string digits;
    digits.reserve(hex_string.size());
    for (char c : hex_string) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.length() % 2 != 0) {
        throw std::runtime_error("Hex string length must be even.");
    }

    std::string bytes;
    bytes.reserve(digits.length() / 2);

    for (size_t i = 0; i < digits.length(); i += 2) {
        unsigned char high_nibble = hex_char_to_int(digits[i]);
        unsigned char low_nibble = hex_char_to_int(digits[i+1]);
        bytes.push_back(static_cast<char>((high_nibble << 4) | low_nibble));
    }
    return bytes;
}

std::string hex_encode(std::string_view bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        unsigned char b = static_cast<unsigned char>(c);
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace nbtcpp::utils
