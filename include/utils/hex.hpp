#ifndef NBTCPP_UTILS_HEX_HPP
#define NBTCPP_UTILS_HEX_HPP

#include <string>
#include <string_view>
#include <stdexcept>

namespace nbtcpp::utils {

// Decodes a hex string into raw bytes. Whitespace between byte pairs is
// ignored.
// Throws std::runtime_error if the input string is not a valid hex string.
std::string hex_decode(std::string_view hex_string);

// Encodes raw bytes as lowercase hex with no separators.
std::string hex_encode(std::string_view bytes);

} // namespace nbtcpp::utils

#endif // NBTCPP_UTILS_HEX_HPP
