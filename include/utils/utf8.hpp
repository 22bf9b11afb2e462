#ifndef NBTCPP_UTILS_UTF8_HPP
#define NBTCPP_UTILS_UTF8_HPP

#include <string_view>

namespace nbtcpp::utils {

    // Strict UTF-8 check: rejects overlong forms, surrogates and code points
    // above U+10FFFF.
    bool is_valid_utf8(std::string_view text);

} // namespace nbtcpp::utils

#endif // NBTCPP_UTILS_UTF8_HPP
