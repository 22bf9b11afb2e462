#include "utils/utf8.hpp"
#include <cstdint>

namespace nbtcpp::utils {

    bool is_valid_utf8(std::string_view text) {
        size_t i = 0;
        const size_t n = text.size();
        while (i < n) {
            uint8_t c = static_cast<uint8_t>(text[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            size_t len;
            uint32_t cp;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
            } else {
                return false;
            }
            if (i + len > n) {
                return false;
            }
            for (size_t k = 1; k < len; ++k) {
                uint8_t cc = static_cast<uint8_t>(text[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }

            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
                return false; // overlong
            }
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += len;
        }
        return true;
    }

} // namespace nbtcpp::utils
