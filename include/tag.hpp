#ifndef NBTCPP_TAG_HPP
#define NBTCPP_TAG_HPP

#include <cstdint>
#include <string_view>

namespace nbtcpp {

    // One-byte type identifiers as they appear on the wire.
    enum class Tag : uint8_t {
        End = 0,
        Byte = 1,
        Short = 2,
        Int = 3,
        Long = 4,
        Float = 5,
        Double = 6,
        ByteArray = 7,
        String = 8,
        List = 9,
        Compound = 10,
        IntArray = 11,
        LongArray = 12
    };

    constexpr uint8_t tag_max = static_cast<uint8_t>(Tag::LongArray);

    // Converts a raw identifier byte. Throws ErrorKind::UnknownTag above tag_max.
    Tag tag_from_byte(uint8_t id);

    constexpr uint8_t tag_to_byte(Tag tag) { return static_cast<uint8_t>(tag); }

    // "TAG_Byte", "TAG_Compound", ...
    std::string_view tag_name(Tag tag);

} // namespace nbtcpp

#endif // NBTCPP_TAG_HPP
