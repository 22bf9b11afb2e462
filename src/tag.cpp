#include "tag.hpp"
#include "exception.hpp"

namespace nbtcpp {

    Tag tag_from_byte(uint8_t id) {
        if (id > tag_max) {
            throw nbtcpp::exception(ErrorKind::UnknownTag,
                                    "Unknown type identifier: " + std::to_string(id));
        }
        return static_cast<Tag>(id);
    }

    std::string_view tag_name(Tag tag) {
        switch (tag) {
            case Tag::End:
                return "TAG_End";
            case Tag::Byte:
                return "TAG_Byte";
            case Tag::Short:
                return "TAG_Short";
            case Tag::Int:
                return "TAG_Int";
            case Tag::Long:
                return "TAG_Long";
            case Tag::Float:
                return "TAG_Float";
            case Tag::Double:
                return "TAG_Double";
            case Tag::ByteArray:
                return "TAG_ByteArray";
            case Tag::String:
                return "TAG_String";
            case Tag::List:
                return "TAG_List";
            case Tag::Compound:
                return "TAG_Compound";
            case Tag::IntArray:
                return "TAG_IntArray";
            case Tag::LongArray:
                return "TAG_LongArray";
        }
        return "TAG_Unknown";
    }

} // namespace nbtcpp
