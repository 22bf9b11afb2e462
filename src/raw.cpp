#include "raw.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "utils/hex.hpp"
#include "utils/utf8.hpp"
#include <cstring>

namespace nbtcpp {

    namespace {
        constexpr size_t max_width = sizeof(uint64_t);

        std::string malformed_text_message(std::string_view text) {
            return "Invalid UTF-8 in text starting with " + utils::hex_encode(text.substr(0, 16));
        }
    }

    RawReader::RawReader(std::istream& src, Endianness endian)
        : m_src(src), m_endian(endian), m_bytes_read(0) {}

    void RawReader::read_exact(char* dst, size_t count) {
        if (count == 0) {
            return;
        }
        m_src.read(dst, static_cast<std::streamsize>(count));
        size_t got = static_cast<size_t>(m_src.gcount());
        m_bytes_read += got;
        if (got != count) {
            if (m_src.bad()) {
                throw nbtcpp::exception(ErrorKind::Io,
                                        "Stream failure at byte " + std::to_string(m_bytes_read));
            }
            throw nbtcpp::exception(ErrorKind::UnexpectedEof,
                                    "Unexpected end of stream at byte " + std::to_string(m_bytes_read) +
                                    ": needed " + std::to_string(count) + " bytes, got " + std::to_string(got));
        }
    }

    uint64_t RawReader::read_uint(size_t width) {
        unsigned char bytes[max_width];
        read_exact(reinterpret_cast<char*>(bytes), width);
        uint64_t value = 0;
        if (m_endian == Endianness::Big) {
            for (size_t i = 0; i < width; ++i) {
                value = (value << 8) | bytes[i];
            }
        } else {
            for (size_t i = width; i > 0; --i) {
                value = (value << 8) | bytes[i - 1];
            }
        }
        return value;
    }

    uint8_t RawReader::read_u8() {
        return static_cast<uint8_t>(read_uint(1));
    }

    int8_t RawReader::read_i8() {
        return static_cast<int8_t>(read_u8());
    }

    uint16_t RawReader::read_u16() {
        return static_cast<uint16_t>(read_uint(2));
    }

    int16_t RawReader::read_i16() {
        return static_cast<int16_t>(read_u16());
    }

    int32_t RawReader::read_i32() {
        return static_cast<int32_t>(static_cast<uint32_t>(read_uint(4)));
    }

    int64_t RawReader::read_i64() {
        return static_cast<int64_t>(read_uint(8));
    }

    float RawReader::read_f32() {
        uint32_t bits = static_cast<uint32_t>(read_uint(4));
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    double RawReader::read_f64() {
        uint64_t bits = read_uint(8);
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string RawReader::read_string() {
        uint16_t len = read_u16();
        size_t offset = m_bytes_read;
        std::string text(len, '\0');
        read_exact(text.data(), len);
        if (!utils::is_valid_utf8(text)) {
            throw nbtcpp::exception(ErrorKind::MalformedText,
                                    malformed_text_message(text) + " at byte " + std::to_string(offset));
        }
        return text;
    }

    std::pair<uint8_t, std::string> RawReader::read_header() {
        uint8_t id = read_u8();
        if (id == tag_to_byte(Tag::End)) {
            return {id, std::string()};
        }
        return {id, read_string()};
    }

    RawWriter::RawWriter(std::ostream& dst, Endianness endian)
        : m_dst(dst), m_endian(endian), m_bytes_written(0) {}

    void RawWriter::write_exact(const char* src, size_t count) {
        if (count == 0) {
            return;
        }
        m_dst.write(src, static_cast<std::streamsize>(count));
        if (!m_dst) {
            throw nbtcpp::exception(ErrorKind::Io,
                                    "Stream failure at byte " + std::to_string(m_bytes_written));
        }
        m_bytes_written += count;
    }

    void RawWriter::write_uint(uint64_t value, size_t width) {
        unsigned char bytes[max_width];
        for (size_t i = 0; i < width; ++i) {
            unsigned char b = static_cast<unsigned char>(value >> (8 * i));
            if (m_endian == Endianness::Big) {
                bytes[width - 1 - i] = b;
            } else {
                bytes[i] = b;
            }
        }
        write_exact(reinterpret_cast<const char*>(bytes), width);
    }

    void RawWriter::write_u8(uint8_t value) {
        write_uint(value, 1);
    }

    void RawWriter::write_i8(int8_t value) {
        write_u8(static_cast<uint8_t>(value));
    }

    void RawWriter::write_u16(uint16_t value) {
        write_uint(value, 2);
    }

    void RawWriter::write_i16(int16_t value) {
        write_u16(static_cast<uint16_t>(value));
    }

    void RawWriter::write_i32(int32_t value) {
        write_uint(static_cast<uint32_t>(value), 4);
    }

    void RawWriter::write_i64(int64_t value) {
        write_uint(static_cast<uint64_t>(value), 8);
    }

    void RawWriter::write_f32(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        write_uint(bits, 4);
    }

    void RawWriter::write_f64(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        write_uint(bits, 8);
    }

    void RawWriter::check_string(std::string_view value) {
        if (value.size() > config::max_string_length) {
            throw nbtcpp::exception(ErrorKind::InvalidLength,
                                    "Text of " + std::to_string(value.size()) +
                                    " bytes exceeds the u16 length prefix");
        }
        if (!utils::is_valid_utf8(value)) {
            throw nbtcpp::exception(ErrorKind::MalformedText, malformed_text_message(value));
        }
    }

    void RawWriter::write_string(std::string_view value) {
        check_string(value);
        write_u16(static_cast<uint16_t>(value.size()));
        write_exact(value.data(), value.size());
    }

    void RawWriter::write_header(Tag tag, std::string_view name) {
        write_tag(tag);
        write_string(name);
    }

} // namespace nbtcpp
