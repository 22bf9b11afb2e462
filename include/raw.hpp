#ifndef NBTCPP_RAW_HPP
#define NBTCPP_RAW_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "tag.hpp"

namespace nbtcpp {

    enum class Endianness {
        Big,
        Little
    };

    // Reads fixed-width primitives and length-prefixed text from a stream in
    // one byte order. Every failure throws nbtcpp::exception; a read never
    // returns a partial value.
    class RawReader {
    public:
        RawReader(std::istream& src, Endianness endian);

        uint8_t read_u8();
        int8_t read_i8();
        uint16_t read_u16();
        int16_t read_i16();
        int32_t read_i32();
        int64_t read_i64();
        float read_f32();
        double read_f64();

        // u16 length followed by that many UTF-8 bytes.
        std::string read_string();

        // Identifier byte followed by its name. An End identifier carries no
        // name on the wire and yields an empty one.
        std::pair<uint8_t, std::string> read_header();

        Endianness endianness() const { return m_endian; }
        size_t bytes_read() const { return m_bytes_read; }

    private:
        void read_exact(char* dst, size_t count);
        uint64_t read_uint(size_t width);

        std::istream& m_src;
        Endianness m_endian;
        size_t m_bytes_read;
    };

    class RawWriter {
    public:
        RawWriter(std::ostream& dst, Endianness endian);

        void write_u8(uint8_t value);
        void write_i8(int8_t value);
        void write_u16(uint16_t value);
        void write_i16(int16_t value);
        void write_i32(int32_t value);
        void write_i64(int64_t value);
        void write_f32(float value);
        void write_f64(double value);

        void write_string(std::string_view value);

        // Throws ErrorKind::InvalidLength for text over 65535 bytes and
        // ErrorKind::MalformedText for invalid UTF-8.
        static void check_string(std::string_view value);
        void write_tag(Tag tag) { write_u8(tag_to_byte(tag)); }
        void write_header(Tag tag, std::string_view name);

        // Emits the End byte closing a compound.
        void write_end() { write_tag(Tag::End); }

        Endianness endianness() const { return m_endian; }
        size_t bytes_written() const { return m_bytes_written; }

    private:
        void write_exact(const char* src, size_t count);
        void write_uint(uint64_t value, size_t width);

        std::ostream& m_dst;
        Endianness m_endian;
        size_t m_bytes_written;
    };

} // namespace nbtcpp

#endif // NBTCPP_RAW_HPP
