#ifndef NBTCPP_CONFIG_HPP
#define NBTCPP_CONFIG_HPP

#include <cstddef>

namespace nbtcpp::config {
    constexpr size_t max_depth = 512; // nested lists/compounds
    constexpr size_t max_string_length = 65535; // u16 length prefix
    constexpr int compression_level = -1; // Z_DEFAULT_COMPRESSION
    constexpr size_t io_chunk_size = 16384;
}

#endif // NBTCPP_CONFIG_HPP
