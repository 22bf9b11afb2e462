#ifndef NBTCPP_COMPRESSION_HPP
#define NBTCPP_COMPRESSION_HPP

#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace nbtcpp::compression {

    enum class Container {
        Gzip, // RFC 1952
        Zlib  // RFC 1950
    };

    // Inflates one compressed stream read from `src`. Bytes after the end of
    // the compressed stream are left unread or ignored. Throws
    // ErrorKind::Compression on corrupt or truncated input and ErrorKind::Io
    // when `src` fails.
    std::string decompress(std::istream& src, Container container);

    // Deflates `data` and writes the whole container to `dst`.
    void compress(std::ostream& dst, std::string_view data, Container container, int level);

} // namespace nbtcpp::compression

#endif // NBTCPP_COMPRESSION_HPP
