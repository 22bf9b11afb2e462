#include "compression.hpp"
#include "config.hpp"
#include "exception.hpp"
#include <algorithm>
#include <vector>
#include <zlib.h>

namespace nbtcpp::compression {

    namespace {
        constexpr int max_window_bits = 15;
        constexpr int gzip_window_offset = 16;

        int window_bits(Container container) {
            return container == Container::Gzip ? max_window_bits + gzip_window_offset : max_window_bits;
        }

        std::string zlib_message(const char* what, const z_stream& zs, int rc) {
            std::string msg = std::string(what) + " failed (" + std::to_string(rc) + ")";
            if (zs.msg) {
                msg += ": ";
                msg += zs.msg;
            }
            return msg;
        }

        // Releases the z_stream on every exit path.
        class InflateGuard {
        public:
            explicit InflateGuard(z_stream& zs) : m_zs(zs) {}
            ~InflateGuard() { inflateEnd(&m_zs); }
            InflateGuard(const InflateGuard&) = delete;
            InflateGuard& operator=(const InflateGuard&) = delete;
        private:
            z_stream& m_zs;
        };

        class DeflateGuard {
        public:
            explicit DeflateGuard(z_stream& zs) : m_zs(zs) {}
            ~DeflateGuard() { deflateEnd(&m_zs); }
            DeflateGuard(const DeflateGuard&) = delete;
            DeflateGuard& operator=(const DeflateGuard&) = delete;
        private:
            z_stream& m_zs;
        };
    }

    std::string decompress(std::istream& src, Container container) {
        z_stream zs{};
        int rc = inflateInit2(&zs, window_bits(container));
        if (rc != Z_OK) {
            throw nbtcpp::exception(ErrorKind::Compression, zlib_message("inflateInit2", zs, rc));
        }
        InflateGuard guard(zs);

        std::vector<char> in(config::io_chunk_size);
        std::vector<char> out(config::io_chunk_size);
        std::string result;

        do {
            src.read(in.data(), static_cast<std::streamsize>(in.size()));
            std::streamsize got = src.gcount();
            if (src.bad()) {
                throw nbtcpp::exception(ErrorKind::Io, "Stream failure while reading compressed data");
            }
            if (got == 0) {
                throw nbtcpp::exception(ErrorKind::Compression, "Compressed stream is truncated");
            }
            zs.next_in = reinterpret_cast<Bytef*>(in.data());
            zs.avail_in = static_cast<uInt>(got);

            do {
                zs.next_out = reinterpret_cast<Bytef*>(out.data());
                zs.avail_out = static_cast<uInt>(out.size());
                rc = inflate(&zs, Z_NO_FLUSH);
                if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                    throw nbtcpp::exception(ErrorKind::Compression, zlib_message("inflate", zs, rc));
                }
                result.append(out.data(), out.size() - zs.avail_out);
            } while (zs.avail_out == 0 && rc != Z_STREAM_END);
        } while (rc != Z_STREAM_END);

        return result;
    }

    void compress(std::ostream& dst, std::string_view data, Container container, int level) {
        z_stream zs{};
        int rc = deflateInit2(&zs, level, Z_DEFLATED, window_bits(container), 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw nbtcpp::exception(ErrorKind::Compression, zlib_message("deflateInit2", zs, rc));
        }
        DeflateGuard guard(zs);

        // avail_in is a uInt, so the input is fed in chunks rather than at once.
        std::vector<char> out(config::io_chunk_size);
        size_t consumed = 0;
        int flush = Z_NO_FLUSH;

        do {
            size_t chunk = std::min(data.size() - consumed, config::io_chunk_size);
            zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + consumed));
            zs.avail_in = static_cast<uInt>(chunk);
            consumed += chunk;
            flush = consumed == data.size() ? Z_FINISH : Z_NO_FLUSH;

            do {
                zs.next_out = reinterpret_cast<Bytef*>(out.data());
                zs.avail_out = static_cast<uInt>(out.size());
                rc = deflate(&zs, flush);
                if (rc == Z_STREAM_ERROR) {
                    throw nbtcpp::exception(ErrorKind::Compression, zlib_message("deflate", zs, rc));
                }
                dst.write(out.data(), static_cast<std::streamsize>(out.size() - zs.avail_out));
                if (!dst) {
                    throw nbtcpp::exception(ErrorKind::Io, "Stream failure while writing compressed data");
                }
            } while (zs.avail_out == 0);
        } while (flush != Z_FINISH);

        if (rc != Z_STREAM_END) {
            throw nbtcpp::exception(ErrorKind::Compression, zlib_message("deflate", zs, rc));
        }
    }

} // namespace nbtcpp::compression
