#include "document.hpp"
#include "compression.hpp"
#include "exception.hpp"
#include "observability.hpp"
#include <chrono>
#include <sstream>
#include <utility>

namespace nbtcpp {

namespace {

std::chrono::microseconds
elapsed_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
}

void report_failure(std::string_view operation, const nbtcpp::exception &e,
                    std::chrono::microseconds duration, size_t bytes_read,
                    size_t bytes_written, std::string_view key) {
  log_if_enabled(LogLevel::Error, e.what(), operation, duration,
                 bytes_read + bytes_written, key);
  record_error(static_cast<int>(e.kind()));
  record_operation(operation, false, duration, bytes_read, bytes_written);
}

} // namespace

Document::Document() = default;

Document::Document(std::string name) : m_name(std::move(name)) {}

Document Document::read(std::istream &src, Endianness endian) {
  auto start = std::chrono::steady_clock::now();
  RawReader reader(src, endian);
  Document doc;
  try {
    auto [id, name] = reader.read_header();
    if (id != tag_to_byte(Tag::Compound)) {
      throw nbtcpp::exception(ErrorKind::MissingRootCompound,
                              "Top-level identifier " + std::to_string(id) +
                                  " is not TAG_Compound");
    }
    Compound root = Compound::decode_body(reader, 1);
    doc.m_name = std::move(name);
    doc.m_root = std::move(root);
  } catch (const nbtcpp::exception &e) {
    report_failure("DocumentRead", e, elapsed_since(start), reader.bytes_read(),
                   0, "");
    throw;
  }

  auto elapsed = elapsed_since(start);
  log_if_enabled(LogLevel::Debug, "Document decoded.", "DocumentRead", elapsed,
                 reader.bytes_read(), doc.m_name);
  record_operation("DocumentRead", true, elapsed, reader.bytes_read(), 0);
  return doc;
}

Document Document::read_gzip(std::istream &src, Endianness endian) {
  auto start = std::chrono::steady_clock::now();
  std::string raw;
  try {
    raw = compression::decompress(src, compression::Container::Gzip);
  } catch (const nbtcpp::exception &e) {
    report_failure("DocumentReadGzip", e, elapsed_since(start), 0, 0, "");
    throw;
  }
  std::istringstream in(raw);
  return read(in, endian);
}

Document Document::read_zlib(std::istream &src, Endianness endian) {
  auto start = std::chrono::steady_clock::now();
  std::string raw;
  try {
    raw = compression::decompress(src, compression::Container::Zlib);
  } catch (const nbtcpp::exception &e) {
    report_failure("DocumentReadZlib", e, elapsed_since(start), 0, 0, "");
    throw;
  }
  std::istringstream in(raw);
  return read(in, endian);
}

void Document::write(std::ostream &dst, Endianness endian) const {
  auto start = std::chrono::steady_clock::now();
  // Encoded in full before anything reaches `dst`, so a failed write leaves
  // the caller's stream untouched.
  std::ostringstream staged;
  RawWriter writer(staged, endian);
  try {
    writer.write_header(Tag::Compound, m_name);
    m_root.encode_body(writer, 1);
    const std::string bytes = staged.str();
    dst.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!dst) {
      throw nbtcpp::exception(ErrorKind::Io,
                              "Stream failure while writing document");
    }
  } catch (const nbtcpp::exception &e) {
    report_failure("DocumentWrite", e, elapsed_since(start), 0,
                   writer.bytes_written(), m_name);
    throw;
  }

  auto elapsed = elapsed_since(start);
  log_if_enabled(LogLevel::Debug, "Document encoded.", "DocumentWrite", elapsed,
                 writer.bytes_written(), m_name);
  record_operation("DocumentWrite", true, elapsed, 0, writer.bytes_written());
}

void Document::write_gzip(std::ostream &dst, Endianness endian,
                          int level) const {
  std::ostringstream raw;
  write(raw, endian);
  auto start = std::chrono::steady_clock::now();
  try {
    compression::compress(dst, raw.str(), compression::Container::Gzip, level);
  } catch (const nbtcpp::exception &e) {
    report_failure("DocumentWriteGzip", e, elapsed_since(start), 0, 0, m_name);
    throw;
  }
}

void Document::write_zlib(std::ostream &dst, Endianness endian,
                          int level) const {
  std::ostringstream raw;
  write(raw, endian);
  auto start = std::chrono::steady_clock::now();
  try {
    compression::compress(dst, raw.str(), compression::Container::Zlib, level);
  } catch (const nbtcpp::exception &e) {
    report_failure("DocumentWriteZlib", e, elapsed_since(start), 0, 0, m_name);
    throw;
  }
}

void Document::insert(std::string name, Value value) {
  m_root.insert(std::move(name), std::move(value));
}

const Value *Document::get(std::string_view name) const {
  return m_root.get(name);
}

const Value &Document::operator[](std::string_view name) const {
  return m_root.at(name);
}

std::ostream &operator<<(std::ostream &os, const Document &doc) {
  os << "TAG_Compound(\"" << doc.name() << "\"): ";
  doc.root().print(os, 0);
  return os;
}

} // namespace nbtcpp
