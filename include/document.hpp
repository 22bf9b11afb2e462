#ifndef NBTCPP_DOCUMENT_HPP
#define NBTCPP_DOCUMENT_HPP

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "config.hpp"
#include "raw.hpp"
#include "value.hpp"

namespace nbtcpp {

// A named root compound: the unit read from and written to a stream.
//
// Decoding either produces a complete Document or throws nbtcpp::exception;
// no partially decoded Document is ever returned. After construction the
// entries change only through insert().
class Document {
public:
  Document();
  explicit Document(std::string name);

  // Throws ErrorKind::MissingRootCompound when the stream does not start
  // with a TAG_Compound header.
  static Document read(std::istream &src, Endianness endian);
  static Document read_gzip(std::istream &src, Endianness endian);
  static Document read_zlib(std::istream &src, Endianness endian);

  // Nothing reaches `dst` unless the whole document encodes. Nesting beyond
  // config::max_depth throws ErrorKind::NestingTooDeep, as read() would.
  void write(std::ostream &dst, Endianness endian) const;
  void write_gzip(std::ostream &dst, Endianness endian,
                  int level = config::compression_level) const;
  void write_zlib(std::ostream &dst, Endianness endian,
                  int level = config::compression_level) const;

  // Replaces any entry of the same name. Anything write() could not encode
  // (invalid UTF-8, text over 65535 bytes, a heterogeneous List) is rejected
  // and the document is left unchanged.
  void insert(std::string name, Value value);

  // nullptr when there is no such entry.
  const Value *get(std::string_view name) const;
  // Throws ErrorKind::KeyNotFound.
  const Value &operator[](std::string_view name) const;

  bool contains(std::string_view name) const { return m_root.contains(name); }
  size_t size() const { return m_root.size(); }
  bool empty() const { return m_root.empty(); }

  const std::string &name() const { return m_name; }
  void set_name(std::string name) { m_name = std::move(name); }
  const Compound &root() const { return m_root; }

  Compound::const_iterator begin() const { return m_root.begin(); }
  Compound::const_iterator end() const { return m_root.end(); }

  bool operator==(const Document &other) const {
    return m_name == other.m_name && m_root == other.m_root;
  }
  bool operator!=(const Document &other) const { return !(*this == other); }

private:
  std::string m_name;
  Compound m_root;
};

std::ostream &operator<<(std::ostream &os, const Document &doc);

} // namespace nbtcpp

#endif // NBTCPP_DOCUMENT_HPP
