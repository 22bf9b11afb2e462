#include "document.hpp"
#include "exception.hpp"
#include "utils/hex.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace nbtcpp;
using nbtcpp::utils::hex_decode;
using nbtcpp::utils::hex_encode;

namespace {

std::string to_bytes(const Document &doc, Endianness endian) {
  std::ostringstream out;
  doc.write(out, endian);
  return out.str();
}

Document from_bytes(const std::string &bytes, Endianness endian) {
  std::istringstream in(bytes);
  return Document::read(in, endian);
}

ErrorKind read_failure(const std::string &bytes) {
  try {
    (void)from_bytes(bytes, Endianness::Big);
  } catch (const nbtcpp::exception &e) {
    return e.kind();
  }
  ADD_FAILURE() << "read did not throw";
  return ErrorKind::Io;
}

Document sample_document() {
  Document doc("Level");
  doc.insert("name", Value("Herobrine"));
  doc.insert("health", Value(int8_t{100}));
  doc.insert("food", Value(20.0f));
  doc.insert("xp", Value(int16_t{-3}));
  doc.insert("seed", Value(int64_t{-4242424242424242LL}));
  doc.insert("time", Value(int32_t{24000}));
  doc.insert("scale", Value(0.125));
  doc.insert("blocks", Value(ByteArray{1, 2, -3}));
  doc.insert("heights", Value(IntArray{64, -64, 320}));
  doc.insert("stamps", Value(LongArray{1, -1}));
  doc.insert("tags", Value(List(Tag::String, {Value("a"), Value("b")})));
  doc.insert("none", Value(List(Tag::Double)));

  Compound pos;
  pos.insert("x", Value(1.5));
  pos.insert("motion", Value(List(Tag::Float, {Value(0.0f), Value(-0.5f)})));
  List inventory(Tag::Compound);
  inventory.push_back(Value(pos));
  inventory.push_back(Value(Compound()));
  doc.insert("pos", Value(pos));
  doc.insert("inventory", Value(inventory));
  return doc;
}

ErrorKind insert_failure(Document &doc, std::string name, Value value) {
  try {
    doc.insert(std::move(name), std::move(value));
  } catch (const nbtcpp::exception &e) {
    return e.kind();
  }
  ADD_FAILURE() << "insert did not throw";
  return ErrorKind::Io;
}

// `levels` compounds, each the only entry of the one above, under the root.
Document nested_document(size_t levels) {
  Value inner{Compound()};
  for (size_t i = 1; i < levels; ++i) {
    Compound outer;
    outer.insert("c", std::move(inner));
    inner = Value(std::move(outer));
  }
  Document doc;
  doc.insert("c", std::move(inner));
  return doc;
}

} // namespace

TEST(DocumentTest, HealthScenarioBytes) {
  Document doc;
  doc.insert("health", Value(int8_t{100}));
  EXPECT_EQ(hex_encode(to_bytes(doc, Endianness::Big)), "0a0000"
                                                        "010006"
                                                        "6865616c7468"
                                                        "64"
                                                        "00");
}

TEST(DocumentTest, EmptyDocumentIsHeaderAndTerminator) {
  Document doc("abc");
  EXPECT_EQ(hex_encode(to_bytes(doc, Endianness::Big)), "0a0003616263"
                                                        "00");
  EXPECT_EQ(hex_encode(to_bytes(doc, Endianness::Little)), "0a0300616263"
                                                           "00");
}

TEST(DocumentTest, RoundTripBothByteOrders) {
  Document doc = sample_document();
  for (Endianness e : {Endianness::Big, Endianness::Little}) {
    Document back = from_bytes(to_bytes(doc, e), e);
    EXPECT_EQ(back.name(), "Level");
    EXPECT_EQ(back.size(), doc.size());
    EXPECT_EQ(back, doc);
  }
}

TEST(DocumentTest, RenameChangesHeaderOnly) {
  Document doc;
  doc.insert("health", Value(int8_t{100}));
  doc.set_name("hi");
  EXPECT_EQ(doc.name(), "hi");
  EXPECT_EQ(hex_encode(to_bytes(doc, Endianness::Big)), "0a00026869"
                                                        "0100066865616c7468"
                                                        "64"
                                                        "00");
  Document other("hi");
  other.insert("health", Value(int8_t{100}));
  EXPECT_EQ(doc, other);
}

TEST(DocumentTest, ByteOrdersDiffer) {
  Document doc;
  doc.insert("n", Value(int32_t{1}));
  EXPECT_NE(to_bytes(doc, Endianness::Big), to_bytes(doc, Endianness::Little));
}

TEST(DocumentTest, RoundTripKeepsEntryOrder) {
  Document doc = sample_document();
  Document back = from_bytes(to_bytes(doc, Endianness::Big), Endianness::Big);
  std::vector<std::string> expected, actual;
  for (const auto &[name, value] : doc) expected.push_back(name);
  for (const auto &[name, value] : back) actual.push_back(name);
  EXPECT_EQ(actual, expected);
}

TEST(DocumentTest, DecodingIsIdempotent) {
  std::string bytes = to_bytes(sample_document(), Endianness::Little);
  Document first = from_bytes(bytes, Endianness::Little);
  Document second = from_bytes(bytes, Endianness::Little);
  EXPECT_EQ(first, second);
  EXPECT_EQ(to_bytes(first, Endianness::Little), bytes);
}

TEST(DocumentTest, EmptyListKeepsElementTagThroughRoundTrip) {
  Document doc;
  doc.insert("empty", Value(List(Tag::LongArray)));
  Document back = from_bytes(to_bytes(doc, Endianness::Big), Endianness::Big);
  const List &list = back["empty"].as<List>();
  EXPECT_TRUE(list.empty());
  EXPECT_EQ(list.element_tag(), Tag::LongArray);
}

// The List constructor rejects the mix, so insert is never reached.
TEST(DocumentTest, HeterogeneousListRejectedAtConstruction) {
  Document doc;
  doc.insert("keep", Value(int8_t{1}));
  try {
    doc.insert("mixed", Value(List({Value(int8_t{1}), Value("two")})));
    FAIL() << "expected HeterogeneousList";
  } catch (const nbtcpp::exception &e) {
    EXPECT_EQ(e.kind(), ErrorKind::HeterogeneousList);
  }
  EXPECT_EQ(doc.size(), 1u);
  EXPECT_FALSE(doc.contains("mixed"));
  EXPECT_EQ(doc["keep"], Value(int8_t{1}));
}

TEST(DocumentTest, InsertOverwrites) {
  Document doc;
  doc.insert("a", Value(int8_t{1}));
  doc.insert("a", Value("replaced"));
  EXPECT_EQ(doc.size(), 1u);
  EXPECT_EQ(doc["a"].as<std::string>(), "replaced");
}

TEST(DocumentTest, GetReturnsNullWhenAbsent) {
  Document doc;
  doc.insert("present", Value(int32_t{5}));
  ASSERT_NE(doc.get("present"), nullptr);
  EXPECT_EQ(doc.get("present")->as<int32_t>(), 5);
  EXPECT_EQ(doc.get("absent"), nullptr);
  EXPECT_THROW((void)doc["absent"], nbtcpp::exception);
}

TEST(DocumentTest, NonCompoundRootIsRejected) {
  EXPECT_EQ(read_failure(hex_decode("01 0000 64")),
            ErrorKind::MissingRootCompound);
  EXPECT_EQ(read_failure(hex_decode("00")), ErrorKind::MissingRootCompound);
  EXPECT_EQ(read_failure(hex_decode("09 0000 01 00000000")),
            ErrorKind::MissingRootCompound);
}

TEST(DocumentTest, ListWithNegativeLengthIsRejected) {
  EXPECT_EQ(read_failure(hex_decode("0a 0000 09 0001 6c 03 ffffffff 00")),
            ErrorKind::InvalidLength);
}

TEST(DocumentTest, TruncatedStreamIsRejected) {
  std::string bytes = to_bytes(sample_document(), Endianness::Big);
  for (size_t cut : {size_t{0}, size_t{1}, size_t{5}, bytes.size() - 1}) {
    EXPECT_EQ(read_failure(bytes.substr(0, cut)), ErrorKind::UnexpectedEof)
        << "cut at " << cut;
  }
}

TEST(DocumentTest, DocumentPrints) {
  Document doc("hello");
  doc.insert("health", Value(int8_t{100}));
  doc.insert("name", Value("Herobrine"));
  std::ostringstream os;
  os << doc;
  EXPECT_EQ(os.str(), "TAG_Compound(\"hello\"): 2 entry(ies)\n"
                      "{\n"
                      "  TAG_Byte(\"health\"): 100\n"
                      "  TAG_String(\"name\"): Herobrine\n"
                      "}");
}

TEST(DocumentTest, UnwritableTextRejectedOnInsert) {
  Document doc;
  doc.insert("keep", Value(int8_t{1}));

  EXPECT_EQ(insert_failure(doc, "bad", Value(std::string("\xff\xfe"))),
            ErrorKind::MalformedText);
  EXPECT_EQ(insert_failure(doc, std::string("\xc0\x80"), Value(int8_t{2})),
            ErrorKind::MalformedText);
  EXPECT_EQ(insert_failure(doc, std::string(70000, 'k'), Value(int8_t{2})),
            ErrorKind::InvalidLength);
  EXPECT_EQ(insert_failure(doc, "long", Value(std::string(65536, 'v'))),
            ErrorKind::InvalidLength);

  Compound nested;
  nested.insert("ok", Value("fine"));
  nested.insert("list", Value(List({Value("a"), Value(std::string("\xed\xa0\x80"))})));
  EXPECT_EQ(insert_failure(doc, "nested", Value(nested)),
            ErrorKind::MalformedText);
  EXPECT_EQ(insert_failure(doc, "deep",
                           Value(List({Value(List({Value(std::string(65536, 'v'))}))}))),
            ErrorKind::InvalidLength);

  EXPECT_EQ(doc.size(), 1u);
  EXPECT_EQ(doc["keep"], Value(int8_t{1}));
  EXPECT_EQ(to_bytes(doc, Endianness::Big).size(), 12u);
}

TEST(DocumentTest, LongestTextRoundTrips) {
  Document doc;
  doc.insert(std::string(65535, 'k'), Value(std::string(65535, 'v')));
  Document back = from_bytes(to_bytes(doc, Endianness::Little), Endianness::Little);
  EXPECT_EQ(back, doc);
}

TEST(DocumentTest, WriteAndReadAgreeOnNestingLimit) {
  Document deepest = nested_document(511);
  EXPECT_EQ(from_bytes(to_bytes(deepest, Endianness::Big), Endianness::Big),
            deepest);

  Document too_deep = nested_document(512);
  std::ostringstream out;
  try {
    too_deep.write(out, Endianness::Big);
    FAIL() << "expected NestingTooDeep";
  } catch (const nbtcpp::exception &e) {
    EXPECT_EQ(e.kind(), ErrorKind::NestingTooDeep);
  }
  EXPECT_TRUE(out.str().empty());

  std::string hex = "0a0000";
  for (int i = 0; i < 512; ++i) {
    hex += "0a000163";
  }
  hex += std::string(2 * 513, '0');
  EXPECT_EQ(read_failure(hex_decode(hex)), ErrorKind::NestingTooDeep);
}

TEST(DocumentTest, NestingLimitCountsLists) {
  Value inner{List(Tag::Int)};
  for (int i = 1; i < 511; ++i) {
    inner = Value(List({std::move(inner)}));
  }
  Document doc;
  doc.insert("l", inner);
  EXPECT_EQ(from_bytes(to_bytes(doc, Endianness::Big), Endianness::Big), doc);

  doc.insert("l", Value(List({std::move(inner)})));
  std::ostringstream out;
  EXPECT_THROW(doc.write(out, Endianness::Big), nbtcpp::exception);
  EXPECT_TRUE(out.str().empty());
}
