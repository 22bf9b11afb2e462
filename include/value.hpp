#ifndef NBTCPP_VALUE_HPP
#define NBTCPP_VALUE_HPP

#include <cstdint>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "exception.hpp"
#include "tag.hpp"

namespace nbtcpp {

    class RawReader;
    class RawWriter;
    class Value;

    using ByteArray = std::vector<int8_t>;
    using IntArray = std::vector<int32_t>;
    using LongArray = std::vector<int64_t>;

    // Ordered sequence of values sharing one element tag. Every constructor
    // and push_back rejects elements whose tag differs from element_tag()
    // with ErrorKind::HeterogeneousList. An empty list may carry any element
    // tag; Tag::End means "not yet typed" and is replaced by the tag of the
    // first element added.
    class List {
    public:
        using const_iterator = std::vector<Value>::const_iterator;

        List();
        explicit List(Tag element_tag);
        explicit List(std::vector<Value> values);
        List(Tag element_tag, std::vector<Value> values);

        Tag element_tag() const { return m_element_tag; }
        size_t size() const;
        bool empty() const;
        const Value& operator[](size_t index) const;
        const_iterator begin() const;
        const_iterator end() const;

        void push_back(Value value);

        // Throws ErrorKind::HeterogeneousList naming the first offending index.
        void check_homogeneous() const;

        // Payload only: element tag, length, untagged elements. `depth`
        // counts the enclosing lists and compounds, as in decode().
        void encode(RawWriter& writer, size_t depth) const;
        static List decode(RawReader& reader, size_t depth);

        void print(std::ostream& os, int indent) const;

        bool operator==(const List& other) const;

    private:
        Tag m_element_tag;
        std::vector<Value> m_values;
    };

    // Name -> value mapping that keeps insertion order. Inserting an existing
    // name replaces the value in place.
    class Compound {
    public:
        using entry = std::pair<std::string, Value>;
        using const_iterator = std::vector<entry>::const_iterator;

        Compound();

        size_t size() const;
        bool empty() const;
        const_iterator begin() const;
        const_iterator end() const;

        bool contains(std::string_view name) const;
        const Value* get(std::string_view name) const;
        Value* get(std::string_view name);
        // Throws ErrorKind::KeyNotFound.
        const Value& at(std::string_view name) const;

        // Rejects, before storing anything, a name or nested String that
        // cannot be written (ErrorKind::MalformedText, ErrorKind::InvalidLength)
        // and a heterogeneous List.
        void insert(std::string name, Value value);
        bool erase(std::string_view name);

        // Entries as (tag, name, payload) triples followed by the End byte.
        void encode_body(RawWriter& writer, size_t depth) const;
        static Compound decode_body(RawReader& reader, size_t depth);

        void print(std::ostream& os, int indent) const;

        // Order-insensitive.
        bool operator==(const Compound& other) const;

    private:
        void assign(std::string name, Value value);

        std::vector<entry> m_entries;
    };

    class Value {
    public:
        // Alternatives are declared in identifier order starting at Tag::Byte,
        // so the active index plus one is the wire tag.
        using Storage = std::variant<int8_t, int16_t, int32_t, int64_t, float, double,
                                     ByteArray, std::string, List, Compound,
                                     IntArray, LongArray>;

        Value(int8_t value) : m_data(value) {}
        Value(int16_t value) : m_data(value) {}
        Value(int32_t value) : m_data(value) {}
        Value(int64_t value) : m_data(value) {}
        Value(float value) : m_data(value) {}
        Value(double value) : m_data(value) {}
        Value(ByteArray value) : m_data(std::move(value)) {}
        Value(std::string value) : m_data(std::move(value)) {}
        Value(std::string_view value) : m_data(std::string(value)) {}
        Value(const char* value) : m_data(std::string(value)) {}
        Value(List value) : m_data(std::move(value)) {}
        Value(Compound value) : m_data(std::move(value)) {}
        Value(IntArray value) : m_data(std::move(value)) {}
        Value(LongArray value) : m_data(std::move(value)) {}

        Tag tag() const { return static_cast<Tag>(m_data.index() + 1); }
        std::string_view tag_name() const { return nbtcpp::tag_name(tag()); }

        template <typename T>
        bool is() const { return std::holds_alternative<T>(m_data); }

        template <typename T>
        const T* get_if() const { return std::get_if<T>(&m_data); }

        template <typename T>
        T* get_if() { return std::get_if<T>(&m_data); }

        // Throws ErrorKind::TypeMismatch when the active alternative is not T.
        template <typename T>
        const T& as() const {
            if (const T* p = get_if<T>()) {
                return *p;
            }
            throw nbtcpp::exception(ErrorKind::TypeMismatch,
                                    "Value holds " + std::string(tag_name()));
        }

        template <typename T>
        T& as() {
            if (T* p = get_if<T>()) {
                return *p;
            }
            throw nbtcpp::exception(ErrorKind::TypeMismatch,
                                    "Value holds " + std::string(tag_name()));
        }

        const Storage& data() const { return m_data; }

        // Consumes exactly the payload layout of `tag`.
        static Value decode(Tag tag, RawReader& reader, size_t depth = 0);
        // Throws ErrorKind::NestingTooDeep where decode() would.
        void encode(RawWriter& writer, size_t depth = 0) const;

        // Walks the whole subtree checking every name and String against
        // RawWriter::check_string and every List for homogeneity.
        void check_encodable() const;

        void print(std::ostream& os, int indent = 0) const;

        bool operator==(const Value& other) const { return m_data == other.m_data; }
        bool operator!=(const Value& other) const { return !(*this == other); }

    private:
        Storage m_data;
    };

    std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace nbtcpp

#endif // NBTCPP_VALUE_HPP
