#include "value.hpp"
#include "config.hpp"
#include "raw.hpp"
#include <algorithm>
#include <limits>
#include <string>

namespace nbtcpp {

    namespace {
        // Caps up-front allocation so a hostile length cannot force a huge
        // reserve before the stream runs dry.
        constexpr size_t reserve_cap = 4096;

        int32_t read_length(RawReader& reader, Tag tag) {
            int32_t len = reader.read_i32();
            if (len < 0) {
                throw nbtcpp::exception(ErrorKind::InvalidLength,
                                        "Negative length " + std::to_string(len) + " for " +
                                        std::string(tag_name(tag)) + " at byte " +
                                        std::to_string(reader.bytes_read()));
            }
            return len;
        }

        void write_length(RawWriter& writer, size_t len, Tag tag) {
            if (len > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
                throw nbtcpp::exception(ErrorKind::InvalidLength,
                                        std::string(tag_name(tag)) + " of " + std::to_string(len) +
                                        " elements exceeds the int32 length prefix");
            }
            writer.write_i32(static_cast<int32_t>(len));
        }

        void check_depth(size_t depth) {
            if (depth > config::max_depth) {
                throw nbtcpp::exception(ErrorKind::NestingTooDeep,
                                        "Nesting exceeds " + std::to_string(config::max_depth) + " levels");
            }
        }

        template <typename T, typename ReadFn>
        std::vector<T> read_array(RawReader& reader, Tag tag, ReadFn read_element) {
            int32_t len = read_length(reader, tag);
            std::vector<T> out;
            out.reserve(std::min(static_cast<size_t>(len), reserve_cap));
            for (int32_t i = 0; i < len; ++i) {
                out.push_back(read_element());
            }
            return out;
        }

        template <typename T>
        void print_array(std::ostream& os, const std::vector<T>& values) {
            os << "[";
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) os << ", ";
                if constexpr (sizeof(T) == 1) {
                    os << static_cast<int>(values[i]);
                } else {
                    os << values[i];
                }
            }
            os << "]";
        }

        std::string pad(int indent) {
            return std::string(static_cast<size_t>(indent), ' ');
        }
    }

    // ---- List -----------------------------------------------------------------

    List::List() : m_element_tag(Tag::End) {}

    List::List(Tag element_tag) : m_element_tag(element_tag) {}

    List::List(std::vector<Value> values)
        : m_element_tag(values.empty() ? Tag::End : values.front().tag()),
          m_values(std::move(values)) {
        check_homogeneous();
    }

    List::List(Tag element_tag, std::vector<Value> values)
        : m_element_tag(element_tag), m_values(std::move(values)) {
        if (m_element_tag == Tag::End && !m_values.empty()) {
            m_element_tag = m_values.front().tag();
        }
        check_homogeneous();
    }

    size_t List::size() const { return m_values.size(); }

    bool List::empty() const { return m_values.empty(); }

    const Value& List::operator[](size_t index) const { return m_values[index]; }

    List::const_iterator List::begin() const { return m_values.begin(); }

    List::const_iterator List::end() const { return m_values.end(); }

    void List::push_back(Value value) {
        if (m_values.empty() && m_element_tag == Tag::End) {
            m_element_tag = value.tag();
        } else if (value.tag() != m_element_tag) {
            throw nbtcpp::exception(ErrorKind::HeterogeneousList,
                                    "Cannot add " + std::string(value.tag_name()) + " to a list of " +
                                    std::string(tag_name(m_element_tag)));
        }
        m_values.push_back(std::move(value));
    }

    void List::check_homogeneous() const {
        for (size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i].tag() != m_element_tag) {
                throw nbtcpp::exception(ErrorKind::HeterogeneousList,
                                        "List of " + std::string(tag_name(m_element_tag)) + " holds " +
                                        std::string(m_values[i].tag_name()) + " at index " +
                                        std::to_string(i));
            }
        }
    }

    void List::encode(RawWriter& writer, size_t depth) const {
        check_depth(depth);
        writer.write_tag(m_element_tag);
        write_length(writer, m_values.size(), Tag::List);
        for (const auto& value : m_values) {
            value.encode(writer, depth);
        }
    }

    List List::decode(RawReader& reader, size_t depth) {
        check_depth(depth);
        Tag element_tag = tag_from_byte(reader.read_u8());
        int32_t len = read_length(reader, Tag::List);
        List list(element_tag);
        if (len == 0) {
            return list;
        }
        if (element_tag == Tag::End) {
            throw nbtcpp::exception(ErrorKind::UnknownTag,
                                    "List of TAG_End declares " + std::to_string(len) + " elements");
        }
        list.m_values.reserve(std::min(static_cast<size_t>(len), reserve_cap));
        for (int32_t i = 0; i < len; ++i) {
            list.m_values.push_back(Value::decode(element_tag, reader, depth));
        }
        return list;
    }

    void List::print(std::ostream& os, int indent) const {
        os << m_values.size() << " entry(ies) of " << tag_name(m_element_tag) << "\n"
           << pad(indent) << "{\n";
        for (const auto& value : m_values) {
            os << pad(indent + 2) << value.tag_name() << ": ";
            value.print(os, indent + 2);
            os << "\n";
        }
        os << pad(indent) << "}";
    }

    bool List::operator==(const List& other) const {
        return m_element_tag == other.m_element_tag && m_values == other.m_values;
    }

    // ---- Compound -------------------------------------------------------------

    Compound::Compound() = default;

    size_t Compound::size() const { return m_entries.size(); }

    bool Compound::empty() const { return m_entries.empty(); }

    Compound::const_iterator Compound::begin() const { return m_entries.begin(); }

    Compound::const_iterator Compound::end() const { return m_entries.end(); }

    bool Compound::contains(std::string_view name) const {
        return get(name) != nullptr;
    }

    const Value* Compound::get(std::string_view name) const {
        for (const auto& e : m_entries) {
            if (e.first == name) {
                return &e.second;
            }
        }
        return nullptr;
    }

    Value* Compound::get(std::string_view name) {
        for (auto& e : m_entries) {
            if (e.first == name) {
                return &e.second;
            }
        }
        return nullptr;
    }

    const Value& Compound::at(std::string_view name) const {
        if (const Value* v = get(name)) {
            return *v;
        }
        throw nbtcpp::exception(ErrorKind::KeyNotFound, "No entry named '" + std::string(name) + "'");
    }

    void Compound::insert(std::string name, Value value) {
        RawWriter::check_string(name);
        value.check_encodable();
        assign(std::move(name), std::move(value));
    }

    void Compound::assign(std::string name, Value value) {
        if (Value* existing = get(name)) {
            *existing = std::move(value);
            return;
        }
        m_entries.emplace_back(std::move(name), std::move(value));
    }

    bool Compound::erase(std::string_view name) {
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
                               [&](const entry& e) { return e.first == name; });
        if (it == m_entries.end()) {
            return false;
        }
        m_entries.erase(it);
        return true;
    }

    void Compound::encode_body(RawWriter& writer, size_t depth) const {
        check_depth(depth);
        for (const auto& [name, value] : m_entries) {
            writer.write_header(value.tag(), name);
            value.encode(writer, depth);
        }
        writer.write_end();
    }

    Compound Compound::decode_body(RawReader& reader, size_t depth) {
        check_depth(depth);
        Compound compound;
        for (;;) {
            Tag tag = tag_from_byte(reader.read_u8());
            if (tag == Tag::End) {
                break;
            }
            std::string name = reader.read_string();
            compound.assign(std::move(name), Value::decode(tag, reader, depth));
        }
        return compound;
    }

    void Compound::print(std::ostream& os, int indent) const {
        os << m_entries.size() << " entry(ies)\n" << pad(indent) << "{\n";
        for (const auto& [name, value] : m_entries) {
            os << pad(indent + 2) << value.tag_name() << "(\"" << name << "\"): ";
            value.print(os, indent + 2);
            os << "\n";
        }
        os << pad(indent) << "}";
    }

    bool Compound::operator==(const Compound& other) const {
        if (m_entries.size() != other.m_entries.size()) {
            return false;
        }
        for (const auto& [name, value] : m_entries) {
            const Value* theirs = other.get(name);
            if (!theirs || !(*theirs == value)) {
                return false;
            }
        }
        return true;
    }

    // ---- Value ----------------------------------------------------------------

    Value Value::decode(Tag tag, RawReader& reader, size_t depth) {
        switch (tag) {
            case Tag::Byte:
                return Value(reader.read_i8());
            case Tag::Short:
                return Value(reader.read_i16());
            case Tag::Int:
                return Value(reader.read_i32());
            case Tag::Long:
                return Value(reader.read_i64());
            case Tag::Float:
                return Value(reader.read_f32());
            case Tag::Double:
                return Value(reader.read_f64());
            case Tag::ByteArray:
                return Value(read_array<int8_t>(reader, tag, [&] { return reader.read_i8(); }));
            case Tag::String:
                return Value(reader.read_string());
            case Tag::List:
                return Value(List::decode(reader, depth + 1));
            case Tag::Compound:
                return Value(Compound::decode_body(reader, depth + 1));
            case Tag::IntArray:
                return Value(read_array<int32_t>(reader, tag, [&] { return reader.read_i32(); }));
            case Tag::LongArray:
                return Value(read_array<int64_t>(reader, tag, [&] { return reader.read_i64(); }));
            case Tag::End:
                break;
        }
        throw nbtcpp::exception(ErrorKind::UnknownTag,
                                "Cannot decode a value of " + std::string(nbtcpp::tag_name(tag)));
    }

    void Value::encode(RawWriter& writer, size_t depth) const {
        switch (tag()) {
            case Tag::Byte:
                writer.write_i8(std::get<int8_t>(m_data));
                break;
            case Tag::Short:
                writer.write_i16(std::get<int16_t>(m_data));
                break;
            case Tag::Int:
                writer.write_i32(std::get<int32_t>(m_data));
                break;
            case Tag::Long:
                writer.write_i64(std::get<int64_t>(m_data));
                break;
            case Tag::Float:
                writer.write_f32(std::get<float>(m_data));
                break;
            case Tag::Double:
                writer.write_f64(std::get<double>(m_data));
                break;
            case Tag::ByteArray: {
                const auto& arr = std::get<ByteArray>(m_data);
                write_length(writer, arr.size(), Tag::ByteArray);
                for (int8_t v : arr) writer.write_i8(v);
                break;
            }
            case Tag::String:
                writer.write_string(std::get<std::string>(m_data));
                break;
            case Tag::List:
                std::get<List>(m_data).encode(writer, depth + 1);
                break;
            case Tag::Compound:
                std::get<Compound>(m_data).encode_body(writer, depth + 1);
                break;
            case Tag::IntArray: {
                const auto& arr = std::get<IntArray>(m_data);
                write_length(writer, arr.size(), Tag::IntArray);
                for (int32_t v : arr) writer.write_i32(v);
                break;
            }
            case Tag::LongArray: {
                const auto& arr = std::get<LongArray>(m_data);
                write_length(writer, arr.size(), Tag::LongArray);
                for (int64_t v : arr) writer.write_i64(v);
                break;
            }
            case Tag::End:
                break;
        }
    }

    void Value::check_encodable() const {
        if (const std::string* text = get_if<std::string>()) {
            RawWriter::check_string(*text);
        } else if (const List* list = get_if<List>()) {
            list->check_homogeneous();
            for (const auto& item : *list) {
                item.check_encodable();
            }
        } else if (const Compound* compound = get_if<Compound>()) {
            for (const auto& [name, item] : *compound) {
                RawWriter::check_string(name);
                item.check_encodable();
            }
        }
    }

    void Value::print(std::ostream& os, int indent) const {
        switch (tag()) {
            case Tag::Byte:
                os << static_cast<int>(std::get<int8_t>(m_data));
                break;
            case Tag::Short:
                os << std::get<int16_t>(m_data);
                break;
            case Tag::Int:
                os << std::get<int32_t>(m_data);
                break;
            case Tag::Long:
                os << std::get<int64_t>(m_data);
                break;
            case Tag::Float:
                os << std::get<float>(m_data);
                break;
            case Tag::Double:
                os << std::get<double>(m_data);
                break;
            case Tag::ByteArray:
                print_array(os, std::get<ByteArray>(m_data));
                break;
            case Tag::String:
                os << std::get<std::string>(m_data);
                break;
            case Tag::List:
                std::get<List>(m_data).print(os, indent);
                break;
            case Tag::Compound:
                std::get<Compound>(m_data).print(os, indent);
                break;
            case Tag::IntArray:
                print_array(os, std::get<IntArray>(m_data));
                break;
            case Tag::LongArray:
                print_array(os, std::get<LongArray>(m_data));
                break;
            case Tag::End:
                break;
        }
    }

    std::ostream& operator<<(std::ostream& os, const Value& value) {
        value.print(os, 0);
        return os;
    }

} // namespace nbtcpp
