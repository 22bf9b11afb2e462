#include "json.hpp"
#include "yyjson.h"
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>

namespace nbtcpp {
    namespace nbt_json {

        namespace {
            struct DocDeleter {
                void operator()(yyjson_doc* doc) const { yyjson_doc_free(doc); }
            };
            struct MutDocDeleter {
                void operator()(yyjson_mut_doc* doc) const { yyjson_mut_doc_free(doc); }
            };

            template <typename T>
            yyjson_mut_val* to_yyjson_array(const std::vector<T>& values, yyjson_mut_doc* doc) {
                yyjson_mut_val* arr = yyjson_mut_arr(doc);
                for (T v : values) {
                    yyjson_mut_arr_append(arr, yyjson_mut_sint(doc, static_cast<int64_t>(v)));
                }
                return arr;
            }

            yyjson_mut_val* to_yyjson_val(const Value& value, yyjson_mut_doc* doc);

            yyjson_mut_val* to_yyjson_obj(const Compound& compound, yyjson_mut_doc* doc) {
                yyjson_mut_val* obj = yyjson_mut_obj(doc);
                for (const auto& [name, child] : compound) {
                    yyjson_mut_val* key = yyjson_mut_strncpy(doc, name.data(), name.size());
                    yyjson_mut_obj_add(obj, key, to_yyjson_val(child, doc));
                }
                return obj;
            }

            yyjson_mut_val* to_yyjson_val(const Value& value, yyjson_mut_doc* doc) {
                switch (value.tag()) {
                    case Tag::Byte:
                        return yyjson_mut_sint(doc, value.as<int8_t>());
                    case Tag::Short:
                        return yyjson_mut_sint(doc, value.as<int16_t>());
                    case Tag::Int:
                        return yyjson_mut_sint(doc, value.as<int32_t>());
                    case Tag::Long:
                        return yyjson_mut_sint(doc, value.as<int64_t>());
                    case Tag::Float:
                        return yyjson_mut_real(doc, value.as<float>());
                    case Tag::Double:
                        return yyjson_mut_real(doc, value.as<double>());
                    case Tag::ByteArray:
                        return to_yyjson_array(value.as<ByteArray>(), doc);
                    case Tag::String: {
                        const auto& s = value.as<std::string>();
                        return yyjson_mut_strncpy(doc, s.data(), s.size());
                    }
                    case Tag::List: {
                        yyjson_mut_val* arr = yyjson_mut_arr(doc);
                        for (const auto& item : value.as<List>()) {
                            yyjson_mut_arr_append(arr, to_yyjson_val(item, doc));
                        }
                        return arr;
                    }
                    case Tag::Compound:
                        return to_yyjson_obj(value.as<Compound>(), doc);
                    case Tag::IntArray:
                        return to_yyjson_array(value.as<IntArray>(), doc);
                    case Tag::LongArray:
                        return to_yyjson_array(value.as<LongArray>(), doc);
                    case Tag::End:
                        break;
                }
                return yyjson_mut_null(doc);
            }

            Value from_yyjson_val(yyjson_val* val);

            Compound from_yyjson_obj(yyjson_val* val) {
                Compound compound;
                yyjson_obj_iter iter;
                yyjson_obj_iter_init(val, &iter);
                yyjson_val* key;
                while ((key = yyjson_obj_iter_next(&iter))) {
                    yyjson_val* item = yyjson_obj_iter_get_val(key);
                    compound.insert(std::string(yyjson_get_str(key), yyjson_get_len(key)),
                                    from_yyjson_val(item));
                }
                return compound;
            }

            Value from_yyjson_val(yyjson_val* val) {
                if (yyjson_is_bool(val)) {
                    return Value(static_cast<int8_t>(yyjson_get_bool(val) ? 1 : 0));
                }
                if (yyjson_is_uint(val)) {
                    uint64_t u = yyjson_get_uint(val);
                    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        throw nbtcpp::exception(ErrorKind::Json,
                                                "Integer " + std::to_string(u) + " does not fit TAG_Long");
                    }
                    return Value(static_cast<int64_t>(u));
                }
                if (yyjson_is_sint(val)) {
                    return Value(static_cast<int64_t>(yyjson_get_sint(val)));
                }
                if (yyjson_is_real(val)) {
                    return Value(yyjson_get_real(val));
                }
                if (yyjson_is_str(val)) {
                    return Value(std::string(yyjson_get_str(val), yyjson_get_len(val)));
                }
                if (yyjson_is_arr(val)) {
                    List list;
                    yyjson_arr_iter iter;
                    yyjson_arr_iter_init(val, &iter);
                    yyjson_val* item;
                    while ((item = yyjson_arr_iter_next(&iter))) {
                        list.push_back(from_yyjson_val(item));
                    }
                    return Value(std::move(list));
                }
                if (yyjson_is_obj(val)) {
                    return Value(from_yyjson_obj(val));
                }
                throw nbtcpp::exception(ErrorKind::Json, "JSON null has no NBT representation");
            }
        }

        std::string to_json_string(const Document& document) {
            std::unique_ptr<yyjson_mut_doc, MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
            if (!doc) {
                throw nbtcpp::exception(ErrorKind::Json, "Failed to allocate JSON document");
            }
            yyjson_mut_doc_set_root(doc.get(), to_yyjson_obj(document.root(), doc.get()));

            size_t len = 0;
            char* json_str = yyjson_mut_write(doc.get(), 0, &len);
            if (!json_str) {
                // NaN and infinities are not representable in JSON
                throw nbtcpp::exception(ErrorKind::Json, "Failed to write JSON");
            }
            std::string result(json_str, len);
            free(json_str);
            return result;
        }

        Document from_json_string(const std::string& json_str) {
            yyjson_read_err err;
            std::unique_ptr<yyjson_doc, DocDeleter> doc(
                yyjson_read_opts(const_cast<char*>(json_str.data()), json_str.size(), 0, nullptr, &err));
            if (!doc) {
                throw nbtcpp::exception(ErrorKind::Json,
                                        "JSON parse error at " + std::to_string(err.pos) + ": " + err.msg);
            }
            yyjson_val* root = yyjson_doc_get_root(doc.get());
            if (!yyjson_is_obj(root)) {
                throw nbtcpp::exception(ErrorKind::Json, "JSON root must be an object");
            }

            Document document;
            yyjson_obj_iter iter;
            yyjson_obj_iter_init(root, &iter);
            yyjson_val* key;
            while ((key = yyjson_obj_iter_next(&iter))) {
                yyjson_val* item = yyjson_obj_iter_get_val(key);
                document.insert(std::string(yyjson_get_str(key), yyjson_get_len(key)),
                                from_yyjson_val(item));
            }
            return document;
        }

    } // namespace nbt_json
} // namespace nbtcpp
