#ifndef NBTCPP_JSON_HPP
#define NBTCPP_JSON_HPP

#include "document.hpp"
#include <string>

// JSON bridge over the public Document API. The document name is not part of
// the JSON form: from_json_string always yields an unnamed Document.
namespace nbtcpp::nbt_json {

    std::string to_json_string(const Document& document);

    // Integers map to Long, reals to Double, booleans to Byte 0/1, arrays to
    // List, objects to Compound. Throws ErrorKind::Json for syntax errors,
    // null values and a non-object root.
    Document from_json_string(const std::string& json_str);

} // namespace nbtcpp::nbt_json

#endif // NBTCPP_JSON_HPP
