/**
 * @file Value.hpp
 * @brief Value type and structural classification for documents
 *
 * Uses nlohmann::ordered_json as the underlying tree so that documents keep
 * their key insertion order:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 *
 * Dates and object identifiers use the MongoDB extended JSON wrappers
 * {"$date": ...} and {"$oid": "..."}.
 */

#ifndef DOCTREE_VALUE_HPP
#define DOCTREE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace doctree {

/**
 * @brief Insertion-ordered JSON-like value type for documents
 *
 * Alias for nlohmann::ordered_json. See nlohmann::json documentation for
 * the complete API.
 */
using Value = nlohmann::ordered_json;

/// Extended JSON key marking a date scalar.
inline constexpr const char* kDateKey = "$date";

/// Extended JSON key marking an object identifier.
inline constexpr const char* kObjectIdKey = "$oid";

/**
 * @brief Structural kind of a value
 *
 * Every recursive operation switches on this instead of probing the
 * underlying JSON type.
 */
enum class Kind {
    Scalar,       ///< string, integer, boolean or date
    SubDocument,  ///< nested document
    Sequence,     ///< ordered list of values
    Unrecognized  ///< anything outside the scalar allow-list
};

/**
 * @brief Check whether a value is a {"$date": millis | "iso"} wrapper
 */
inline bool is_date(const Value& val) {
    if (!val.is_object() || val.size() != 1) return false;
    auto it = val.find(kDateKey);
    return it != val.end() && (it->is_number_integer() || it->is_string());
}

/**
 * @brief Check whether a value is a {"$oid": "hex"} wrapper
 */
inline bool is_object_id(const Value& val) {
    if (!val.is_object() || val.size() != 1) return false;
    auto it = val.find(kObjectIdKey);
    return it != val.end() && it->is_string();
}

/**
 * @brief Classify a value into its structural kind
 *
 * Pure and total. Floats, nulls, binary values and object identifiers
 * are Unrecognized.
 */
inline Kind classify(const Value& val) {
    if (val.is_string() || val.is_boolean() || val.is_number_integer()) {
        return Kind::Scalar;
    }
    if (val.is_array()) {
        return Kind::Sequence;
    }
    if (val.is_object()) {
        if (is_date(val)) return Kind::Scalar;
        if (is_object_id(val)) return Kind::Unrecognized;
        return Kind::SubDocument;
    }
    return Kind::Unrecognized;
}

/**
 * @brief Check if value is a document (object that is not a scalar wrapper)
 */
inline bool is_document(const Value& val) {
    return classify(val) == Kind::SubDocument;
}

/**
 * @brief Name of a structural kind ("scalar", "document", "sequence",
 *        "unrecognized")
 */
inline const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::Scalar: return "scalar";
        case Kind::SubDocument: return "document";
        case Kind::Sequence: return "sequence";
        case Kind::Unrecognized: return "unrecognized";
    }
    return "unknown";
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "date", "objectid", "array", "object", "binary")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (is_date(val)) return "date";
    if (is_object_id(val)) return "objectid";
    if (val.is_object()) return "object";
    if (val.is_binary()) return "binary";
    return "unknown";
}

/**
 * @brief String form of a value
 *
 * Strings are returned verbatim, dates as their payload text, everything
 * else as compact JSON (integers in decimal, booleans as true/false).
 */
inline std::string scalar_text(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    if (is_date(val)) return scalar_text(val.at(kDateKey));
    return val.dump();
}

/// Build a date scalar from milliseconds since the epoch.
inline Value make_date(std::int64_t millis) {
    Value date = Value::object();
    date[kDateKey] = millis;
    return date;
}

/// Build a date scalar from an ISO-8601 string.
inline Value make_date(const std::string& iso) {
    Value date = Value::object();
    date[kDateKey] = iso;
    return date;
}

/// Build an object identifier value.
inline Value make_object_id(const std::string& hex) {
    Value oid = Value::object();
    oid[kObjectIdKey] = hex;
    return oid;
}

} // namespace doctree

#endif // DOCTREE_VALUE_HPP
