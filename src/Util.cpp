/**
 * @file Util.cpp
 * @brief Path queries and small document helpers
 */

#include "doctree/Util.hpp"
#include "doctree/Diagnostics.hpp"
#include "doctree/DotPath.hpp"
#include "doctree/Errors.hpp"

namespace doctree {

namespace {

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

// RFC 6901 escaping of one reference token
std::string pointer_token(const std::string& segment) {
    return "/" + replace_all(replace_all(segment, "~", "~0"), "/", "~1");
}

// "$.a.b[0]['c']" -> "/a/b/0/c". Returns nullopt for syntax the pointer
// form cannot express (wildcards, recursive descent, filters).
std::optional<std::string> json_path_to_pointer(const std::string& query) {
    std::string pointer;
    size_t i = 1; // past '$'
    while (i < query.size()) {
        const char c = query[i];
        if (c == '.') {
            ++i;
            size_t end = query.find_first_of(".[", i);
            if (end == std::string::npos) end = query.size();
            std::string name = query.substr(i, end - i);
            if (name.empty() || name == "*") return std::nullopt;
            pointer += pointer_token(name);
            i = end;
        } else if (c == '[') {
            size_t close = query.find(']', i);
            if (close == std::string::npos) return std::nullopt;
            std::string inner = query.substr(i + 1, close - i - 1);
            if (inner.size() >= 2 && (inner.front() == '\'' || inner.front() == '"') &&
                inner.back() == inner.front()) {
                inner = inner.substr(1, inner.size() - 2);
            } else if (inner.empty() ||
                       inner.find_first_not_of("0123456789") != std::string::npos) {
                return std::nullopt;
            }
            pointer += pointer_token(inner);
            i = close + 1;
        } else {
            return std::nullopt;
        }
    }
    return pointer;
}

std::optional<std::string> to_pointer(const std::string& query) {
    if (query.front() == '/') {
        return query;
    }
    if (query.front() == '$') {
        return json_path_to_pointer(query);
    }
    std::string pointer;
    for (const auto& seg : split_dot_path(query)) {
        pointer += pointer_token(seg);
    }
    return pointer;
}

} // namespace

std::optional<Value> apply_path(const Value& document, const std::string& query,
                                Diagnostics* diag) {
    if (document.is_null() || query.empty()) {
        return std::nullopt;
    }

    const auto pointer = to_pointer(query);
    if (!pointer) {
        if (diag) diag->on_path_not_found(query, "unsupported path syntax");
        return std::nullopt;
    }

    try {
        return document.at(Value::json_pointer(*pointer));
    } catch (const Value::exception& e) {
        if (diag) diag->on_path_not_found(query, e.what());
        return std::nullopt;
    }
}

std::string to_json_text(const Value& value, int indent) {
    return value.dump(indent);
}

bool is_empty_document(const Value& value) {
    if (value.is_null()) {
        return true;
    }
    return value.is_object() && value.empty();
}

std::vector<std::string> to_json_strings(const std::vector<Value>& documents) {
    std::vector<std::string> out;
    out.reserve(documents.size());
    for (const auto& doc : documents) {
        out.push_back(doc.dump());
    }
    return out;
}

std::vector<Value> document_ids(const std::vector<Value>& documents) {
    std::vector<Value> ids;
    ids.reserve(documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        const auto& doc = documents[i];
        const std::string where = "[" + std::to_string(i) + "]";
        if (!is_document(doc)) {
            throw TypeError(where, "object", type_name(doc));
        }
        auto it = doc.find("_id");
        if (it == doc.end()) {
            throw KeyError(where, "_id");
        }
        ids.push_back(*it);
    }
    return ids;
}

Value copy_without_field(const Value& document, const std::string& field) {
    if (document.is_null()) {
        return Value();
    }
    if (!document.is_object()) {
        throw TypeError("", "object", type_name(document));
    }

    Value result = Value::object();
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (it.key() != field) {
            result[it.key()] = it.value();
        }
    }
    return result;
}

std::string collapse_escapes(const std::string& text) {
    if (text.empty()) {
        return text;
    }
    if (text.find('\\') != std::string::npos) {
        return replace_all(text, "\\\\", "\\");
    }
    if (text.find("//") != std::string::npos) {
        return replace_all(text, "//", "/");
    }
    return text;
}

} // namespace doctree
