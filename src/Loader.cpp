/**
 * @file Loader.cpp
 * @brief Reading JSON and TOML documents from disk
 */

#include "doctree/Loader.hpp"
#include "doctree/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace doctree {

namespace {

void require_regular_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

template <typename T>
std::string stream_text(const T& value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

Value from_toml(const toml::node& node);

Value from_toml_table(const toml::table& table) {
    Value doc = Value::object();
    for (const auto& [key, child] : table) {
        doc[std::string(key.str())] = from_toml(child);
    }
    return doc;
}

Value from_toml_array(const toml::array& array) {
    Value seq = Value::array();
    for (const auto& child : array) {
        seq.push_back(from_toml(child));
    }
    return seq;
}

// Calendar values keep their TOML text; only dates and date-times are dates.
Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using N = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<N, toml::table>) {
            return from_toml_table(n);
        } else if constexpr (std::is_same_v<N, toml::array>) {
            return from_toml_array(n);
        } else if constexpr (std::is_same_v<N, toml::value<toml::date>> ||
                             std::is_same_v<N, toml::value<toml::date_time>>) {
            return make_date(stream_text(n.get()));
        } else if constexpr (std::is_same_v<N, toml::value<toml::time>>) {
            return Value(stream_text(n.get()));
        } else {
            return Value(n.get());
        }
    });
}

} // namespace

Value load_json_file(const std::string& path) {
    require_regular_file(path);
    try {
        return Value::parse(slurp(path));
    } catch (const Value::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    require_regular_file(path);
    try {
        return from_toml_table(toml::parse_file(path));
    } catch (const toml::parse_error& e) {
        const auto& where = e.source().begin;
        throw ParseError(path, std::string(e.description()) + " (line " +
                                   std::to_string(where.line) + ", column " +
                                   std::to_string(where.column) + ")");
    }
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Value load_document_file(const std::string& path) {
    require_regular_file(path);

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ParseError(path, "unsupported file type '" + ext + "', expected .json or .toml");
}

} // namespace doctree
