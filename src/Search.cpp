/**
 * @file Search.cpp
 * @brief Implementation of attribute search
 */

#include "doctree/Search.hpp"
#include "doctree/DotPath.hpp"

namespace doctree {

namespace {

const Value* find_at(const Value& document, const std::string& key,
                     const std::string& value, const Options& options,
                     const std::string& path, std::size_t depth) {
    enforce_depth(depth, options, path);

    auto direct = document.find(key);
    if (direct != document.end() && direct->is_string() &&
        direct->get_ref<const std::string&>() == value) {
        return &document;
    }

    for (auto it = document.begin(); it != document.end(); ++it) {
        if (classify(it.value()) != Kind::SubDocument) {
            continue;
        }
        const Value* found = find_at(it.value(), key, value, options,
                                     child_path(path, it.key()), depth + 1);
        if (found) {
            return found;
        }
    }
    return nullptr;
}

} // namespace

const Value* find_by_attribute(const Value& document, const std::string& key,
                               const std::string& value, const Options& options) {
    if (!is_document(document)) {
        return nullptr;
    }
    return find_at(document, key, value, options, "", 0);
}

} // namespace doctree
