/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "doctree/DotPath.hpp"

namespace doctree {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    // Add final segment
    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string child_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) {
        return key;
    }
    return parent + '.' + key;
}

namespace {
    /**
     * @brief Build {segments[i]: {segments[i+1]: ... value}}
     * @pre i < segments.size()
     */
    Value expand_from(const std::vector<std::string>& segments, size_t i,
                      const Value& value) {
        Value current = Value::object();
        if (i < segments.size() - 1) {
            current[segments[i]] = expand_from(segments, i + 1, value);
        } else {
            current[segments[i]] = value;
        }
        return current;
    }
}

std::optional<Value> expand_path(const std::vector<std::string>& segments,
                                 const Value& value) {
    if (segments.empty()) {
        return std::nullopt;
    }
    for (const auto& seg : segments) {
        if (seg.empty()) {
            return std::nullopt;
        }
    }
    return expand_from(segments, 0, value);
}

std::optional<Value> expand_path(const std::string& path, const Value& value) {
    return expand_path(split_dot_path(path), value);
}

const Value* get_by_dot(const Value& data, const std::string& path) {
    const auto segments = split_dot_path(path);

    const Value* current = &data;
    for (const auto& seg : segments) {
        if (!is_document(*current)) {
            return nullptr;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }

    return current;
}

} // namespace doctree
