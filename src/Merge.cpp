/**
 * @file Merge.cpp
 * @brief Implementation of document union
 */

#include "doctree/Merge.hpp"
#include "doctree/Diagnostics.hpp"
#include "doctree/DotPath.hpp"

namespace doctree {

namespace detail {

Value union_at(const Value& first, const Value& second, const Options& options,
               const std::string& path, std::size_t depth) {
    enforce_depth(depth, options, path);

    if (first.empty()) {
        return second;
    }
    if (second.empty()) {
        return first;
    }

    Value result = Value::object();

    // Pass one: keys of first, in order
    for (auto it = first.begin(); it != first.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        auto other = second.find(key);
        if (other == second.end()) {
            result[key] = value;
            continue;
        }

        const auto key_path = child_path(path, key);
        if (classify(value) == Kind::SubDocument && classify(*other) == Kind::SubDocument) {
            result[key] = union_at(value, *other, options, key_path, depth + 1);
            continue;
        }

        if (options.diagnostics) {
            options.diagnostics->on_conflict(key_path, options.conflict, value, *other);
        }
        switch (options.conflict) {
            case ConflictPolicy::DropOnConflict:
                break;
            case ConflictPolicy::FirstWins:
                result[key] = value;
                break;
            case ConflictPolicy::SecondWins:
                result[key] = *other;
                break;
            case ConflictPolicy::Error:
                throw MergeConflict(key_path, type_name(value), type_name(*other));
        }
    }

    // Pass two: keys pass one never saw. A key dropped above stays dropped.
    for (auto it = second.begin(); it != second.end(); ++it) {
        if (!first.contains(it.key())) {
            result[it.key()] = it.value();
        }
    }

    return result;
}

} // namespace detail

Value union_documents(const Value& first, const Value& second, const Options& options) {
    if (first.is_null() || second.is_null()) {
        return Value();
    }
    if (!is_document(first)) {
        throw TypeError("", "object", type_name(first));
    }
    if (!is_document(second)) {
        throw TypeError("", "object", type_name(second));
    }
    return detail::union_at(first, second, options, "", 0);
}

Value union_all(const std::vector<Value>& documents, const Options& options) {
    Value result = Value::object();
    for (const auto& document : documents) {
        result = union_documents(result, document, options);
    }

    return result;
}

} // namespace doctree
