/**
 * @file Fold.cpp
 * @brief Implementation of record folding
 */

#include "doctree/Fold.hpp"
#include "doctree/Diagnostics.hpp"
#include "doctree/DotPath.hpp"
#include "doctree/Merge.hpp"

namespace doctree {

namespace {

Value single_entry(const std::string& key, Value value) {
    Value entry = Value::object();
    entry[key] = std::move(value);
    return entry;
}

Value fold_at(const Value& record, const Options& options,
              const std::string& path, std::size_t depth) {
    enforce_depth(depth, options, path);

    if (record.empty()) {
        return record;
    }

    Value result = Value::object();
    for (auto it = record.begin(); it != record.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();
        const auto key_path = child_path(path, key);

        if (value.is_array()) {
            if (value.empty()) {
                result = detail::union_at(result, single_entry(key, Value::array()),
                                          options, path, depth);
                continue;
            }

            Value combined = Value::object();
            for (const auto& element : value) {
                if (classify(element) != Kind::SubDocument) {
                    if (options.diagnostics) {
                        options.diagnostics->on_ignored_element(key_path, element);
                    }
                    continue;
                }
                Value folded = fold_at(element, options, key_path, depth + 1);
                if (options.fold_mode == FoldMode::Legacy) {
                    // Each element overwrites the previous one
                    combined = detail::union_at(result, folded, options, path, depth);
                } else {
                    combined = detail::union_at(combined, folded, options, key_path, depth + 1);
                }
            }

            if (!combined.empty()) {
                Value wrapped = Value::array();
                wrapped.push_back(std::move(combined));
                result = detail::union_at(result, single_entry(key, std::move(wrapped)),
                                          options, path, depth);
            }
        } else if (key.find('.') == std::string::npos) {
            result[key] = value;
        } else {
            auto expanded = expand_path(key, value);
            if (!expanded) {
                if (options.diagnostics) {
                    options.diagnostics->on_dropped_field(key_path, "key has no path segments");
                }
                continue;
            }
            result = detail::union_at(result, *expanded, options, path, depth);
        }
    }
    return result;
}

} // namespace

Value fold_record(const Value& record, const Options& options) {
    if (record.is_null()) {
        return Value();
    }
    if (!is_document(record)) {
        throw TypeError("", "object", type_name(record));
    }
    return fold_at(record, options, "", 0);
}

} // namespace doctree
