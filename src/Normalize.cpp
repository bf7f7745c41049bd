/**
 * @file Normalize.cpp
 * @brief Implementation of sequence normalization
 */

#include "doctree/Normalize.hpp"
#include "doctree/Diagnostics.hpp"
#include "doctree/DotPath.hpp"

namespace doctree {

namespace {

Value normalize_at(const Value& document, const Options& options,
                   const std::string& path, std::size_t depth);

Value reduce_at(const Value& sequence, const Options& options,
                const std::string& path, std::size_t depth) {
    enforce_depth(depth, options, path);

    if (sequence.empty()) {
        throw MalformedSequence(path, 0, "no representative element");
    }

    const Value& head = sequence[0];
    switch (classify(head)) {
        case Kind::SubDocument:
            return normalize_at(head, options, path, depth + 1);

        case Kind::Sequence:
            if (head.empty() || classify(head[0]) != Kind::SubDocument) {
                throw MalformedSequence(path, sequence.size(),
                                        "nested sequence does not start with a document");
            }
            return normalize_at(head[0], options, path, depth + 1);

        case Kind::Unrecognized:
            throw MalformedSequence(path, sequence.size(),
                                    "unrecognized " + type_name(head) + " element");

        case Kind::Scalar:
            break;
    }

    // {head: second element}
    if (sequence.size() < 2) {
        throw MalformedSequence(path, sequence.size(),
                                type_name(head) + " element needs a paired value");
    }
    Value result = Value::object();
    result[scalar_text(head)] = sequence[1];
    return result;
}

Value normalize_at(const Value& document, const Options& options,
                   const std::string& path, std::size_t depth) {
    enforce_depth(depth, options, path);

    Value result = Value::object();
    for (auto it = document.begin(); it != document.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        switch (classify(value)) {
            case Kind::Scalar:
                result[key] = value;
                break;

            case Kind::Sequence:
                if (value.empty()) {
                    result[key] = value;
                } else if (value.size() == 1 && classify(value[0]) == Kind::Scalar) {
                    result[key] = value[0];
                } else {
                    result[key] = reduce_at(value, options, child_path(path, key), depth + 1);
                }
                break;

            case Kind::SubDocument:
                result[key] = normalize_at(value, options, child_path(path, key), depth + 1);
                break;

            case Kind::Unrecognized:
                if (options.diagnostics) {
                    options.diagnostics->on_dropped_field(
                        child_path(path, key), "unrecognized value kind " + type_name(value));
                }
                break;
        }
    }
    return result;
}

} // namespace

Value normalize(const Value& document, const Options& options) {
    if (document.is_null()) {
        return Value();
    }
    if (!is_document(document)) {
        throw TypeError("", "object", type_name(document));
    }
    return normalize_at(document, options, "", 0);
}

Value reduce_sequence(const Value& sequence, const Options& options) {
    if (sequence.is_null()) {
        return Value();
    }
    if (!sequence.is_array()) {
        throw TypeError("", "array", type_name(sequence));
    }
    return reduce_at(sequence, options, "", 0);
}

} // namespace doctree
