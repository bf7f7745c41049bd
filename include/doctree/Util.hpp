#ifndef DOCTREE_UTIL_HPP
#define DOCTREE_UTIL_HPP

#include "doctree/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace doctree {

class Diagnostics;

// Evaluate a path query against a document. Accepted forms:
//   JSON Pointer  "/book/authors/0"
//   JSONPath      "$.book.authors[0]", "$['book']"
//   dot path      "book.author"
// Returns std::nullopt for a null document, an empty query, a malformed
// query or a path that does not resolve; failures are reported to diag.
std::optional<Value> apply_path(const Value& document, const std::string& query,
                                Diagnostics* diag = nullptr);

// JSON text of a value; indent < 0 produces compact output.
std::string to_json_text(const Value& value, int indent = -1);

// True for null and for a document with no keys.
bool is_empty_document(const Value& value);

// Compact JSON text of each document, in order.
std::vector<std::string> to_json_strings(const std::vector<Value>& documents);

// The "_id" of each document, in order. Throws KeyError when a document
// has no "_id" and TypeError when an element is not a document.
std::vector<Value> document_ids(const std::vector<Value>& documents);

// Copy of a document without one top-level field. Null stays null.
Value copy_without_field(const Value& document, const std::string& field);

// Collapse "\\\\" to "\\" when the text holds a backslash, else "//" to "/".
std::string collapse_escapes(const std::string& text);

} // namespace doctree

#endif // DOCTREE_UTIL_HPP
