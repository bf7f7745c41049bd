/**
 * @file Search.hpp
 * @brief Depth-first lookup of a sub-document by string attribute
 */

#ifndef DOCTREE_SEARCH_HPP
#define DOCTREE_SEARCH_HPP

#include "doctree/Options.hpp"
#include "doctree/Value.hpp"
#include <string>

namespace doctree {

/**
 * @brief Find the first sub-document mapping @p key to the string @p value
 *
 * Pre-order, depth-first, following document key order. Only string
 * values match; a number whose text equals @p value does not.
 *
 * @return Pointer into @p document, or nullptr when nothing matches or
 *         @p document is not a document
 *
 * Example:
 * ```cpp
 * Value doc = {{"name", "A"}, {"child", {{"name", "B"}}}};
 * find_by_attribute(doc, "name", "B"); // points to doc["child"]
 * ```
 */
const Value* find_by_attribute(const Value& document, const std::string& key,
                               const std::string& value,
                               const Options& options = Options{});

// The result points into the argument, so a temporary would leave it dangling.
const Value* find_by_attribute(Value&& document, const std::string& key,
                               const std::string& value,
                               const Options& options = Options{}) = delete;

} // namespace doctree

#endif // DOCTREE_SEARCH_HPP
