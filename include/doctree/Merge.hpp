/**
 * @file Merge.hpp
 * @brief Deep, non-mutating union of two documents
 *
 * Merging rules:
 * - Key only in one document: copied unchanged
 * - Key in both, both values documents: recursive union
 * - Key in both otherwise: resolved by Options::conflict
 *   (DropOnConflict writes nothing for the key)
 *
 * Keys from the first document come first, in their original order,
 * followed by keys found only in the second document.
 */

#ifndef DOCTREE_MERGE_HPP
#define DOCTREE_MERGE_HPP

#include "doctree/Options.hpp"
#include "doctree/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace doctree {

/**
 * @brief Deep union of two documents
 *
 * @param first First document (its key order wins)
 * @param second Second document
 * @param options Conflict policy, depth limit and diagnostics
 * @return Merged document; null if either argument is null; @p second if
 *         @p first is empty; @p first if @p second is empty
 * @throws TypeError if a non-null argument is not a document
 * @throws MergeConflict under ConflictPolicy::Error
 * @throws DepthLimitExceeded if nesting is deeper than options.max_depth
 *
 * Examples:
 * ```cpp
 * union_documents({{"a", 1}}, {{"b", 2}});
 * // {"a": 1, "b": 2}
 *
 * union_documents({{"a", {{"x", 1}}}}, {{"a", {{"y", 2}}}});
 * // {"a": {"x": 1, "y": 2}}
 *
 * union_documents({{"a", 1}}, {{"a", 2}});
 * // {} with DropOnConflict
 * ```
 */
Value union_documents(const Value& first, const Value& second,
                      const Options& options = Options{});

/**
 * @brief Union several documents left to right
 *
 * @param documents Documents in order
 * @return Union of all; empty document for an empty list
 */
Value union_all(const std::vector<Value>& documents,
                const Options& options = Options{});

namespace detail {

/// Union of two documents located at @p path, @p depth levels below the root.
Value union_at(const Value& first, const Value& second, const Options& options,
               const std::string& path, std::size_t depth);

} // namespace detail

} // namespace doctree

#endif // DOCTREE_MERGE_HPP
