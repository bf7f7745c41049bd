/**
 * @file Fold.hpp
 * @brief Fold a flat, denormalized record into one nested document
 */

#ifndef DOCTREE_FOLD_HPP
#define DOCTREE_FOLD_HPP

#include "doctree/Options.hpp"
#include "doctree/Value.hpp"

namespace doctree {

/**
 * @brief Fold dot-notation keys and lists of sub-records into nesting
 *
 * For each key of @p record, in order:
 * - list value: every document element is folded recursively and the
 *   results are combined per Options::fold_mode, then stored as a
 *   one-element list under the key; an empty list is kept as []; other
 *   elements are ignored
 * - key without '.': value copied as is
 * - dotted key: expand_path(key, value) unioned into the result
 *
 * @param record Flat record
 * @param options Fold mode, conflict policy, depth limit and diagnostics
 * @return Nested document; null if @p record is null
 * @throws TypeError if @p record is neither null nor a document
 *
 * Example:
 * ```cpp
 * fold_record({{"book.title", "Foundation"}, {"book.author", "Asimov"}});
 * // {"book": {"title": "Foundation", "author": "Asimov"}}
 * ```
 */
Value fold_record(const Value& record, const Options& options = Options{});

} // namespace doctree

#endif // DOCTREE_FOLD_HPP
