/**
 * @file Normalize.hpp
 * @brief Replace list-valued fields by a single representative value
 *
 * normalize() walks a document and rewrites every sequence:
 * - [] stays []
 * - [scalar] becomes the bare scalar
 * - anything else becomes reduce_sequence(seq)
 *
 * Fields of unrecognized kind (null, float, object id) are dropped and
 * reported to Options::diagnostics.
 */

#ifndef DOCTREE_NORMALIZE_HPP
#define DOCTREE_NORMALIZE_HPP

#include "doctree/Options.hpp"
#include "doctree/Value.hpp"

namespace doctree {

/**
 * @brief Normalize every sequence in a document, recursively
 *
 * @param document Input document
 * @param options Depth limit and diagnostics
 * @return New document; null if @p document is null
 * @throws TypeError if @p document is neither null nor a document
 * @throws MalformedSequence if a sequence has no representative element
 *
 * Examples:
 * ```cpp
 * normalize({{"tags", {"solo"}}});
 * // {"tags": "solo"}
 *
 * normalize({{"authors", {{{"name", "Asimov"}}, {{"name", "Clarke"}}}}});
 * // {"authors": {"name": "Asimov"}}
 * ```
 */
Value normalize(const Value& document, const Options& options = Options{});

/**
 * @brief Reduce a sequence to a document built from its first element
 *
 * - first element is a document: that document, normalized
 * - first element is a sequence: its own first element (which must be a
 *   document), normalized
 * - first element is a scalar: {string form of seq[0]: seq[1]}
 *
 * @param sequence Input sequence
 * @return Representative document; null if @p sequence is null
 * @throws TypeError if @p sequence is neither null nor an array
 * @throws MalformedSequence if the sequence is empty, starts with a value
 *         of unrecognized kind, a nested sequence does not start with a
 *         document, or a scalar-led sequence has fewer than two elements
 */
Value reduce_sequence(const Value& sequence, const Options& options = Options{});

} // namespace doctree

#endif // DOCTREE_NORMALIZE_HPP
