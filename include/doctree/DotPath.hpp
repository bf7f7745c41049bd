/**
 * @file DotPath.hpp
 * @brief Dotted field paths ("book.author")
 *
 * Empty segments are skipped when splitting: "a..b" names the same field
 * as "a.b", and "..." names nothing at all.
 */

#ifndef DOCTREE_DOTPATH_HPP
#define DOCTREE_DOTPATH_HPP

#include "Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace doctree {

/// "a.b.c" -> {"a", "b", "c"}; "" and "..." -> {}
std::vector<std::string> split_dot_path(const std::string& path);

/// Path of @p key below @p parent; a root parent ("") yields @p key.
std::string child_path(const std::string& parent, const std::string& key);

/**
 * @brief Smallest document that holds @p value at @p path
 *
 * expand_path("book.author", "Asimov") gives {"book": {"author": "Asimov"}}.
 * A path without segments yields std::nullopt.
 */
std::optional<Value> expand_path(const std::string& path, const Value& value);

/// Same, from pre-split segments. No segments, or an empty one, yields std::nullopt.
std::optional<Value> expand_path(const std::vector<std::string>& segments, const Value& value);

/**
 * @brief Look up a dotted path, descending through documents only
 *
 * The empty path returns &data. Returns nullptr when a segment is missing
 * or the walk meets a sequence or scalar before the path is used up.
 */
const Value* get_by_dot(const Value& data, const std::string& path);

} // namespace doctree

#endif // DOCTREE_DOTPATH_HPP
