/**
 * @file Loader.hpp
 * @brief Reading documents and option files from disk
 *
 * JSON keeps key order. TOML dates and date-times become {"$date": "..."}
 * scalars and TOML times become strings.
 *
 * All loaders throw FileNotFoundError when @p path is not a regular file
 * and ParseError on syntax errors.
 */

#ifndef DOCTREE_LOADER_HPP
#define DOCTREE_LOADER_HPP

#include "doctree/Value.hpp"
#include <string>

namespace doctree {

Value load_json_file(const std::string& path);

Value load_toml_file(const std::string& path);

/**
 * @brief Load a .json or .toml file, chosen by extension (case-insensitive)
 * @throws ParseError for any other extension
 */
Value load_document_file(const std::string& path);

/// Lowercased extension with its dot (".json"), or "" when there is none.
std::string get_file_extension(const std::string& path);

} // namespace doctree

#endif // DOCTREE_LOADER_HPP
