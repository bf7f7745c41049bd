/**
 * @file Errors.hpp
 * @brief Exception hierarchy for doctree
 *
 * Every exception derives from DocumentError. Errors raised while walking
 * a document derive from LocatedError and carry the dot-path where the
 * walk stopped ("" for the root).
 */

#ifndef DOCTREE_ERRORS_HPP
#define DOCTREE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace doctree {

class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base for errors tied to a position inside a document
 */
class LocatedError : public DocumentError {
public:
    LocatedError(std::string path, const std::string& message)
        : DocumentError(message + " at '" + path + "'")
        , path_(std::move(path))
    {}

    /// Dot-path of the offending value
    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A sequence cannot be reduced to a representative element
 *
 * Raised for empty sequences, scalar-led sequences shorter than two
 * elements, and nested sequences that do not start with a document.
 */
class MalformedSequence : public LocatedError {
public:
    MalformedSequence(std::string path, std::size_t size, const std::string& reason)
        : LocatedError(std::move(path), "Malformed sequence of size " +
                                            std::to_string(size) + " (" + reason + ")")
        , size_(size)
    {}

    std::size_t size() const noexcept { return size_; }

private:
    std::size_t size_;
};

/**
 * @brief Non-mergeable values under one key with ConflictPolicy::Error
 *
 * first() and second() hold the type names of the two values.
 */
class MergeConflict : public LocatedError {
public:
    MergeConflict(std::string path, std::string first, std::string second)
        : LocatedError(std::move(path), "Merge conflict between " + first + " and " + second)
        , first_(std::move(first))
        , second_(std::move(second))
    {}

    const std::string& first() const noexcept { return first_; }
    const std::string& second() const noexcept { return second_; }

private:
    std::string first_;
    std::string second_;
};

class DepthLimitExceeded : public LocatedError {
public:
    DepthLimitExceeded(std::string path, std::size_t limit)
        : LocatedError(std::move(path), "Nesting deeper than " + std::to_string(limit))
        , limit_(limit)
    {}

    std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t limit_;
};

/**
 * @brief Value has the wrong type for the requested operation
 * @param expected Expected type name (e.g., "object")
 * @param actual Type name found (see type_name())
 */
class TypeError : public LocatedError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : LocatedError(std::move(path), "Expected " + expected + " but got " + actual)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Required key missing; path() is e.g. "[2]" for a list element
 */
class KeyError : public LocatedError {
public:
    KeyError(std::string path, std::string key)
        : LocatedError(std::move(path), "Missing key '" + key + "'")
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class FileNotFoundError : public DocumentError {
public:
    explicit FileNotFoundError(std::string path)
        : DocumentError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief JSON or TOML syntax error in an input file
 */
class ParseError : public DocumentError {
public:
    ParseError(std::string file, std::string details)
        : DocumentError("Cannot parse '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }

    /// Message reported by the underlying parser
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Invalid value for a setting in Options or on the command line
 */
class OptionError : public DocumentError {
public:
    OptionError(std::string option, const std::string& details)
        : DocumentError("Invalid option '" + option + "': " + details)
        , option_(std::move(option))
    {}

    const std::string& option() const noexcept { return option_; }

private:
    std::string option_;
};

} // namespace doctree

#endif // DOCTREE_ERRORS_HPP
