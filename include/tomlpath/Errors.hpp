/**
 * @file Errors.hpp
 * @brief Exception types for tomlpath errors
 *
 * Error taxonomy:
 * - PathError: Base class for path addressing errors
 *   - TokenizeError: Path string is malformed (document never touched)
 *     - EmptyQueryError, EmptyIdentifier, ArrayAccessWithoutIndex
 *   - StructureError: Path is inconsistent with the document shape
 *     - NoIndexInTable, NoIdentifierInArray, QueryingValueAsTable,
 *       QueryingValueAsArray, IndexOutOfBounds
 *   - TypeError: Resolved value has an unexpected tag
 *   - NotAvailable: Typed getter found nothing at the path
 *   - CannotDeleteNonEmpty: Removal of a populated container
 * - DocumentError: Base class for TOML text/file errors
 *   - FileNotFoundError, DocumentParseError
 *
 * Absence of a node is never an error; it is reported by return value.
 */

#ifndef TOMLPATH_ERRORS_HPP
#define TOMLPATH_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tomlpath {

/**
 * @brief Base class for all path addressing errors
 */
class PathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Tokenizer errors
// ============================================================================

/**
 * @brief Base class for errors raised before any document access
 */
class TokenizeError : public PathError {
public:
    using PathError::PathError;
};

/**
 * @brief The path string is empty
 */
class EmptyQueryError : public TokenizeError {
public:
    EmptyQueryError()
        : TokenizeError("Empty query: a path needs at least one segment")
    {}
};

/**
 * @brief A path segment is empty after splitting
 *
 * Raised for leading, trailing or doubled separators ("." , "a.", "a..b").
 */
class EmptyIdentifier : public TokenizeError {
public:
    explicit EmptyIdentifier(std::string path)
        : TokenizeError("Empty identifier in path '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the full path that was being tokenized
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief A bracketed segment does not hold an integer
 *
 * Raised for "[]", "[a]", "[1.5]" and indices that overflow int64.
 */
class ArrayAccessWithoutIndex : public TokenizeError {
public:
    explicit ArrayAccessWithoutIndex(std::string segment)
        : TokenizeError("Array access without valid index: '" + segment + "'")
        , segment_(std::move(segment))
    {}

    /**
     * @brief Get the offending segment, brackets included
     */
    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string segment_;
};

// ============================================================================
// Structural errors
// ============================================================================

/**
 * @brief Base class for paths that do not fit the document shape
 *
 * Carries the path prefix walked up to and including the failing segment.
 */
class StructureError : public PathError {
public:
    StructureError(std::string path, const std::string& message)
        : PathError(message + " at path '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the path prefix up to the failing segment
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief An index segment was applied to a table
 */
class NoIndexInTable : public StructureError {
public:
    NoIndexInTable(std::string path, std::int64_t index)
        : StructureError(std::move(path),
                         "Cannot use index " + std::to_string(index) + " on a Table")
        , index_(index)
    {}

    std::int64_t index() const noexcept {
        return index_;
    }

private:
    std::int64_t index_;
};

/**
 * @brief An identifier segment was applied to an array
 */
class NoIdentifierInArray : public StructureError {
public:
    NoIdentifierInArray(std::string path, std::string key)
        : StructureError(std::move(path), "Cannot use key '" + key + "' on an Array")
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief An identifier segment was applied to a scalar
 */
class QueryingValueAsTable : public StructureError {
public:
    QueryingValueAsTable(std::string path, std::string key, std::string actual)
        : StructureError(std::move(path),
                         "Cannot look up key '" + key + "' in " + actual)
        , key_(std::move(key))
        , actual_(std::move(actual))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    /**
     * @brief Get the tag name of the scalar that was hit
     */
    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string key_;
    std::string actual_;
};

/**
 * @brief An index segment was applied to a scalar
 */
class QueryingValueAsArray : public StructureError {
public:
    QueryingValueAsArray(std::string path, std::int64_t index, std::string actual)
        : StructureError(std::move(path),
                         "Cannot use index " + std::to_string(index) + " on " + actual)
        , index_(index)
        , actual_(std::move(actual))
    {}

    std::int64_t index() const noexcept {
        return index_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::int64_t index_;
    std::string actual_;
};

/**
 * @brief Index past the end of an array where no append is allowed
 */
class IndexOutOfBounds : public StructureError {
public:
    IndexOutOfBounds(std::string path, std::int64_t index, std::size_t size)
        : StructureError(std::move(path),
                         "Index " + std::to_string(index) +
                         " out of bounds for Array of size " + std::to_string(size))
        , index_(index)
        , size_(size)
    {}

    std::int64_t index() const noexcept {
        return index_;
    }

    std::size_t size() const noexcept {
        return size_;
    }

private:
    std::int64_t index_;
    std::size_t size_;
};

// ============================================================================
// Value errors
// ============================================================================

/**
 * @brief Resolved value's tag does not match the caller's expectation
 */
class TypeError : public PathError {
public:
    /**
     * @brief Construct with expected and actual tag names
     * @param expected Expected type (e.g., "Integer")
     * @param actual Actual type encountered (e.g., "String")
     */
    TypeError(std::string expected, std::string actual)
        : PathError("Type error: expected " + expected + ", found " + actual)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A typed getter found nothing at the path
 */
class NotAvailable : public PathError {
public:
    explicit NotAvailable(std::string path)
        : PathError("Value not available at path '" + path + "'")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Attempt to remove a Table or Array that still has entries
 */
class CannotDeleteNonEmpty : public PathError {
public:
    CannotDeleteNonEmpty(std::string path, std::string actual)
        : PathError("Cannot delete non-empty " + actual + " at path '" + path + "'")
        , path_(std::move(path))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string actual_;
};

// ============================================================================
// Document (format layer) errors
// ============================================================================

/**
 * @brief Base class for TOML text and file errors
 */
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public DocumentError {
public:
    explicit FileNotFoundError(std::string path)
        : DocumentError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief TOML syntax error
 */
class DocumentParseError : public DocumentError {
public:
    /**
     * @brief Construct with source name, position and parser message
     * @param source File path or "string" for in-memory text
     * @param line 1-based line of the error (0 if unknown)
     * @param column 1-based column of the error (0 if unknown)
     * @param details Message from the TOML parser
     */
    DocumentParseError(std::string source, int line, int column, std::string details)
        : DocumentError("Parse error in '" + source + "' at line " +
                        std::to_string(line) + ", column " + std::to_string(column) +
                        ": " + details)
        , source_(std::move(source))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    int line_;
    int column_;
    std::string details_;
};

} // namespace tomlpath

#endif // TOMLPATH_ERRORS_HPP
