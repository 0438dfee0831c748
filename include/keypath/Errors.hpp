/**
 * @file Errors.hpp
 * @brief Exception types for keypath
 *
 * Error taxonomy:
 * - Error: Base class
 * - SchemaError: Defect in a schema graph, detected when the graph is built
 *   - DanglingReferenceError: Reference names no definition
 *   - CircularAliasError: References loop without any structure in between
 * - FileNotFoundError: Schema or data file not found
 * - SchemaParseError: JSON/TOML syntax errors or malformed schema documents
 * - InvalidPathError: Path is malformed or not valid for a schema
 * - KeyError: Path segment not present in a data value
 * - TypeError: Traversal into a value of the wrong kind
 *
 * Path resolution itself never throws: an unresolvable path is reported
 * as an empty std::optional.
 */

#ifndef KEYPATH_ERRORS_HPP
#define KEYPATH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace keypath {

/**
 * @brief Base class for all keypath exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base class for schema graph construction defects
 */
class SchemaError : public Error {
public:
    using Error::Error;
};

/**
 * @brief A Reference names a definition that does not exist
 */
class DanglingReferenceError : public SchemaError {
public:
    /**
     * @brief Construct with the missing definition name
     * @param name Name used by the Reference node
     */
    explicit DanglingReferenceError(std::string name)
        : SchemaError("Reference to undefined schema '" + name + "'")
        , name_(std::move(name))
    {}

    /**
     * @brief Get the name that could not be resolved
     */
    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Definitions alias each other without any structural node between
 *
 * Example: A = @B, B = @A. Such a graph describes no value.
 */
class CircularAliasError : public SchemaError {
public:
    /**
     * @brief Construct with the chain of names forming the loop
     * @param chain Names in visiting order, first name repeated at the end
     */
    explicit CircularAliasError(std::vector<std::string> chain)
        : SchemaError(format_message(chain))
        , chain_(std::move(chain))
    {}

    const std::vector<std::string>& chain() const noexcept {
        return chain_;
    }

private:
    std::vector<std::string> chain_;

    static std::string format_message(const std::vector<std::string>& chain) {
        std::ostringstream oss;
        oss << "Circular schema alias: ";
        for (size_t i = 0; i < chain.size(); ++i) {
            if (i > 0) oss << " -> ";
            oss << chain[i];
        }
        return oss.str();
    }
};

/**
 * @brief Schema or data file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Schema document parse error (JSON/TOML syntax or bad schema shape)
 */
class SchemaParseError : public Error {
public:
    /**
     * @brief Construct with source name and error details
     * @param source File path, or "<json>" for in-memory documents
     * @param details Detailed error message
     */
    SchemaParseError(std::string source, std::string details)
        : Error("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

/**
 * @brief Path is malformed, or not valid for the schema it is used with
 */
class InvalidPathError : public Error {
public:
    /**
     * @brief Construct with the offending path and a reason
     * @param path The path text
     * @param reason Why it was rejected (e.g., "malformed")
     */
    InvalidPathError(std::string path, const std::string& reason)
        : Error("Invalid path '" + path + "': " + reason)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Key or index not present in a data value
 */
class KeyError : public Error {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full path being accessed (e.g., "items[3].name")
     * @param segment The specific segment that doesn't exist (e.g., "[3]")
     */
    KeyError(std::string path, std::string segment)
        : Error("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    /**
     * @brief Get the full path that was being accessed
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the specific segment that was not found
     */
    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during data traversal
 *
 * Raised when a field segment meets a non-object, or an index segment
 * meets a non-array.
 */
class TypeError : public Error {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full path being accessed
     * @param expected Expected type (e.g., "array")
     * @param actual Actual type encountered (e.g., "string")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : Error("Cannot traverse into " + actual +
                " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace keypath

#endif // KEYPATH_ERRORS_HPP
