/**
 * @file Errors.hpp
 * @brief Exception types for pathexpr
 *
 * Path resolution itself never throws: malformed paths, missing members
 * and bad indices all degrade to a structural miss. The types below cover
 * caller misuse and the document-loading layer:
 * - Error: Base class
 * - NotSupportedError: Operation deliberately not implemented (back-conversion)
 * - FileNotFoundError: Input document not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: Unknown document extension
 */

#ifndef PATHEXPR_ERRORS_HPP
#define PATHEXPR_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace pathexpr {

/**
 * @brief Base class for all pathexpr exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Invoked operation is not supported by the callee
 *
 * Signals misuse by a caller, never a data condition.
 */
class NotSupportedError : public Error {
public:
    /**
     * @brief Construct with operation and owner names
     * @param operation Name of the rejected operation (e.g., "convert_back")
     * @param owner Type that rejects it (e.g., "PathExpressionConverter")
     */
    NotSupportedError(std::string operation, std::string owner)
        : Error(operation + " is not supported by " + owner + ".")
        , operation_(std::move(operation))
        , owner_(std::move(owner))
    {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    const std::string& owner() const noexcept {
        return owner_;
    }

private:
    std::string operation_;
    std::string owner_;
};

/**
 * @brief Input document not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("Document not found: " + path)
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
 * @brief Document parse error (JSON/TOML syntax)
 */
class DocumentParseError : public Error {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with the parse error
     * @param line 1-based line, or 0 when unknown
     * @param column 1-based column, or 0 when unknown
     * @param details Detailed error message from the parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : Error(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
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
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Document extension is neither .json nor .toml
 */
class UnsupportedFormatError : public Error {
public:
    explicit UnsupportedFormatError(std::string extension)
        : Error("Unsupported document type: '" + extension + "' (expected .json or .toml)")
        , extension_(std::move(extension))
    {}

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string extension_;
};

} // namespace pathexpr

#endif // PATHEXPR_ERRORS_HPP
