/**
 * @file Loader.hpp
 * @brief Document loading for path authoring and diagnostics
 *
 * Loads sample object graphs from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * TOML tables map to JSON objects, TOML arrays to JSON arrays; dates and
 * times become their TOML string form.
 */

#ifndef PATHEXPR_LOADER_HPP
#define PATHEXPR_LOADER_HPP

#include <nlohmann/json.hpp>

#include <istream>
#include <optional>
#include <string>

namespace pathexpr {

/**
 * @brief Load a document from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file.
 *
 * @param path Path to the TOML file
 * @return Parsed document as JSON
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Parse a JSON document from a stream (e.g. stdin).
 *
 * @param in Input stream
 * @param source_name Name used in error messages
 * @throws DocumentParseError if JSON syntax is invalid
 */
nlohmann::json load_json_stream(std::istream& in, const std::string& source_name);

/**
 * @brief Load a document, detecting the format by extension.
 *
 * @param path Path to a .json or .toml file
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if the file has syntax errors
 * @throws UnsupportedFormatError if extension is not .json or .toml
 */
nlohmann::json load_document(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Get environment variable value.
 *
 * @param name Variable name
 * @return Value if exists, nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

} // namespace pathexpr

#endif // PATHEXPR_LOADER_HPP
