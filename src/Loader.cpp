/**
 * @file Loader.cpp
 * @brief Document loading implementation
 */

#include "pathexpr/Loader.hpp"
#include "pathexpr/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace pathexpr {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

template <typename T>
std::string stream_to_string(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert a toml++ node to nlohmann::json.
 */
nlohmann::json toml_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return nlohmann::json(node.as_string()->get());

        case toml::node_type::integer:
            return nlohmann::json(node.as_integer()->get());

        case toml::node_type::floating_point:
            return nlohmann::json(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return nlohmann::json(node.as_boolean()->get());

        case toml::node_type::date:
            return nlohmann::json(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return nlohmann::json(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return nlohmann::json(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_json(val);
            }
            return obj;
        }

        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json load_json_stream(std::istream& in, const std::string& source_name) {
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(source_name, 0, 0, e.what());
    }
}

nlohmann::json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    return load_json_stream(file, path);
}

nlohmann::json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

nlohmann::json load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormatError(ext);
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace pathexpr
