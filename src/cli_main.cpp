#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pathexpr/Errors.hpp"
#include "pathexpr/JsonAdapter.hpp"
#include "pathexpr/Loader.hpp"
#include "pathexpr/PathCache.hpp"
#include "pathexpr/Resolver.hpp"
#include "pathexpr/Tokenizer.hpp"

using nlohmann::json;
using namespace pathexpr;

namespace {

// Resolve the cache bound: CLI flag first, then PATHEXPR_MAX_CACHE_ENTRIES
CacheOptions cache_options_from(const cxxopts::ParseResult& result) {
    CacheOptions options;
    if (result.count("max-cache-entries")) {
        options.max_entries = result["max-cache-entries"].as<std::size_t>();
    } else if (auto env = get_env_var("PATHEXPR_MAX_CACHE_ENTRIES")) {
        try {
            options.max_entries = static_cast<std::size_t>(std::stoull(*env));
        } catch (const std::exception&) {
            throw Error("Invalid PATHEXPR_MAX_CACHE_ENTRIES: '" + *env + "'");
        }
    }
    return options;
}

json tokens_to_json(const TokenSequence& tokens) {
    json out = json::array();
    for (const auto& token : tokens) {
        json entry = {{"name", token.name}};
        entry["index"] = token.has_index() ? json(*token.index) : json(nullptr);
        out.push_back(entry);
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("pathexpr", "Resolve dotted path expressions against JSON/TOML documents");
        options.positional_help("COMMAND PATH");

        options.add_options()
            ("i,input", "Path to JSON/TOML document (default: JSON on stdin)", cxxopts::value<std::string>())
            ("max-cache-entries", "Bound the path cache (0 = unbounded)", cxxopts::value<std::size_t>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get PATH | exists PATH | tokenize PATH\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        if (cmdv.size() < 2) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }
        const std::string path = cmdv[1];

        PathCache cache(cache_options_from(result));

        // TOKENIZE (no document needed)
        if (cmd == "tokenize") {
            std::cout << tokens_to_json(*cache.get_or_add(path)).dump(2) << "\n";
            return 0;
        }

        if (cmd != "get" && cmd != "exists") {
            std::cerr << "Unknown command: " << cmd << "\n";
            return 1;
        }

        json document = result.count("input")
            ? load_document(result["input"].as<std::string>())
            : load_json_stream(std::cin, "<stdin>");
        const Value root = from_json(std::move(document));
        const Resolution resolution = try_resolve(root, path, cache);

        // GET
        if (cmd == "get") {
            if (!resolution.found) {
                std::cerr << "Path not found: " << path << "\n";
                return 1;
            }
            std::cout << to_json(resolution.value).dump(2) << "\n";
            return 0;
        }

        // EXISTS
        std::cout << (resolution.found ? "true" : "false") << "\n";
        return resolution.found ? 0 : 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
