/**
 * @file Resolver.cpp
 * @brief Implementation of path traversal
 */

#include "pathexpr/Resolver.hpp"

#include <algorithm>
#include <cctype>

namespace pathexpr {

namespace {
    bool is_blank(std::string_view path) {
        return std::all_of(path.begin(), path.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
    }
}

Resolution apply_tokens(const Value& root, const TokenSequence& tokens) {
    Value current = root;

    for (const auto& token : tokens) {
        if (current.is_null()) {
            break;
        }

        if (!token.name.empty()) {
            const PathResolvable* object = current.as_object();
            if (object == nullptr) {
                return {};
            }
            auto member = object->get_member(token.name);
            if (!member) {
                return {};
            }
            current = std::move(*member);
        }

        if (token.has_index() && !current.is_null()) {
            const Sequence* sequence = current.as_sequence();
            if (sequence == nullptr) {
                return {};
            }
            if (*token.index >= sequence->size()) {
                return {};
            }
            current = sequence->at(*token.index);
        }
    }

    return {true, std::move(current)};
}

Resolution try_resolve(const Value& root, std::string_view path, PathCache& cache) {
    if (root.is_null() || is_blank(path)) {
        return {};
    }
    const auto tokens = cache.get_or_add(path);
    return apply_tokens(root, *tokens);
}

Resolution try_resolve(const Value& root, std::string_view path) {
    return try_resolve(root, path, PathCache::global());
}

Resolution try_resolve(const Value& root, const char* path) {
    if (path == nullptr) {
        return {};
    }
    return try_resolve(root, std::string_view(path), PathCache::global());
}

Value resolve_path(const Value& root, std::string_view path, PathCache& cache) {
    auto result = try_resolve(root, path, cache);
    return result.found ? std::move(result.value) : Value();
}

Value resolve_path(const Value& root, std::string_view path) {
    return resolve_path(root, path, PathCache::global());
}

Value resolve_path(const Value& root, const char* path) {
    if (path == nullptr) {
        return Value();
    }
    return resolve_path(root, std::string_view(path), PathCache::global());
}

} // namespace pathexpr
