/**
 * @file Resolver.hpp
 * @brief Path traversal over a Value graph
 *
 * Resolution walks the tokens of a path against a root value:
 * - A named token reads that public member of the current object
 * - An indexed token then indexes into the current value, which must be a
 *   Sequence, with 0 <= index < size()
 * - A null intermediate stops the walk; the result is found-and-null
 *
 * Resolution never throws. Every data-shape problem (null root, blank path,
 * unknown member, non-indexable value, index out of range, malformed
 * indexer) is a structural miss: found == false, value null.
 */

#ifndef PATHEXPR_RESOLVER_HPP
#define PATHEXPR_RESOLVER_HPP

#include "pathexpr/Value.hpp"
#include "pathexpr/Tokenizer.hpp"
#include "pathexpr/PathCache.hpp"

#include <string_view>

namespace pathexpr {

/**
 * @brief Outcome of a resolution
 *
 * found == false: the path could not be followed (value is null).
 * found == true: the path was followed; value may still be null.
 */
struct Resolution {
    bool found = false;
    Value value;

    explicit operator bool() const noexcept { return found; }
};

/**
 * @brief Resolve a path against a root value
 *
 * @param root Root of the object graph (null root is a miss)
 * @param path Path expression (empty or all-whitespace path is a miss)
 * @param cache Token cache to consult (defaults to PathCache::global())
 * @return Found flag and resolved value
 *
 * Examples:
 * ```cpp
 * try_resolve(model, "Child.Name");        // {true, "Test Child"}
 * try_resolve(model, "Child.Missing");     // {false, null}
 * try_resolve(model_without_child, "Child.Name"); // {true, null}
 * ```
 */
Resolution try_resolve(const Value& root, std::string_view path, PathCache& cache);
Resolution try_resolve(const Value& root, std::string_view path);

/**
 * @brief try_resolve() accepting a possibly-null C string
 *
 * A nullptr path is a miss.
 */
Resolution try_resolve(const Value& root, const char* path);

/**
 * @brief Resolve a path, collapsing misses to null
 *
 * Callers that cannot distinguish "no such path" from "path resolved to
 * null" use this form.
 */
Value resolve_path(const Value& root, std::string_view path, PathCache& cache);
Value resolve_path(const Value& root, std::string_view path);
Value resolve_path(const Value& root, const char* path);

/**
 * @brief Apply an already tokenized path to a root value
 *
 * No blank-path check happens here: an empty token sequence resolves to
 * the root itself.
 */
Resolution apply_tokens(const Value& root, const TokenSequence& tokens);

} // namespace pathexpr

#endif // PATHEXPR_RESOLVER_HPP
