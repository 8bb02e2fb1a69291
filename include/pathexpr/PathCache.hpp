/**
 * @file PathCache.hpp
 * @brief Thread-safe memo of tokenized path expressions
 *
 * Path strings are few and static (authored in markup or config), so the
 * default cache keeps every entry for the process lifetime. Keys are the
 * raw path string, compared exactly (no trimming, case-sensitive).
 *
 * A bounded mode (CacheOptions::max_entries > 0) evicts the least recently
 * used entry instead, for hosts that generate paths dynamically.
 */

#ifndef PATHEXPR_PATHCACHE_HPP
#define PATHEXPR_PATHCACHE_HPP

#include "pathexpr/Tokenizer.hpp"

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pathexpr {

/**
 * @brief Cache configuration
 */
struct CacheOptions {
    /// Maximum number of cached paths; 0 means unbounded
    std::size_t max_entries = 0;
};

/**
 * @brief Lookup-or-insert memo from path string to token sequence
 *
 * Concurrent lookups and concurrent first insertions are safe. When two
 * callers race on the same new key both may tokenize; the first insert
 * wins and both receive an identical, complete sequence. Sequences are
 * immutable and shared, so eviction never invalidates one already handed
 * out.
 */
class PathCache {
public:
    PathCache() = default;
    explicit PathCache(CacheOptions options) : options_(options) {}

    PathCache(const PathCache&) = delete;
    PathCache& operator=(const PathCache&) = delete;

    /**
     * @brief Get the tokens for a path, tokenizing on first use
     * @param path Raw path string (cache key)
     * @return Shared, immutable token sequence (never null)
     */
    std::shared_ptr<const TokenSequence> get_or_add(std::string_view path);

    /**
     * @brief Number of cached paths
     */
    std::size_t size() const;

    /**
     * @brief Number of tokenizations performed so far
     *
     * Counts cache misses, including tokenizations that lost an insert race.
     * Monotonic; clear() does not reset it.
     */
    std::size_t tokenize_count() const noexcept {
        return tokenize_count_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Drop all cached entries
     */
    void clear();

    const CacheOptions& options() const noexcept {
        return options_;
    }

    /**
     * @brief Process-wide cache shared by default resolution calls
     */
    static PathCache& global();

private:
    struct Entry {
        std::shared_ptr<const TokenSequence> tokens;
        std::list<std::string>::iterator recency;
    };

    bool bounded() const noexcept { return options_.max_entries != 0; }

    CacheOptions options_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> recency_; // bounded mode only; front = most recent
    std::atomic<std::size_t> tokenize_count_{0};
};

} // namespace pathexpr

#endif // PATHEXPR_PATHCACHE_HPP
