/**
 * @file PathCache.cpp
 * @brief Implementation of the path token cache
 */

#include "pathexpr/PathCache.hpp"

#include <mutex>

namespace pathexpr {

std::shared_ptr<const TokenSequence> PathCache::get_or_add(std::string_view path) {
    std::string key(path);

    if (!bounded()) {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second.tokens;
        }
    } else {
        // Recency update mutates the list, so hits take the exclusive lock
        std::unique_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            recency_.splice(recency_.begin(), recency_, it->second.recency);
            return it->second.tokens;
        }
    }

    // Tokenize outside the lock
    auto tokens = std::make_shared<const TokenSequence>(tokenize_path(path));
    tokenize_count_.fetch_add(1, std::memory_order_relaxed);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(key, Entry{tokens, {}});
    if (!inserted) {
        if (bounded()) {
            recency_.splice(recency_.begin(), recency_, it->second.recency);
        }
        return it->second.tokens;
    }

    if (bounded()) {
        recency_.push_front(key);
        it->second.recency = recency_.begin();
        while (entries_.size() > options_.max_entries) {
            entries_.erase(recency_.back());
            recency_.pop_back();
        }
    }

    return tokens;
}

std::size_t PathCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void PathCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    recency_.clear();
}

PathCache& PathCache::global() {
    static PathCache cache;
    return cache;
}

} // namespace pathexpr
