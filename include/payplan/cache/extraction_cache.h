#pragma once

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <payplan/cache/cache_key.h>
#include <payplan/cache/cache_stats.h>
#include <payplan/extraction/item.h>

namespace payplan::cache {

/**
 * @brief Thread-safe memo of extraction results
 *
 * Entries live until clear(); there is no TTL and no eviction. A hit returns the stored
 * result unchanged, including the Item ids assigned when it was first extracted.
 */
class ExtractionCache {
public:
    struct CacheEntry {
        CacheKey key;
        extraction::ExtractionResult result;
        TimePoint createdAt;
    };

    ExtractionCache() = default;

    ExtractionCache(const ExtractionCache&) = delete;
    ExtractionCache& operator=(const ExtractionCache&) = delete;

    /**
     * @brief Get a cached result
     * @return nullopt if not found; counts a hit or a miss
     */
    std::optional<extraction::ExtractionResult> get(const CacheKey& key);

    /**
     * @brief Store a result, replacing any entry under the same key
     */
    void put(const CacheKey& key, const extraction::ExtractionResult& result);

    /**
     * @brief Check if key exists; does not touch the counters
     */
    bool contains(const CacheKey& key) const;

    /**
     * @brief Account for a call that skipped the cache
     *
     * Neither reads nor writes an entry. Counts a miss only when the key is absent.
     */
    void recordBypass(const CacheKey& key);

    /**
     * @brief Remove all entries and reset the counters
     */
    void clear();

    size_t size() const;

    CacheStats getStats() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> cache_;
    mutable CacheStats stats_;
};

} // namespace payplan::cache
