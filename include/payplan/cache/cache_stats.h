#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace payplan::cache {

/**
 * @brief Counters for the extraction cache
 */
struct CacheStats {
    std::atomic<uint64_t> hits{0};       ///< Number of cache hits
    std::atomic<uint64_t> misses{0};     ///< Number of cache misses, bypassed calls included
    std::atomic<uint64_t> insertions{0}; ///< Number of insertions
    std::atomic<size_t> currentSize{0};  ///< Current number of entries

    CacheStats() = default;

    // Copy constructor (needed because of atomic members)
    CacheStats(const CacheStats& other) {
        hits.store(other.hits.load());
        misses.store(other.misses.load());
        insertions.store(other.insertions.load());
        currentSize.store(other.currentSize.load());
    }

    // Assignment operator (needed because of atomic members)
    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            insertions.store(other.insertions.load());
            currentSize.store(other.currentSize.load());
        }
        return *this;
    }

    /**
     * @brief Fraction of lookups that hit, 0 when nothing was looked up
     */
    double hitRate() const {
        uint64_t total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / total : 0.0;
    }

    /**
     * @brief Hit rate in percent
     */
    double hitRateRaw() const { return hitRate() * 100.0; }

    void reset() {
        hits.store(0);
        misses.store(0);
        insertions.store(0);
        currentSize.store(0);
    }
};

} // namespace payplan::cache
