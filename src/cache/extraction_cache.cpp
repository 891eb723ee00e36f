#include <spdlog/spdlog.h>
#include <mutex>
#include <payplan/cache/extraction_cache.h>

namespace payplan::cache {

std::optional<extraction::ExtractionResult> ExtractionCache::get(const CacheKey& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        stats_.misses.fetch_add(1);
        return std::nullopt;
    }

    stats_.hits.fetch_add(1);
    spdlog::debug("Extraction cache hit ({} items, {} issues)", it->second.result.items.size(),
                  it->second.result.issues.size());
    return it->second.result;
}

void ExtractionCache::put(const CacheKey& key, const extraction::ExtractionResult& result) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    CacheEntry entry{key, result, std::chrono::system_clock::now()};
    const bool inserted = cache_.insert_or_assign(key, std::move(entry)).second;

    stats_.insertions.fetch_add(1);
    stats_.currentSize.store(cache_.size());
    if (!inserted) {
        spdlog::debug("Replaced cached extraction result");
    }
}

bool ExtractionCache::contains(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.find(key) != cache_.end();
}

void ExtractionCache::recordBypass(const CacheKey& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (cache_.find(key) == cache_.end()) {
        stats_.misses.fetch_add(1);
    }
}

void ExtractionCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    stats_.reset();
}

size_t ExtractionCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

CacheStats ExtractionCache::getStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    CacheStats stats = stats_;
    stats.currentSize.store(cache_.size());
    return stats;
}

} // namespace payplan::cache
