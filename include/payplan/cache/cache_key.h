#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <payplan/extraction/item.h>
#include <payplan/extraction/redaction.h>

namespace payplan::cache {

/**
 * @brief Identity of one extraction request
 *
 * The key string is the SHA-256 hex digest of the normalized text, the timezone and the
 * date locale, so the same text under a different locale is a different entry. Options that
 * reshape the result (de-duplication, snippet length) are folded in only when they differ
 * from the defaults.
 */
class CacheKey {
public:
    /**
     * @brief Build a key from already-normalized email text and the options that affect output
     */
    static CacheKey fromInput(std::string_view normalizedText, std::string_view timezone,
                              extraction::DateLocale locale, bool deduplicate = false,
                              size_t snippetLength = extraction::kDefaultSnippetLength);

    CacheKey() = default;

    size_t hash() const { return hashValue_; }

    const std::string& toString() const { return keyString_; }

    const std::string& timezone() const { return timezone_; }
    extraction::DateLocale locale() const { return locale_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }

    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    std::string keyString_;
    size_t hashValue_ = 0;
    std::string timezone_;
    extraction::DateLocale locale_ = extraction::DateLocale::US;
};

/**
 * @brief Hash function for CacheKey (for use in unordered containers)
 */
struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

} // namespace payplan::cache
