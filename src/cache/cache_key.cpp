#include <functional>
#include <string>
#include <payplan/cache/cache_key.h>
#include <payplan/crypto/hasher.h>

namespace payplan::cache {

CacheKey CacheKey::fromInput(std::string_view normalizedText, std::string_view timezone,
                             extraction::DateLocale locale, bool deduplicate,
                             size_t snippetLength) {
    CacheKey key;
    key.timezone_ = std::string(timezone);
    key.locale_ = locale;

    crypto::SHA256Hasher hasher;
    hasher.init();
    hasher.updateField(normalizedText);
    hasher.updateField(timezone);
    hasher.updateField(extraction::dateLocaleToString(locale));
    if (deduplicate) {
        hasher.updateField("dedup");
    }
    if (snippetLength != extraction::kDefaultSnippetLength) {
        hasher.updateField("snippet:" + std::to_string(snippetLength));
    }
    key.keyString_ = hasher.finalize();

    key.hashValue_ = std::hash<std::string>{}(key.keyString_);
    return key;
}

} // namespace payplan::cache
