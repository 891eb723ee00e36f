#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <payplan/extraction/item.h>

namespace payplan::extraction {

/**
 * @brief A successful match of one field strategy
 *
 * captures[0] is the primary capture (amount text, date text, installment number).
 */
struct FieldMatch {
    std::vector<std::string> captures;
    size_t position = 0;
};

/// One way of locating a field in email text. Strategies are tried in order.
using MatchStrategy = std::function<std::optional<FieldMatch>(std::string_view)>;

/// Decides whether an email belongs to a provider.
using DetectorMatcher = std::function<bool(std::string_view)>;

/**
 * @brief Detection and extraction patterns for one provider
 */
struct ProviderPatterns {
    Provider provider = Provider::Unknown;
    std::vector<DetectorMatcher> detectors;
    std::vector<MatchStrategy> amountPatterns;
    std::vector<MatchStrategy> datePatterns;
    std::vector<MatchStrategy> installmentPatterns;
    std::vector<MatchStrategy> finalPaymentPatterns;
    int planLength = 0; ///< Installments in the standard plan, 0 when it varies
};

// Strategy builders

/// Case-insensitive ECMAScript regex; the first capture group becomes captures[0].
MatchStrategy regexStrategy(const std::string& pattern, bool caseInsensitive = true);

/// Case-insensitive substring detector.
DetectorMatcher substringDetector(std::string needle);

/// Case-insensitive regex detector.
DetectorMatcher regexDetector(const std::string& pattern);

/// Matches when the keyword occurs within maxDistance characters of an installment phrase.
DetectorMatcher proximityDetector(const std::string& keywordPattern,
                                  const std::string& phrasePattern, size_t maxDistance);

/**
 * @brief Static table of supported providers
 */
class ProviderRegistry {
public:
    static const ProviderRegistry& instance();

    /// Entries in detection order.
    const std::vector<ProviderPatterns>& entries() const { return entries_; }

    /// Patterns for a provider; the generic set for Provider::Unknown.
    const ProviderPatterns& patternsFor(Provider provider) const;

    const ProviderPatterns& genericPatterns() const { return generic_; }

private:
    ProviderRegistry();

    std::vector<ProviderPatterns> entries_;
    ProviderPatterns generic_;
};

} // namespace payplan::extraction
