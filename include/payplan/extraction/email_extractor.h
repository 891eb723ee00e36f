#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <payplan/cache/extraction_cache.h>
#include <payplan/core/types.h>
#include <payplan/extraction/item.h>
#include <payplan/extraction/redaction.h>

namespace payplan::extraction {

/// Longest pasted text accepted, in bytes.
constexpr size_t kMaxInputLength = 16000;

/**
 * @brief Options for one extraction call
 */
struct ExtractOptions {
    DateLocale dateLocale = DateLocale::US; ///< How ambiguous numeric dates are read
    bool bypassCache = false;               ///< Skip cache reads and writes
    bool deduplicate = false;               ///< Drop repeated installments
    size_t snippetLength = kDefaultSnippetLength;
};

/// CRLF and CR become LF; surrounding whitespace is trimmed.
std::string normalizeText(std::string_view text);

/**
 * @brief Split pasted text into individual emails
 *
 * Lines made of three or more '-', '_' or '=' separate emails, and a line starting with
 * "From:" opens a new one. Segments of 20 characters or fewer are dropped; when none
 * survive the whole text is a single segment. Blank text has no segments.
 */
std::vector<std::string> splitEmails(std::string_view normalizedText);

/**
 * @brief Extract payment items from one or more pasted emails
 *
 * Each segment becomes exactly one Item or one Issue, in input order. Only Item ids vary
 * between calls with the same input.
 *
 * @param text Raw pasted text
 * @param timezone IANA timezone name
 * @param options Locale and result-shaping options; bypassCache is ignored here
 * @return ValidationError for an invalid timezone, InvalidArgument for text longer than
 *         kMaxInputLength
 */
Result<ExtractionResult> extractItemsFromEmails(std::string_view text, std::string_view timezone,
                                                const ExtractOptions& options = {});

/**
 * @brief Extraction front end that memoizes results in a session cache
 */
class ExtractionEngine {
public:
    explicit ExtractionEngine(cache::ExtractionCache& cache) : cache_(cache) {}

    /**
     * @brief Extract, serving repeated requests from the cache
     *
     * A cache hit returns the stored result with its original Item ids. With bypassCache
     * the cache is neither read nor written.
     */
    Result<ExtractionResult> extract(std::string_view text, std::string_view timezone,
                                     const ExtractOptions& options = {});

    cache::ExtractionCache& cache() { return cache_; }

private:
    cache::ExtractionCache& cache_;
};

} // namespace payplan::extraction
