#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace payplan::extraction {

inline constexpr std::size_t kDefaultSnippetLength = 100;

/**
 * @brief Mask personal data in free text
 *
 * Email addresses become [EMAIL], currency amounts [AMOUNT], account/card numbers
 * [ACCOUNT], and capitalized first/last name pairs [NAME]. Common product phrases
 * such as "Due Date" or "Late Fee" are left intact.
 */
std::string redactPII(std::string_view text);

/**
 * @brief Issue snippet: the first maxLength characters of a segment, redacted
 *
 * Truncation never splits a UTF-8 sequence.
 */
std::string makeSnippet(std::string_view segment, std::size_t maxLength = kDefaultSnippetLength);

/// Redacted, truncated form for log lines.
std::string safePreview(std::string_view text);

} // namespace payplan::extraction
