#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <payplan/core/types.h>
#include <payplan/extraction/provider_registry.h>

namespace payplan::extraction {

/// Largest amount accepted from an email, in dollars.
inline constexpr Cents kMaxAmountCents = 1'000'000LL * 100;

struct DateMatch {
    std::string isoDate; ///< YYYY-MM-DD
    std::string rawText; ///< Matched text, kept for locale re-parsing
    bool ambiguous = false;
};

struct InstallmentMatch {
    int number = 0;
    int total = 0; ///< 0 when the plan length is not stated
    InstallmentSignal signal = InstallmentSignal::Missing;
};

/**
 * @brief Identify the provider of an email
 *
 * Registry entries are tried in registration order; the first whose detector matches wins.
 */
Provider detectProvider(std::string_view text);

/**
 * @brief Convert a decimal currency string ("1,234.565") to cents
 *
 * Thousands separators are dropped; a third decimal rounds half up.
 * @return nullopt for malformed, negative or out of range input
 */
std::optional<Cents> parseMoneyToCents(std::string_view money);

/**
 * @brief First amount found by the ordered patterns
 * @return nullopt when no pattern matches; zero is a valid amount
 */
std::optional<Cents> extractAmount(std::string_view text,
                                   const std::vector<MatchStrategy>& patterns);

/// ISO 4217 code from currency symbols or codes; USD when nothing else is present.
std::string extractCurrency(std::string_view text);

/**
 * @brief First date candidate that resolves to a real calendar date
 *
 * Month-name dates and numeric dates with a component above 12 resolve the same way under
 * both locales. Candidates that fail to resolve are skipped.
 */
std::optional<DateMatch> extractDueDate(std::string_view text,
                                        const std::vector<MatchStrategy>& patterns,
                                        std::string_view timezone, DateLocale locale);

/**
 * @brief Installment number from "N of M", "N/M", or "final payment"
 *
 * "final payment" maps to planLength when the plan length is fixed.
 */
std::optional<InstallmentMatch> extractInstallmentNumber(std::string_view text,
                                                         const ProviderPatterns& patterns);

/**
 * @brief Explicit autopay wording
 * @return true/false when the email says so, nullopt when autopay is not mentioned
 */
std::optional<bool> detectAutopaySignal(std::string_view text);

/// Collapses "not mentioned" into false.
bool detectAutopay(std::string_view text);

/// Late fee in cents, 0 when absent.
Cents extractLateFee(std::string_view text);

} // namespace payplan::extraction
