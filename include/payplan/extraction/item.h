#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <payplan/core/types.h>

namespace payplan::extraction {

/**
 * @brief Known BNPL providers, in detection order
 */
enum class Provider { Klarna, Affirm, Afterpay, PayPalPayIn4, Zip, Sezzle, Unknown };

constexpr const char* providerToString(Provider provider) {
    switch (provider) {
        case Provider::Klarna: return "Klarna";
        case Provider::Affirm: return "Affirm";
        case Provider::Afterpay: return "Afterpay";
        case Provider::PayPalPayIn4: return "PayPalPayIn4";
        case Provider::Zip: return "Zip";
        case Provider::Sezzle: return "Sezzle";
        case Provider::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<Provider> providerFromString(std::string_view name);

/**
 * @brief How ambiguous slash-separated dates are read
 *
 * US reads 01/02/2026 as January 2, EU reads it as February 1.
 */
enum class DateLocale { US, EU };

constexpr const char* dateLocaleToString(DateLocale locale) {
    return locale == DateLocale::EU ? "EU" : "US";
}

std::optional<DateLocale> dateLocaleFromString(std::string_view tag);

enum class DateSignal { Missing, Ambiguous, Unambiguous };

enum class InstallmentSignal {
    Missing,   ///< Nothing found, installmentNo is 0
    Defaulted, ///< Assumed first installment
    Inferred,  ///< Derived from wording such as "final payment"
    Stated     ///< Explicit "N of M" or "N/M"
};

/**
 * @brief Which fields were found in the text and which were defaulted
 */
struct ExtractionSignals {
    bool amountFound = false;
    DateSignal date = DateSignal::Missing;
    InstallmentSignal installment = InstallmentSignal::Missing;
    bool autopayStated = false;

    bool operator==(const ExtractionSignals&) const = default;
};

/**
 * @brief One extracted installment
 *
 * confidence is derived from provider, dueDate and signals. Only the scorer writes it.
 */
struct Item {
    RowId id;
    Provider provider = Provider::Unknown;
    int installmentNo = 0;
    std::string dueDate;    ///< YYYY-MM-DD, empty when undetermined
    std::string rawDueDate; ///< Date text as it appeared in the email
    Cents amountCents = 0;
    std::string currency = "USD";
    bool autopay = false;
    Cents lateFeeCents = 0;
    ExtractionSignals signals;
    double confidence = 0.0;

    bool sameValueAs(const Item& other) const;
};

/**
 * @brief One email segment that produced no usable Item
 */
struct Issue {
    std::string id;
    std::string reason;
    std::string snippet; ///< Redacted, truncated excerpt
};

struct ExtractionResult {
    std::vector<Item> items;
    std::vector<Issue> issues;
    DateLocale dateLocale = DateLocale::US;
    size_t segmentCount = 0;
    size_t duplicatesRemoved = 0;
};

} // namespace payplan::extraction
