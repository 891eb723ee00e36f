#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <regex>
#include <payplan/extraction/date_resolver.h>
#include <payplan/extraction/field_extractors.h>

namespace payplan::extraction {

namespace {

constexpr int kMaxInstallments = 12;

// Matched after auto-pay wording variants are folded to "autopay"
constexpr std::array<const char*, 17> kAutopayOff = {
    "autopay is off",        "autopay are off",         "autopay: off",
    "autopay off",           "autopay disabled",        "autopay is disabled",
    "autopay are disabled",  "autopay has been disabled", "autopay not enabled",
    "autopay is not enabled", "autopay are not enabled", "autopay is turned off",
    "autopay turned off",    "autopay has been turned off", "autopay is not active",
    "autopay is inactive",   "autopay paused"};

constexpr std::array<const char*, 4> kAutopayVariants = {"automatic payments", "automatic payment",
                                                         "auto-pay", "auto pay"};

constexpr std::array<const char*, 10> kAutopayOn = {
    "autopay is on",      "autopay: on",        "autopay enabled",
    "autopay is enabled", "autopay is active",  "auto-pay",
    "automatic payment",  "automatically charged", "will be charged automatically",
    "autopay is turned on"};

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string foldAutopayWording(std::string text) {
    for (const char* variant : kAutopayVariants) {
        const std::string_view needle(variant);
        for (auto pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + 7)) {
            text.replace(pos, needle.size(), "autopay");
        }
    }
    return text;
}

std::optional<int> toInt(std::string_view digits) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<InstallmentMatch> fromCaptures(const FieldMatch& match) {
    if (match.captures.empty()) {
        return std::nullopt;
    }
    auto number = toInt(match.captures[0]);
    if (!number || *number < 1 || *number > kMaxInstallments) {
        return std::nullopt;
    }
    int total = 0;
    if (match.captures.size() > 1 && !match.captures[1].empty()) {
        auto parsed = toInt(match.captures[1]);
        if (!parsed || *parsed < *number || *parsed > kMaxInstallments) {
            return std::nullopt;
        }
        total = *parsed;
    }
    return InstallmentMatch{*number, total, InstallmentSignal::Stated};
}

} // namespace

Provider detectProvider(std::string_view text) {
    for (const auto& entry : ProviderRegistry::instance().entries()) {
        const bool matched = std::any_of(entry.detectors.begin(), entry.detectors.end(),
                                         [&](const DetectorMatcher& d) { return d(text); });
        if (matched) {
            spdlog::debug("Detected provider {}", providerToString(entry.provider));
            return entry.provider;
        }
    }
    return Provider::Unknown;
}

std::optional<Cents> parseMoneyToCents(std::string_view money) {
    std::string digits;
    digits.reserve(money.size());
    for (char c : money) {
        if (c != ',') {
            digits.push_back(c);
        }
    }

    const auto dot = digits.find('.');
    const std::string whole = digits.substr(0, dot);
    const std::string fraction = dot == std::string::npos ? "" : digits.substr(dot + 1);

    const auto allDigits = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    };
    if (whole.empty() || whole.size() > 9 || !allDigits(whole) || fraction.size() > 3 ||
        !allDigits(fraction) || (dot != std::string::npos && fraction.empty())) {
        return std::nullopt;
    }

    Cents cents = 0;
    std::from_chars(whole.data(), whole.data() + whole.size(), cents);
    cents *= 100;

    std::string padded = fraction;
    padded.resize(3, '0');
    cents += (padded[0] - '0') * 10 + (padded[1] - '0');
    if (padded[2] >= '5') {
        cents += 1;
    }

    if (cents > kMaxAmountCents) {
        spdlog::warn("Amount exceeds the supported maximum and was ignored");
        return std::nullopt;
    }
    return cents;
}

std::optional<Cents> extractAmount(std::string_view text,
                                   const std::vector<MatchStrategy>& patterns) {
    for (const auto& pattern : patterns) {
        auto match = pattern(text);
        if (!match || match->captures.empty()) {
            continue;
        }
        if (auto cents = parseMoneyToCents(match->captures[0])) {
            return cents;
        }
    }
    return std::nullopt;
}

std::string extractCurrency(std::string_view text) {
    static const std::regex usd(R"(\$|\bUSD\b)", std::regex::icase);
    static const std::regex eur(R"(€|\bEUR\b)", std::regex::icase);
    static const std::regex gbp(R"(£|\bGBP\b)", std::regex::icase);

    if (std::regex_search(text.begin(), text.end(), usd)) {
        return "USD";
    }
    if (std::regex_search(text.begin(), text.end(), eur)) {
        return "EUR";
    }
    if (std::regex_search(text.begin(), text.end(), gbp)) {
        return "GBP";
    }
    return "USD";
}

std::optional<DateMatch> extractDueDate(std::string_view text,
                                        const std::vector<MatchStrategy>& patterns,
                                        std::string_view timezone, DateLocale locale) {
    for (const auto& pattern : patterns) {
        auto match = pattern(text);
        if (!match || match->captures.empty() || match->captures[0].empty()) {
            continue;
        }

        const auto& raw = match->captures[0];
        // 13/02/2026 can only be day-first, whatever the caller asked for
        const DateLocale effective = inferLocale(raw).value_or(locale);
        auto resolved = resolveDate(raw, effective, timezone);
        if (!resolved) {
            spdlog::debug("Skipping date candidate: {}", resolved.error().message);
            continue;
        }
        return DateMatch{std::move(resolved).value(), raw, isAmbiguousDate(raw)};
    }
    return std::nullopt;
}

std::optional<InstallmentMatch> extractInstallmentNumber(std::string_view text,
                                                         const ProviderPatterns& patterns) {
    for (const auto& pattern : patterns.installmentPatterns) {
        if (auto match = pattern(text)) {
            if (auto installment = fromCaptures(*match)) {
                return installment;
            }
        }
    }

    if (patterns.planLength > 0) {
        for (const auto& pattern : patterns.finalPaymentPatterns) {
            if (pattern(text)) {
                return InstallmentMatch{patterns.planLength, patterns.planLength,
                                        InstallmentSignal::Inferred};
            }
        }
    }

    static const std::regex loose(
        R"(\b(?:installment|payment)\s*(?:#|no\.?|number)?\s*:?\s*(\d{1,2})\b(?![.,/]\d|\s*/))",
        std::regex::icase);
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(text.begin(), text.end(), m, loose)) {
        auto number = toInt(m[1].str());
        if (number && *number >= 1 && *number <= kMaxInstallments) {
            return InstallmentMatch{*number, 0, InstallmentSignal::Inferred};
        }
    }
    return std::nullopt;
}

std::optional<bool> detectAutopaySignal(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const auto lower = toLower(text);

    // Negative wording wins: "auto-pay disabled" also contains a positive phrase
    const auto folded = foldAutopayWording(lower);
    for (const char* phrase : kAutopayOff) {
        if (folded.find(phrase) != std::string::npos) {
            return false;
        }
    }
    for (const char* phrase : kAutopayOn) {
        if (lower.find(phrase) != std::string::npos) {
            return true;
        }
    }
    return std::nullopt;
}

bool detectAutopay(std::string_view text) {
    return detectAutopaySignal(text).value_or(false);
}

Cents extractLateFee(std::string_view text) {
    static const std::array<std::regex, 2> patterns = {
        std::regex(R"(late\s+(?:payment\s+)?fee[:\s]+(?:of\s+)?(?:\$|€|£)?\s?(\d[\d,]*(?:\.\d{1,3})?))",
                   std::regex::icase),
        std::regex(R"(late\s+charge[:\s]+(?:of\s+)?(?:\$|€|£)?\s?(\d[\d,]*(?:\.\d{1,3})?))",
                   std::regex::icase)};

    for (const auto& re : patterns) {
        std::match_results<std::string_view::const_iterator> m;
        if (std::regex_search(text.begin(), text.end(), m, re)) {
            if (auto cents = parseMoneyToCents(m[1].str())) {
                return *cents;
            }
        }
    }
    return 0;
}

} // namespace payplan::extraction
