#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <payplan/extraction/provider_registry.h>

namespace payplan::extraction {

namespace {

// Building blocks shared by the provider tables
const std::string kMonth = "(?:jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|june?|july?|"
                           "aug(?:ust)?|sep(?:t(?:ember)?)?|oct(?:ober)?|nov(?:ember)?|"
                           "dec(?:ember)?)\\.?";
const std::string kOrdinal = "(?:st|nd|rd|th)?";
const std::string kMonthDayYear = kMonth + "\\s+\\d{1,2}" + kOrdinal + ",?\\s+\\d{4}";
const std::string kDayMonthYear = "\\d{1,2}" + kOrdinal + "\\s+" + kMonth + ",?\\s+\\d{4}";
const std::string kNumericDate = "\\d{1,2}/\\d{1,2}/\\d{4}";
const std::string kIsoDate = "\\d{4}-\\d{2}-\\d{2}";
const std::string kAnyDate =
    "(?:" + kMonthDayYear + "|" + kDayMonthYear + "|" + kNumericDate + "|" + kIsoDate + ")";

const std::string kSymbol = "(?:\\$|€|£)";
const std::string kMoney = "(\\d[\\d,]*\\.\\d{2,3})";
const std::string kLooseMoney = "(\\d[\\d,]*(?:\\.\\d{1,3})?)";

const std::string kInstallmentPhrase =
    "\\b(?:pay\\s+in\\s+\\d|installment|payment\\s+\\d\\s+of\\s+\\d)\\b";

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::regex compile(const std::string& pattern, bool caseInsensitive) {
    auto flags = std::regex::ECMAScript;
    if (caseInsensitive) {
        flags |= std::regex::icase;
    }
    return std::regex(pattern, flags);
}

std::vector<size_t> matchPositions(const std::regex& re, std::string_view text) {
    std::vector<size_t> positions;
    using Iter = std::regex_iterator<std::string_view::const_iterator>;
    for (Iter it(text.begin(), text.end(), re), end; it != end; ++it) {
        positions.push_back(static_cast<size_t>(it->position(0)));
    }
    return positions;
}

std::vector<MatchStrategy> commonAmountPatterns() {
    return {
        regexStrategy("\\b(?:payment|installment)(?:\\s+\\d{1,2}\\s+of\\s+\\d{1,2})?[:\\s]+" +
                      kSymbol + "\\s?" + kMoney + "\\b"),
        regexStrategy("\\bamount\\s+due\\b[:\\s]*" + kSymbol + "?\\s?" + kMoney + "\\b"),
        regexStrategy(kSymbol + "\\s?" + kMoney + "\\s+\\b(?:due|owing)\\b"),
        regexStrategy("\\btotal\\s+due\\b[:\\s]*" + kSymbol + "?\\s?" + kMoney + "\\b"),
    };
}

std::vector<MatchStrategy> commonDatePatterns() {
    return {
        regexStrategy("\\bdue(?:\\s+date)?(?:\\s+on)?[:\\s]+(" + kAnyDate + ")"),
        regexStrategy("\\bby[:\\s]+(" + kAnyDate + ")"),
        regexStrategy("\\b(" + kMonthDayYear + ")"),
        regexStrategy("\\b(" + kDayMonthYear + ")"),
        regexStrategy("\\b(" + kNumericDate + ")\\b"),
        regexStrategy("\\b(" + kIsoDate + ")\\b"),
    };
}

std::vector<MatchStrategy> commonInstallmentPatterns() {
    return {
        regexStrategy("\\b(?:payment|installment)\\s*#?\\s*(\\d{1,2})\\s*(?:of|/)\\s*(\\d{1,2})\\b"),
        // Bare "2 of 4" or "2/4"; the lookahead keeps 01/15/2026 from reading as 1 of 15
        regexStrategy("\\b(\\d{1,2})\\s*(?:of|/)\\s*(\\d{1,2})\\b(?!\\s*/)"),
    };
}

std::vector<MatchStrategy> finalPaymentPatterns() {
    return {regexStrategy("\\bfinal\\s*(?:payment|installment)\\b"),
            regexStrategy("\\blast\\s+(?:payment|installment)\\b")};
}

template <typename T> std::vector<T> concat(std::vector<T> head, std::vector<T> tail) {
    head.insert(head.end(), std::make_move_iterator(tail.begin()),
                std::make_move_iterator(tail.end()));
    return head;
}

ProviderPatterns makeKlarna() {
    ProviderPatterns p;
    p.provider = Provider::Klarna;
    p.planLength = 4;
    p.detectors = {substringDetector("@klarna.com"), regexDetector("\\bklarna\\b")};
    p.amountPatterns = concat(
        {
            regexStrategy("\\bpayment\\b[:\\s]+" + kSymbol + "?\\s?" + kMoney + "\\b"),
            regexStrategy(kSymbol + "\\s?" + kMoney + "\\s+\\bdue\\b"),
            regexStrategy("\\bamount\\b[:\\s]+" + kSymbol + "?\\s?" + kMoney + "\\b"),
        },
        concat(commonAmountPatterns(),
               {regexStrategy("\\bpayment\\b[:\\s]+" + kSymbol + "\\s?" + kLooseMoney + "\\b")}));
    p.datePatterns = commonDatePatterns();
    p.installmentPatterns = commonInstallmentPatterns();
    p.finalPaymentPatterns = finalPaymentPatterns();
    return p;
}

ProviderPatterns makeAffirm() {
    ProviderPatterns p;
    p.provider = Provider::Affirm;
    // Affirm plans run 3 to 36 months, so "final payment" carries no number
    p.planLength = 0;
    p.detectors = {substringDetector("@affirm.com"), substringDetector("@affirmmail.com"),
                   regexDetector("\\baffirm\\b")};
    p.amountPatterns = concat(
        {
            regexStrategy("\\binstallment\\b[:\\s]+" + kSymbol + "?\\s?" + kMoney + "\\b"),
            regexStrategy(kSymbol + "\\s?" + kMoney + "\\s+\\bdue\\b"),
            regexStrategy("\\bamount\\b[:\\s]+" + kSymbol + "?\\s?" + kMoney + "\\b"),
        },
        concat(commonAmountPatterns(),
               {regexStrategy("\\binstallment\\b[:\\s]+" + kSymbol + "\\s?" + kLooseMoney +
                              "\\b")}));
    p.datePatterns = commonDatePatterns();
    p.installmentPatterns = commonInstallmentPatterns();
    return p;
}

ProviderPatterns makeAfterpay() {
    ProviderPatterns p;
    p.provider = Provider::Afterpay;
    p.planLength = 4;
    p.detectors = {substringDetector("@afterpay.com"), substringDetector("@clearpay.co.uk"),
                   regexDetector("\\bafterpay\\b"), regexDetector("\\bclearpay\\b")};
    p.amountPatterns = concat(
        {
            regexStrategy("\\binstallment\\b[:\\s]+" + kSymbol + "?\\s?" + kMoney + "\\b"),
            regexStrategy(kSymbol + "\\s?" + kMoney + "\\s+\\bdue\\b"),
        },
        commonAmountPatterns());
    p.datePatterns = commonDatePatterns();
    p.installmentPatterns =
        concat(commonInstallmentPatterns(),
               {regexStrategy("\\binstallment\\s+(\\d{1,2})/(\\d{1,2})\\b")});
    p.finalPaymentPatterns = finalPaymentPatterns();
    return p;
}

ProviderPatterns makePayInFour(Provider provider, std::vector<DetectorMatcher> detectors) {
    ProviderPatterns p;
    p.provider = provider;
    p.planLength = 4;
    p.detectors = std::move(detectors);
    p.amountPatterns =
        concat(commonAmountPatterns(), {regexStrategy(kSymbol + "(\\d[\\d,]*\\.\\d{2})\\b")});
    p.datePatterns = commonDatePatterns();
    p.installmentPatterns = commonInstallmentPatterns();
    p.finalPaymentPatterns = finalPaymentPatterns();
    return p;
}

ProviderPatterns makeGeneric() {
    ProviderPatterns p;
    p.provider = Provider::Unknown;
    p.amountPatterns = commonAmountPatterns();
    p.datePatterns = commonDatePatterns();
    p.installmentPatterns = commonInstallmentPatterns();
    return p;
}

} // namespace

MatchStrategy regexStrategy(const std::string& pattern, bool caseInsensitive) {
    auto re = std::make_shared<const std::regex>(compile(pattern, caseInsensitive));
    return [re](std::string_view text) -> std::optional<FieldMatch> {
        std::match_results<std::string_view::const_iterator> m;
        if (!std::regex_search(text.begin(), text.end(), m, *re)) {
            return std::nullopt;
        }
        FieldMatch match;
        match.position = static_cast<size_t>(m.position(0));
        for (size_t i = 1; i < m.size(); ++i) {
            match.captures.push_back(m[i].matched ? m[i].str() : std::string{});
        }
        if (match.captures.empty()) {
            match.captures.push_back(m[0].str());
        }
        return match;
    };
}

DetectorMatcher substringDetector(std::string needle) {
    return [needle = toLower(needle)](std::string_view text) {
        return toLower(text).find(needle) != std::string::npos;
    };
}

DetectorMatcher regexDetector(const std::string& pattern) {
    auto re = std::make_shared<const std::regex>(compile(pattern, true));
    return [re](std::string_view text) { return std::regex_search(text.begin(), text.end(), *re); };
}

DetectorMatcher proximityDetector(const std::string& keywordPattern,
                                  const std::string& phrasePattern, size_t maxDistance) {
    auto keyword = std::make_shared<const std::regex>(compile(keywordPattern, true));
    auto phrase = std::make_shared<const std::regex>(compile(phrasePattern, true));
    return [keyword, phrase, maxDistance](std::string_view text) {
        const auto keywordAt = matchPositions(*keyword, text);
        if (keywordAt.empty()) {
            return false;
        }
        const auto phraseAt = matchPositions(*phrase, text);
        return std::any_of(keywordAt.begin(), keywordAt.end(), [&](size_t k) {
            return std::any_of(phraseAt.begin(), phraseAt.end(), [&](size_t p) {
                return (k > p ? k - p : p - k) <= maxDistance;
            });
        });
    };
}

ProviderRegistry::ProviderRegistry() {
    entries_.push_back(makeKlarna());
    entries_.push_back(makeAffirm());
    entries_.push_back(makeAfterpay());
    entries_.push_back(makePayInFour(
        Provider::PayPalPayIn4,
        {regexDetector("\\bpay\\s*in\\s*4\\b"), substringDetector("@paypal.com")}));
    // "zip" alone is a common verb; without the domain it needs an installment phrase nearby
    entries_.push_back(makePayInFour(
        Provider::Zip,
        {substringDetector("@zip.co"), substringDetector("@quadpay.com"),
         proximityDetector("\\b(?:zip(?:\\s+pay)?|quadpay)\\b", kInstallmentPhrase, 80)}));
    entries_.push_back(makePayInFour(
        Provider::Sezzle, {substringDetector("@sezzle.com"),
                           proximityDetector("\\bsezzle\\b", kInstallmentPhrase, 80)}));
    generic_ = makeGeneric();

    spdlog::debug("Provider registry initialized with {} providers", entries_.size());
}

const ProviderRegistry& ProviderRegistry::instance() {
    static const ProviderRegistry registry;
    return registry;
}

const ProviderPatterns& ProviderRegistry::patternsFor(Provider provider) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [provider](const ProviderPatterns& p) { return p.provider == provider; });
    return it != entries_.end() ? *it : generic_;
}

} // namespace payplan::extraction
