#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <payplan/extraction/redaction.h>

namespace payplan::extraction {

namespace {

constexpr std::size_t kPreviewLength = 100;

constexpr std::array<std::string_view, 9> kCommonPhrases = {
    "pay later", "auto pay",     "buy now",      "pay in",    "due date",
    "late fee",  "payment plan", "order number", "item total"};

bool isCommonPhrase(const std::string& match) {
    std::string lower = match;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kCommonPhrases.begin(), kCommonPhrases.end(), lower) != kCommonPhrases.end();
}

std::string redactNames(const std::string& text) {
    static const std::regex namePair(R"(\b[A-Z][a-z]{2,} [A-Z][a-z]{2,}\b)");

    std::string out;
    out.reserve(text.size());
    auto last = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), namePair), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        out += isCommonPhrase(m.str()) ? m.str() : std::string("[NAME]");
        last = m[0].second;
    }
    out.append(last, text.cend());
    return out;
}

// Length of the longest prefix of at most maxBytes that ends on a code point boundary
std::size_t utf8Boundary(std::string_view text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text.size();
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

// Byte offset after the first maxChars code points
std::size_t utf8Prefix(std::string_view text, std::size_t maxChars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == maxChars) {
                return i;
            }
            ++chars;
        }
    }
    return text.size();
}

} // namespace

std::string redactPII(std::string_view text) {
    static const std::regex email(R"([\w.%+\-]+@[\w.\-]+\.\w+)");
    static const std::regex amount(R"((?:\$|€|£)\s?[\d,]+(?:\.\d+)?)");
    static const std::regex account(R"(\b(account|card|acct)[:\s#]*\d{4,}\b)", std::regex::icase);

    std::string redacted(text);
    redacted = std::regex_replace(redacted, email, "[EMAIL]");
    redacted = std::regex_replace(redacted, amount, "[AMOUNT]");
    redacted = std::regex_replace(redacted, account, "$1: [ACCOUNT]");
    return redactNames(redacted);
}

std::string makeSnippet(std::string_view segment, std::size_t maxLength) {
    return redactPII(segment.substr(0, utf8Prefix(segment, maxLength)));
}

std::string safePreview(std::string_view text) {
    auto redacted = redactPII(text);
    if (redacted.size() <= kPreviewLength) {
        return redacted;
    }
    redacted.resize(utf8Boundary(redacted, kPreviewLength));
    return redacted + "... [redacted]";
}

} // namespace payplan::extraction
