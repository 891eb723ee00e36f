#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <tuple>
#include <variant>
#include <payplan/config/config_helpers.h>
#include <payplan/core/uuid.h>
#include <payplan/extraction/confidence_scorer.h>
#include <payplan/extraction/date_resolver.h>
#include <payplan/extraction/email_extractor.h>
#include <payplan/extraction/error_messages.h>
#include <payplan/extraction/field_extractors.h>

namespace payplan::extraction {

namespace {

constexpr size_t kMinSegmentLength = 20;

using SegmentOutcome = std::variant<Item, Issue>;

bool isDelimiterLine(std::string line) {
    config::trim(line);
    if (line.size() < 3 || (line[0] != '-' && line[0] != '_' && line[0] != '=')) {
        return false;
    }
    return std::all_of(line.begin(), line.end(), [&line](char c) { return c == line[0]; });
}

bool startsNewEmail(std::string_view line) {
    constexpr std::string_view header = "from:";
    const auto first = std::find_if(line.begin(), line.end(),
                                    [](unsigned char c) { return !std::isspace(c); });
    const auto rest = line.substr(static_cast<size_t>(first - line.begin()));
    if (rest.size() < header.size()) {
        return false;
    }
    return std::equal(header.begin(), header.end(), rest.begin(), [](char h, char c) {
        return h == static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
}

Result<void> checkInputLength(std::string_view text) {
    if (text.size() > kMaxInputLength) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Input is {} bytes; the limit is {}", text.size(),
                                 kMaxInputLength)};
    }
    return {};
}

SegmentOutcome extractSegment(const std::string& segment, size_t index, std::string_view timezone,
                              const ExtractOptions& options) {
    const Provider provider = detectProvider(segment);
    const auto& patterns = ProviderRegistry::instance().patternsFor(provider);

    const auto amount = extractAmount(segment, patterns.amountPatterns);
    const auto date = extractDueDate(segment, patterns.datePatterns, timezone, options.dateLocale);
    const auto installment = extractInstallmentNumber(segment, patterns);

    if (provider == Provider::Unknown && !amount && !date && !installment) {
        MissingFields missing{true, true, true, true};
        Issue issue{core::makeIssueId(index), issueReason(missing),
                    makeSnippet(segment, options.snippetLength)};
        spdlog::debug("Segment {} not recognized: {}", index, safePreview(segment));
        return issue;
    }

    const auto autopay = detectAutopaySignal(segment);

    Item item;
    item.id = core::generateUUID();
    item.provider = provider;
    item.amountCents = amount.value_or(0);
    item.currency = extractCurrency(segment);
    item.autopay = autopay.value_or(false);
    item.lateFeeCents = extractLateFee(segment);

    if (date) {
        item.dueDate = date->isoDate;
        item.rawDueDate = date->rawText;
        item.signals.date = date->ambiguous ? DateSignal::Ambiguous : DateSignal::Unambiguous;
    }
    if (installment) {
        item.installmentNo = installment->number;
        item.signals.installment = installment->signal;
    } else {
        item.installmentNo = 1;
        item.signals.installment = InstallmentSignal::Defaulted;
    }
    item.signals.amountFound = amount.has_value();
    item.signals.autopayStated = autopay.has_value();
    item.confidence = scoreItem(item);

    spdlog::debug("Segment {}: {} installment {} confidence {:.2f}", index,
                  providerToString(item.provider), item.installmentNo, item.confidence);
    return item;
}

size_t removeDuplicates(std::vector<Item>& items) {
    std::set<std::tuple<Provider, int, std::string, Cents>> seen;
    const auto before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&seen](const Item& item) {
                                   return !seen
                                               .emplace(item.provider, item.installmentNo,
                                                        item.dueDate, item.amountCents)
                                               .second;
                               }),
                items.end());
    return before - items.size();
}

} // namespace

std::string normalizeText(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(text[i]);
        }
    }
    config::trim(out);
    return out;
}

std::vector<std::string> splitEmails(std::string_view normalizedText) {
    std::vector<std::string> segments;
    if (normalizedText.empty()) {
        return segments;
    }

    std::string current;
    auto flush = [&segments, &current]() {
        config::trim(current);
        if (current.size() > kMinSegmentLength) {
            segments.push_back(current);
        }
        current.clear();
    };

    size_t start = 0;
    while (start <= normalizedText.size()) {
        const auto end = std::min(normalizedText.find('\n', start), normalizedText.size());
        const std::string line(normalizedText.substr(start, end - start));
        start = end + 1;

        if (isDelimiterLine(line)) {
            flush();
            continue;
        }
        if (startsNewEmail(line) &&
            std::any_of(current.begin(), current.end(),
                        [](unsigned char c) { return !std::isspace(c); })) {
            flush();
        }
        current += line;
        current += '\n';
    }
    flush();

    if (segments.empty()) {
        std::string whole(normalizedText);
        config::trim(whole);
        if (!whole.empty()) {
            segments.push_back(std::move(whole));
        }
    }
    return segments;
}

Result<ExtractionResult> extractItemsFromEmails(std::string_view text, std::string_view timezone,
                                                const ExtractOptions& options) {
    if (auto tz = validateTimezone(timezone); !tz) {
        spdlog::warn("Extraction rejected: {}", tz.error().message);
        return tz.error();
    }
    if (auto length = checkInputLength(text); !length) {
        spdlog::warn("Extraction rejected: {}", length.error().message);
        return length.error();
    }

    const auto segments = splitEmails(normalizeText(text));

    ExtractionResult result;
    result.dateLocale = options.dateLocale;
    result.segmentCount = segments.size();

    for (size_t i = 0; i < segments.size(); ++i) {
        auto outcome = extractSegment(segments[i], i, timezone, options);
        if (auto* item = std::get_if<Item>(&outcome)) {
            result.items.push_back(std::move(*item));
        } else {
            result.issues.push_back(std::get<Issue>(std::move(outcome)));
        }
    }

    if (options.deduplicate) {
        result.duplicatesRemoved = removeDuplicates(result.items);
    }

    spdlog::info("Extracted {} items and {} issues from {} segments ({} duplicates removed)",
                 result.items.size(), result.issues.size(), result.segmentCount,
                 result.duplicatesRemoved);
    return result;
}

Result<ExtractionResult> ExtractionEngine::extract(std::string_view text,
                                                   std::string_view timezone,
                                                   const ExtractOptions& options) {
    if (auto tz = validateTimezone(timezone); !tz) {
        return tz.error();
    }
    if (auto length = checkInputLength(text); !length) {
        return length.error();
    }

    const auto normalized = normalizeText(text);
    const auto key = cache::CacheKey::fromInput(normalized, timezone, options.dateLocale,
                                                options.deduplicate, options.snippetLength);

    if (options.bypassCache) {
        cache_.recordBypass(key);
        return extractItemsFromEmails(normalized, timezone, options);
    }

    if (auto cached = cache_.get(key)) {
        return std::move(*cached);
    }

    auto result = extractItemsFromEmails(normalized, timezone, options);
    if (result) {
        cache_.put(key, result.value());
    }
    return result;
}

} // namespace payplan::extraction
