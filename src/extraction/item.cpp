#include <algorithm>
#include <array>
#include <cctype>
#include <payplan/extraction/item.h>

namespace payplan::extraction {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<Provider> providerFromString(std::string_view name) {
    static constexpr std::array<Provider, 7> all = {
        Provider::Klarna, Provider::Affirm, Provider::Afterpay, Provider::PayPalPayIn4,
        Provider::Zip,    Provider::Sezzle, Provider::Unknown};

    const auto lower = toLower(name);
    for (auto provider : all) {
        if (toLower(providerToString(provider)) == lower) {
            return provider;
        }
    }
    return std::nullopt;
}

std::optional<DateLocale> dateLocaleFromString(std::string_view tag) {
    const auto lower = toLower(tag);
    if (lower == "us") {
        return DateLocale::US;
    }
    if (lower == "eu") {
        return DateLocale::EU;
    }
    return std::nullopt;
}

bool Item::sameValueAs(const Item& other) const {
    return provider == other.provider && installmentNo == other.installmentNo &&
           dueDate == other.dueDate && rawDueDate == other.rawDueDate &&
           amountCents == other.amountCents && currency == other.currency &&
           autopay == other.autopay && lateFeeCents == other.lateFeeCents &&
           signals == other.signals && confidence == other.confidence;
}

} // namespace payplan::extraction
