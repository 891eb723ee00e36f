#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <payplan/config/config_helpers.h>
#include <payplan/config/extraction_config.h>
#include <payplan/extraction/date_resolver.h>

namespace payplan::config {

namespace {

constexpr const char* kSection = "extraction";
constexpr size_t kMaxSnippetLength = 1000;

constexpr std::array<const char*, 7> kLogLevels = {"trace", "debug", "info", "warn",
                                                   "error", "critical", "off"};

Result<extraction::DateLocale> parseLocale(const std::string& value, std::string_view origin) {
    auto locale = extraction::dateLocaleFromString(value);
    if (!locale) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("{}: locale must be US or EU, got \"{}\"", origin, value)};
    }
    return *locale;
}

Result<std::string> parseTimezone(const std::string& value, std::string_view origin) {
    if (auto valid = extraction::validateTimezone(value); !valid) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("{}: {}", origin, valid.error().message)};
    }
    return value;
}

} // namespace

extraction::DateLocale ExtractionSettings::effectiveLocale() const {
    return defaultLocale.value_or(extraction::detectLocaleFromTimezone(defaultTimezone));
}

Result<ExtractionSettings> loadExtractionConfig(const std::filesystem::path& path,
                                                bool required) {
    ExtractionSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::NotFound,
                         fmt::format("Config file not found: {}", path.string())};
        }
        spdlog::debug("No config file at {}, using defaults", path.string());
    } else {
        const auto origin = path.string();

        if (auto v = parse_config_value(path, kSection, "default_locale"); !v.empty()) {
            auto locale = parseLocale(v, origin);
            if (!locale) {
                return locale.error();
            }
            settings.defaultLocale = locale.value();
        }

        if (auto v = parse_config_value(path, kSection, "default_timezone"); !v.empty()) {
            auto tz = parseTimezone(v, origin);
            if (!tz) {
                return tz.error();
            }
            settings.defaultTimezone = std::move(tz).value();
        }

        if (auto v = parse_config_value(path, kSection, "snippet_length"); !v.empty()) {
            size_t length = 0;
            auto [ptr, err] = std::from_chars(v.data(), v.data() + v.size(), length);
            if (err != std::errc{} || ptr != v.data() + v.size() || length == 0 ||
                length > kMaxSnippetLength) {
                return Error{ErrorCode::ValidationError,
                             fmt::format("{}: snippet_length must be between 1 and {}, got \"{}\"",
                                         origin, kMaxSnippetLength, v)};
            }
            settings.snippetLength = length;
        }

        if (auto v = parse_config_value(path, kSection, "deduplicate"); !v.empty()) {
            auto flag = parse_bool(v);
            if (!flag) {
                return Error{ErrorCode::ValidationError,
                             fmt::format("{}: deduplicate must be true or false, got \"{}\"",
                                         origin, v)};
            }
            settings.deduplicate = *flag;
        }

        if (auto v = parse_config_value(path, kSection, "log_level"); !v.empty()) {
            if (std::find(kLogLevels.begin(), kLogLevels.end(), v) == kLogLevels.end()) {
                return Error{ErrorCode::ValidationError,
                             fmt::format("{}: unknown log_level \"{}\"", origin, v)};
            }
            settings.logLevel = v;
        }
    }

    if (auto env = applyEnvironmentOverrides(settings); !env) {
        return env.error();
    }
    return settings;
}

Result<void> applyEnvironmentOverrides(ExtractionSettings& settings) {
    if (const char* locale = std::getenv("PAYPLAN_LOCALE"); locale && *locale) {
        auto parsed = parseLocale(locale, "PAYPLAN_LOCALE");
        if (!parsed) {
            return parsed.error();
        }
        settings.defaultLocale = parsed.value();
    }
    if (const char* tz = std::getenv("PAYPLAN_TIMEZONE"); tz && *tz) {
        auto parsed = parseTimezone(tz, "PAYPLAN_TIMEZONE");
        if (!parsed) {
            return parsed.error();
        }
        settings.defaultTimezone = std::move(parsed).value();
    }
    return {};
}

} // namespace payplan::config
