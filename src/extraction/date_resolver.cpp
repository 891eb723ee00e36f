#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <payplan/config/config_helpers.h>
#include <payplan/extraction/date_resolver.h>

namespace payplan::extraction {

namespace {

struct NumericParts {
    int first = 0;
    int second = 0;
    int year = 0;
};

struct MonthName {
    const char* name;
    int month;
};

constexpr std::array<MonthName, 24> kMonthNames = {{
    {"january", 1},   {"jan", 1},  {"february", 2}, {"feb", 2},       {"march", 3},
    {"mar", 3},       {"april", 4}, {"apr", 4},     {"may", 5},       {"june", 6},
    {"jun", 6},       {"july", 7}, {"jul", 7},      {"august", 8},    {"aug", 8},
    {"september", 9}, {"sept", 9}, {"sep", 9},      {"october", 10},  {"oct", 10},
    {"november", 11}, {"nov", 11}, {"december", 12}, {"dec", 12},
}};

constexpr std::array<const char*, 11> kTimezoneAreas = {
    "Africa", "America", "Antarctica", "Arctic", "Asia",   "Atlantic",
    "Australia", "Europe", "Indian",   "Pacific", "Etc"};

std::filesystem::path zoneinfoDirectory() {
    if (const char* tzdir = std::getenv("TZDIR"); tzdir && *tzdir) {
        return tzdir;
    }
    return "/usr/share/zoneinfo";
}

// Without an installed tz database only the area is checked
bool isKnownZone(const std::string& name) {
    const auto root = zoneinfoDirectory();
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return true;
    }
    return std::filesystem::is_regular_file(root / name, ec);
}

std::optional<int> monthFromName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kMonthNames) {
        if (name == entry.name) {
            return entry.month;
        }
    }
    return std::nullopt;
}

// Trim, drop commas and ordinal suffixes, collapse whitespace
std::string cleanToken(std::string_view token) {
    static const std::regex ordinal(R"((\d+)(st|nd|rd|th)\b)", std::regex::icase);
    static const std::regex spaces(R"(\s+)");

    std::string s(token);
    config::trim(s);
    std::replace(s.begin(), s.end(), ',', ' ');
    s = std::regex_replace(s, ordinal, "$1");
    s = std::regex_replace(s, spaces, " ");
    config::trim(s);
    return s;
}

std::optional<NumericParts> parseNumeric(const std::string& cleaned) {
    static const std::regex numeric(R"(^(\d{1,2})([/.\-])(\d{1,2})\2(\d{4})$)");
    std::smatch m;
    if (!std::regex_match(cleaned, m, numeric)) {
        return std::nullopt;
    }
    return NumericParts{std::stoi(m[1].str()), std::stoi(m[3].str()), std::stoi(m[4].str())};
}

std::optional<CalendarDate> parseIso(const std::string& cleaned) {
    static const std::regex iso(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(cleaned, m, iso)) {
        return std::nullopt;
    }
    return CalendarDate{std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str())};
}

// "October 6 2025", "Oct. 6 2025", "6 October 2025"
std::optional<CalendarDate> parseMonthName(const std::string& cleaned) {
    static const std::regex monthFirst(R"(^([A-Za-z]+)\.? (\d{1,2}) (\d{4})$)");
    static const std::regex dayFirst(R"(^(\d{1,2}) ([A-Za-z]+)\.? (\d{4})$)");

    std::smatch m;
    if (std::regex_match(cleaned, m, monthFirst)) {
        if (auto month = monthFromName(m[1].str())) {
            return CalendarDate{std::stoi(m[3].str()), *month, std::stoi(m[2].str())};
        }
        return CalendarDate{};
    }
    if (std::regex_match(cleaned, m, dayFirst)) {
        if (auto month = monthFromName(m[2].str())) {
            return CalendarDate{std::stoi(m[3].str()), *month, std::stoi(m[1].str())};
        }
        return CalendarDate{};
    }
    return std::nullopt;
}

CalendarDate fromNumeric(const NumericParts& parts, DateLocale locale) {
    if (locale == DateLocale::EU) {
        return CalendarDate{parts.year, parts.second, parts.first};
    }
    return CalendarDate{parts.year, parts.first, parts.second};
}

Error dateError(std::string_view token) {
    return Error{ErrorCode::DateParseError, fmt::format("Unable to parse date: {}", token)};
}

} // namespace

std::string CalendarDate::toIso() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[static_cast<size_t>(month - 1)];
}

bool isValidCalendarDate(int year, int month, int day) {
    return year >= 1 && year <= 9999 && month >= 1 && month <= 12 && day >= 1 &&
           day <= daysInMonth(year, month);
}

Result<void> validateTimezone(std::string_view timezone) {
    static const std::regex abbreviation(R"(^(EST|EDT|CST|CDT|MST|MDT|PST|PDT|GMT[+-]?\d*)$)",
                                         std::regex::icase);
    static const std::regex areaLocation(R"(^([A-Za-z]+)/[A-Za-z0-9_+\-]+(/[A-Za-z0-9_+\-]+)*$)");

    const std::string tz(timezone);
    if (tz.empty()) {
        return Error{ErrorCode::ValidationError, "Timezone must be a non-empty string"};
    }
    if (std::regex_match(tz, abbreviation)) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("Invalid timezone: \"{}\". Use IANA names (e.g. "
                                 "\"America/New_York\") instead of abbreviations",
                                 tz)};
    }
    if (tz == "UTC") {
        return {};
    }

    std::smatch m;
    if (std::regex_match(tz, m, areaLocation)) {
        const auto area = m[1].str();
        if (std::find(kTimezoneAreas.begin(), kTimezoneAreas.end(), area) !=
                kTimezoneAreas.end() &&
            isKnownZone(tz)) {
            return {};
        }
    }
    return Error{ErrorCode::ValidationError,
                 fmt::format("Invalid timezone: \"{}\". Must be a valid IANA timezone", tz)};
}

Result<std::string> resolveDate(std::string_view token, DateLocale locale,
                                std::string_view timezone) {
    if (auto tz = validateTimezone(timezone); !tz) {
        return tz.error();
    }

    const auto cleaned = cleanToken(token);
    if (cleaned.empty()) {
        return dateError(token);
    }

    std::optional<CalendarDate> date = parseIso(cleaned);
    if (!date) {
        if (auto parts = parseNumeric(cleaned)) {
            date = fromNumeric(*parts, locale);
        }
    }
    if (!date) {
        date = parseMonthName(cleaned);
    }
    if (!date || !isValidCalendarDate(date->year, date->month, date->day)) {
        spdlog::debug("Date token rejected under {} locale", dateLocaleToString(locale));
        return dateError(token);
    }
    return date->toIso();
}

Result<std::string> reparseDate(std::string_view rawDueDate, std::string_view timezone,
                                DateLocale targetLocale) {
    if (rawDueDate.empty()) {
        return Error{ErrorCode::DateParseError, "No original date text to re-parse"};
    }
    return resolveDate(rawDueDate, targetLocale, timezone);
}

bool isAmbiguousDate(std::string_view token) {
    const auto parts = parseNumeric(cleanToken(token));
    if (!parts) {
        return false;
    }
    return parts->first >= 1 && parts->first <= 12 && parts->second >= 1 && parts->second <= 12;
}

std::optional<DateLocale> inferLocale(std::string_view token) {
    const auto parts = parseNumeric(cleanToken(token));
    if (!parts) {
        return std::nullopt;
    }
    const auto us = fromNumeric(*parts, DateLocale::US);
    const auto eu = fromNumeric(*parts, DateLocale::EU);
    const bool usValid = isValidCalendarDate(us.year, us.month, us.day);
    const bool euValid = isValidCalendarDate(eu.year, eu.month, eu.day);
    if (usValid == euValid) {
        return std::nullopt;
    }
    return usValid ? DateLocale::US : DateLocale::EU;
}

Result<std::string> validateManualDate(std::string_view isoDate) {
    std::string value(isoDate);
    config::trim(value);

    const auto date = parseIso(value);
    if (!date) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("Date must use the YYYY-MM-DD format: \"{}\"", value)};
    }
    if (!isValidCalendarDate(date->year, date->month, date->day)) {
        return Error{ErrorCode::ValidationError, fmt::format("Not a calendar date: {}", value)};
    }
    if (*date < kManualDateMin || *date > kManualDateMax) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("Date {} is outside the allowed range {} to {}", value,
                                 kManualDateMin.toIso(), kManualDateMax.toIso())};
    }
    return date->toIso();
}

DateLocale detectLocaleFromTimezone(std::string_view timezone) {
    if (timezone.starts_with("Europe/") || timezone.starts_with("Africa/")) {
        return DateLocale::EU;
    }
    return DateLocale::US;
}

} // namespace payplan::extraction
