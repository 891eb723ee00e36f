#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <payplan/core/types.h>
#include <payplan/extraction/item.h>

namespace payplan::extraction {

/**
 * @brief Calendar date without time of day
 */
struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;

    auto operator<=>(const CalendarDate&) const = default;

    /// YYYY-MM-DD
    std::string toIso() const;
};

/// Inclusive bounds for operator-entered dates.
inline constexpr CalendarDate kManualDateMin{2020, 1, 1};
inline constexpr CalendarDate kManualDateMax{2032, 12, 31};

bool isLeapYear(int year);
int daysInMonth(int year, int month);
bool isValidCalendarDate(int year, int month, int day);

/**
 * @brief Validate an IANA timezone identifier
 *
 * Accepts "UTC" and Area/Location names present in the tz database ($TZDIR, default
 * /usr/share/zoneinfo). When no database is installed any name under a known area passes.
 * Abbreviations such as EST or GMT+5 are rejected
 * because they carry no daylight saving rules.
 * @return ValidationError when the identifier is not acceptable
 */
Result<void> validateTimezone(std::string_view timezone);

/**
 * @brief Resolve a raw date token to YYYY-MM-DD
 *
 * Tokens with a month name or in ISO form are read directly and the locale is ignored.
 * Numeric A/B/YYYY tokens are month/day under US and day/month under EU.
 * @return DateParseError for unreadable tokens or impossible dates (Feb 30, month 13),
 *         ValidationError for an invalid timezone
 */
Result<std::string> resolveDate(std::string_view token, DateLocale locale,
                                std::string_view timezone);

/**
 * @brief Re-read a stored raw date under another locale
 *
 * Always pass the original raw text, never an already resolved ISO date.
 */
Result<std::string> reparseDate(std::string_view rawDueDate, std::string_view timezone,
                                DateLocale targetLocale);

/// True for numeric tokens where both leading components lie in 1..12.
bool isAmbiguousDate(std::string_view token);

/// The only locale under which a numeric token is a real date, if exactly one exists.
std::optional<DateLocale> inferLocale(std::string_view token);

/**
 * @brief Check an operator-entered date
 *
 * Must be strict YYYY-MM-DD, a real calendar date, and inside [2020-01-01, 2032-12-31].
 * @return the normalized date, or ValidationError
 */
Result<std::string> validateManualDate(std::string_view isoDate);

/// Europe/* and Africa/* read day first, everything else month first.
DateLocale detectLocaleFromTimezone(std::string_view timezone);

} // namespace payplan::extraction
