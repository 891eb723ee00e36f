#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <payplan/core/types.h>
#include <payplan/extraction/item.h>
#include <payplan/extraction/redaction.h>

namespace payplan::config {

/**
 * @brief Defaults read from the [extraction] section of config.toml
 *
 * @code
 * [extraction]
 * default_locale = "EU"
 * default_timezone = "Europe/Berlin"
 * snippet_length = 80
 * deduplicate = true
 * log_level = "debug"
 * @endcode
 */
struct ExtractionSettings {
    std::optional<extraction::DateLocale> defaultLocale; ///< Unset: derived from the timezone
    std::string defaultTimezone = "UTC";
    size_t snippetLength = extraction::kDefaultSnippetLength;
    bool deduplicate = false;
    std::string logLevel = "info";

    extraction::DateLocale effectiveLocale() const;
};

/**
 * @brief Load settings from a config file, then apply environment overrides
 *
 * A missing file yields the defaults unless required is set.
 * @return NotFound for a missing required file, ValidationError for bad values
 */
Result<ExtractionSettings> loadExtractionConfig(const std::filesystem::path& path,
                                                bool required = false);

/// PAYPLAN_LOCALE and PAYPLAN_TIMEZONE take precedence over the file.
Result<void> applyEnvironmentOverrides(ExtractionSettings& settings);

} // namespace payplan::config
