#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <payplan/cache/extraction_cache.h>
#include <payplan/config/config_helpers.h>
#include <payplan/config/extraction_config.h>
#include <payplan/extraction/confidence_scorer.h>
#include <payplan/extraction/date_resolver.h>
#include <payplan/extraction/email_extractor.h>
#include <payplan/extraction/error_messages.h>
#include <payplan/quickfix/quick_fix_engine.h>

using json = nlohmann::json;
using namespace payplan;

namespace {

json toJson(const extraction::Item& item) {
    return {{"id", item.id},
            {"provider", extraction::providerToString(item.provider)},
            {"installment_no", item.installmentNo},
            {"due_date", item.dueDate},
            {"raw_due_date", item.rawDueDate},
            {"amount_cents", item.amountCents},
            {"currency", item.currency},
            {"autopay", item.autopay},
            {"late_fee_cents", item.lateFeeCents},
            {"confidence", item.confidence},
            {"confidence_band",
             extraction::confidenceBandToString(extraction::confidenceBand(item.confidence))}};
}

json toJson(const extraction::ExtractionResult& result) {
    json items = json::array();
    for (const auto& item : result.items) {
        items.push_back(toJson(item));
    }
    json issues = json::array();
    for (const auto& issue : result.issues) {
        issues.push_back({{"id", issue.id}, {"reason", issue.reason}, {"snippet", issue.snippet}});
    }
    return {{"items", items},
            {"issues", issues},
            {"date_locale", extraction::dateLocaleToString(result.dateLocale)},
            {"segments", result.segmentCount},
            {"duplicates_removed", result.duplicatesRemoved}};
}

bool readInput(const std::string& source, std::string& out) {
    if (source.empty() || source == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

int reportError(const Error& error) {
    spdlog::error("{}: {}", error.code, error.message);
    std::cerr << extraction::userFriendlyMessage(error) << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Extract BNPL payment schedules from reminder emails", "payplan-cli"};
        app.set_version_flag("--version", "1.0.0");
        app.require_subcommand(1);

        std::string configPath;
        bool verbose = false;
        app.add_option("-c,--config", configPath, "Path to config.toml");
        app.add_flag("-v,--verbose", verbose, "Enable debug logging");

        // extract
        auto* extractCmd = app.add_subcommand("extract", "Extract payment items as JSON");
        std::string input = "-";
        std::string timezone;
        std::string localeTag;
        bool dedup = false;
        extractCmd->add_option("file", input, "Email text file, '-' for stdin");
        extractCmd->add_option("-t,--timezone", timezone, "IANA timezone, e.g. America/New_York");
        extractCmd->add_option("-l,--locale", localeTag, "Date locale for ambiguous dates")
            ->check(CLI::IsMember({"US", "EU", "us", "eu"}));
        extractCmd->add_flag("--dedup", dedup, "Drop repeated installments");

        // reparse
        auto* reparseCmd = app.add_subcommand("reparse", "Re-read a date under a locale");
        std::string rawDate;
        reparseCmd->add_option("date", rawDate, "Date text as it appeared in the email")
            ->required();
        reparseCmd->add_option("-t,--timezone", timezone, "IANA timezone");
        reparseCmd->add_option("-l,--locale", localeTag, "Target date locale")
            ->check(CLI::IsMember({"US", "EU", "us", "eu"}));

        CLI11_PARSE(app, argc, argv);

        auto settings = config::loadExtractionConfig(config::get_config_path(configPath),
                                                     !configPath.empty());
        if (!settings) {
            return reportError(settings.error());
        }
        const auto& cfg = settings.value();

        spdlog::set_level(verbose ? spdlog::level::debug
                                  : spdlog::level::from_str(cfg.logLevel));

        if (timezone.empty()) {
            timezone = cfg.defaultTimezone;
        }
        const auto locale = localeTag.empty()
                                ? cfg.defaultLocale.value_or(
                                      extraction::detectLocaleFromTimezone(timezone))
                                : extraction::dateLocaleFromString(localeTag)
                                      .value_or(extraction::DateLocale::US);

        if (*extractCmd) {
            std::string text;
            if (!readInput(input, text)) {
                return reportError(Error{ErrorCode::NotFound, "Cannot read " + input});
            }
            if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
                return reportError(Error{ErrorCode::InvalidArgument, "Email text is empty"});
            }

            cache::ExtractionCache cache;
            extraction::ExtractionEngine engine(cache);
            extraction::ExtractOptions options;
            options.dateLocale = locale;
            options.deduplicate = dedup || cfg.deduplicate;
            options.snippetLength = cfg.snippetLength;

            auto result = engine.extract(text, timezone, options);
            if (!result) {
                return reportError(result.error());
            }
            std::cout << toJson(result.value()).dump(2) << std::endl;
            return 0;
        }

        if (*reparseCmd) {
            auto iso = quickfix::QuickFixEngine::reparseDate(rawDate, timezone, locale);
            if (!iso) {
                return reportError(iso.error());
            }
            json out = {{"raw", rawDate},
                        {"locale", extraction::dateLocaleToString(locale)},
                        {"due_date", iso.value()}};
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
