#include <cstdlib>
#include <fstream>
#include <random>
#include <gtest/gtest.h>
#include <payplan/config/config_helpers.h>
#include <payplan/config/extraction_config.h>

using namespace payplan;
using namespace payplan::config;
using namespace payplan::extraction;

class ExtractionConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("PAYPLAN_LOCALE");
        ::unsetenv("PAYPLAN_TIMEZONE");
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("payplan_config_test_" + std::to_string(rd()) + ".toml");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        ::unsetenv("PAYPLAN_LOCALE");
        ::unsetenv("PAYPLAN_TIMEZONE");
    }

    void writeConfig(const std::string& contents) {
        std::ofstream out(path_);
        out << contents;
    }

    std::filesystem::path path_;
};

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  value \t";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST(ConfigHelpersTest, ParseBool) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool(" OFF "), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST_F(ExtractionConfigTest, ParseConfigValueBySection) {
    writeConfig("# payplan\n"
                "[other]\n"
                "default_locale = \"US\"\n"
                "\n"
                "[extraction]\n"
                "default_locale = \"EU\" # comment\n"
                "default_timezone = 'Europe/Berlin'\n"
                "label = \"a # b\"\n");

    EXPECT_EQ(parse_config_value(path_, "extraction", "default_locale"), "EU");
    EXPECT_EQ(parse_config_value(path_, "other", "default_locale"), "US");
    EXPECT_EQ(parse_config_value(path_, "extraction", "default_timezone"), "Europe/Berlin");
    EXPECT_EQ(parse_config_value(path_, "extraction", "label"), "a # b");
    EXPECT_EQ(parse_config_value(path_, "extraction", "missing"), "");
    EXPECT_EQ(parse_config_value(path_ / "nope", "extraction", "default_locale"), "");
}

TEST_F(ExtractionConfigTest, DottedKeys) {
    writeConfig("extraction.deduplicate = true\n");
    EXPECT_EQ(parse_config_value(path_, "extraction", "deduplicate"), "true");
}

TEST_F(ExtractionConfigTest, LoadsAllSettings) {
    writeConfig("[extraction]\n"
                "default_locale = \"eu\"\n"
                "default_timezone = \"Europe/Berlin\"\n"
                "snippet_length = 80\n"
                "deduplicate = yes\n"
                "log_level = \"debug\"\n");

    auto settings = loadExtractionConfig(path_);
    ASSERT_TRUE(settings) << settings.error().message;
    EXPECT_EQ(settings.value().defaultLocale, DateLocale::EU);
    EXPECT_EQ(settings.value().defaultTimezone, "Europe/Berlin");
    EXPECT_EQ(settings.value().snippetLength, 80u);
    EXPECT_TRUE(settings.value().deduplicate);
    EXPECT_EQ(settings.value().logLevel, "debug");
}

TEST_F(ExtractionConfigTest, MissingFileUsesDefaults) {
    auto settings = loadExtractionConfig(path_);
    ASSERT_TRUE(settings);
    EXPECT_FALSE(settings.value().defaultLocale.has_value());
    EXPECT_EQ(settings.value().defaultTimezone, "UTC");
    EXPECT_EQ(settings.value().snippetLength, kDefaultSnippetLength);
    EXPECT_EQ(settings.value().effectiveLocale(), DateLocale::US);

    auto required = loadExtractionConfig(path_, true);
    ASSERT_FALSE(required);
    EXPECT_EQ(required.error().code, ErrorCode::NotFound);
}

TEST_F(ExtractionConfigTest, LocaleFollowsTimezoneWhenUnset) {
    writeConfig("[extraction]\ndefault_timezone = \"Europe/Madrid\"\n");
    auto settings = loadExtractionConfig(path_);
    ASSERT_TRUE(settings);
    EXPECT_EQ(settings.value().effectiveLocale(), DateLocale::EU);
}

TEST_F(ExtractionConfigTest, RejectsBadValues) {
    writeConfig("[extraction]\ndefault_locale = \"JP\"\n");
    auto badLocale = loadExtractionConfig(path_);
    ASSERT_FALSE(badLocale);
    EXPECT_EQ(badLocale.error().code, ErrorCode::ValidationError);

    writeConfig("[extraction]\ndefault_timezone = \"EST\"\n");
    EXPECT_FALSE(loadExtractionConfig(path_));

    writeConfig("[extraction]\nsnippet_length = 0\n");
    EXPECT_FALSE(loadExtractionConfig(path_));

    writeConfig("[extraction]\ndeduplicate = sometimes\n");
    EXPECT_FALSE(loadExtractionConfig(path_));

    writeConfig("[extraction]\nlog_level = \"loud\"\n");
    EXPECT_FALSE(loadExtractionConfig(path_));
}

TEST_F(ExtractionConfigTest, EnvironmentOverridesFile) {
    writeConfig("[extraction]\n"
                "default_locale = \"US\"\n"
                "default_timezone = \"America/Chicago\"\n");
    ::setenv("PAYPLAN_LOCALE", "EU", 1);
    ::setenv("PAYPLAN_TIMEZONE", "Europe/Rome", 1);

    auto settings = loadExtractionConfig(path_);
    ASSERT_TRUE(settings);
    EXPECT_EQ(settings.value().defaultLocale, DateLocale::EU);
    EXPECT_EQ(settings.value().defaultTimezone, "Europe/Rome");

    ::setenv("PAYPLAN_TIMEZONE", "PST", 1);
    auto invalid = loadExtractionConfig(path_);
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, ErrorCode::ValidationError);
}
