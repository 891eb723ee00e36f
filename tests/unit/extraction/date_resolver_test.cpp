#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <payplan/extraction/date_resolver.h>

using namespace payplan;
using namespace payplan::extraction;

namespace {
constexpr const char* kTz = "America/New_York";
}

TEST(DateResolverTest, AmbiguousNumericDateFollowsLocale) {
    auto us = resolveDate("01/02/2026", DateLocale::US, kTz);
    auto eu = resolveDate("01/02/2026", DateLocale::EU, kTz);
    ASSERT_TRUE(us);
    ASSERT_TRUE(eu);
    EXPECT_EQ(us.value(), "2026-01-02");
    EXPECT_EQ(eu.value(), "2026-02-01");
}

TEST(DateResolverTest, AlternateSeparators) {
    EXPECT_EQ(resolveDate("15.03.2026", DateLocale::EU, kTz).value(), "2026-03-15");
    EXPECT_EQ(resolveDate("3-15-2026", DateLocale::US, kTz).value(), "2026-03-15");
    EXPECT_FALSE(resolveDate("03/15-2026", DateLocale::US, kTz));
}

TEST(DateResolverTest, MonthNameDatesIgnoreLocale) {
    for (auto locale : {DateLocale::US, DateLocale::EU}) {
        EXPECT_EQ(resolveDate("October 6, 2025", locale, kTz).value(), "2025-10-06");
        EXPECT_EQ(resolveDate("Oct. 6, 2025", locale, kTz).value(), "2025-10-06");
        EXPECT_EQ(resolveDate("6th October 2025", locale, kTz).value(), "2025-10-06");
        EXPECT_EQ(resolveDate("2025-10-06", locale, kTz).value(), "2025-10-06");
    }
}

TEST(DateResolverTest, InvalidCalendarDatesAreRejected) {
    auto feb30 = resolveDate("02/30/2026", DateLocale::US, kTz);
    ASSERT_FALSE(feb30);
    EXPECT_EQ(feb30.error().code, ErrorCode::DateParseError);

    EXPECT_FALSE(resolveDate("13/01/2026", DateLocale::US, kTz));
    EXPECT_FALSE(resolveDate("02/29/2025", DateLocale::US, kTz));
    EXPECT_TRUE(resolveDate("02/29/2024", DateLocale::US, kTz));
    EXPECT_FALSE(resolveDate("Smarch 3, 2026", DateLocale::US, kTz));
    EXPECT_FALSE(resolveDate("", DateLocale::US, kTz));
}

TEST(DateResolverTest, TimezoneValidation) {
    EXPECT_TRUE(validateTimezone("UTC"));
    EXPECT_TRUE(validateTimezone("Europe/London"));
    EXPECT_TRUE(validateTimezone("America/Argentina/Buenos_Aires"));

    auto abbreviation = validateTimezone("EST");
    ASSERT_FALSE(abbreviation);
    EXPECT_EQ(abbreviation.error().code, ErrorCode::ValidationError);

    EXPECT_FALSE(validateTimezone(""));
    EXPECT_FALSE(validateTimezone("GMT+5"));
    EXPECT_FALSE(validateTimezone("Mars/Olympus_Mons"));

    auto viaResolve = resolveDate("01/02/2026", DateLocale::US, "PST");
    ASSERT_FALSE(viaResolve);
    EXPECT_EQ(viaResolve.error().code, ErrorCode::ValidationError);
}

TEST(DateResolverTest, TimezoneMustExistInZoneDatabase) {
    namespace fs = std::filesystem;
    const auto tzdir = fs::temp_directory_path() / "payplan_zoneinfo_test";
    fs::create_directories(tzdir / "America");
    std::ofstream(tzdir / "America" / "New_York") << "TZif";

    const char* previous = std::getenv("TZDIR");
    const std::string saved = previous ? previous : "";
    ::setenv("TZDIR", tzdir.c_str(), 1);

    EXPECT_TRUE(validateTimezone("America/New_York"));
    EXPECT_TRUE(validateTimezone("UTC"));
    auto unknown = validateTimezone("America/Atlantis");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(resolveDate("01/02/2026", DateLocale::US, "America/Atlantis"));

    if (previous) {
        ::setenv("TZDIR", saved.c_str(), 1);
    } else {
        ::unsetenv("TZDIR");
    }
    fs::remove_all(tzdir);
}

TEST(DateResolverTest, AmbiguityAndInferredLocale) {
    EXPECT_TRUE(isAmbiguousDate("01/02/2026"));
    EXPECT_FALSE(isAmbiguousDate("01/15/2026"));
    EXPECT_FALSE(isAmbiguousDate("October 6, 2025"));

    EXPECT_EQ(inferLocale("13/02/2026"), DateLocale::EU);
    EXPECT_EQ(inferLocale("01/15/2026"), DateLocale::US);
    EXPECT_FALSE(inferLocale("01/02/2026").has_value());
    EXPECT_FALSE(inferLocale("2026-01-02").has_value());
}

TEST(DateResolverTest, ReparseIsStrictUnderTargetLocale) {
    EXPECT_EQ(reparseDate("01/02/2026", kTz, DateLocale::EU).value(), "2026-02-01");

    auto impossible = reparseDate("01/15/2026", kTz, DateLocale::EU);
    ASSERT_FALSE(impossible);
    EXPECT_EQ(impossible.error().code, ErrorCode::DateParseError);

    auto empty = reparseDate("", kTz, DateLocale::US);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::DateParseError);
}

TEST(DateResolverTest, ManualDateBoundsAreInclusive) {
    EXPECT_TRUE(validateManualDate("2020-01-01"));
    EXPECT_TRUE(validateManualDate("2032-12-31"));

    auto tooLate = validateManualDate("2033-01-01");
    ASSERT_FALSE(tooLate);
    EXPECT_EQ(tooLate.error().code, ErrorCode::ValidationError);

    EXPECT_FALSE(validateManualDate("2019-12-31"));
    EXPECT_FALSE(validateManualDate("2026-02-30"));
    EXPECT_FALSE(validateManualDate("10/06/2026"));
    EXPECT_EQ(validateManualDate(" 2026-03-15 ").value(), "2026-03-15");
}

TEST(DateResolverTest, LocaleFromTimezone) {
    EXPECT_EQ(detectLocaleFromTimezone("Europe/Berlin"), DateLocale::EU);
    EXPECT_EQ(detectLocaleFromTimezone("America/Chicago"), DateLocale::US);
    EXPECT_EQ(detectLocaleFromTimezone("UTC"), DateLocale::US);
}
