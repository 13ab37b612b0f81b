import datecodec.date.date_time;
import datecodec.date.date_environment;
import datecodec.date.date_format_spec;
import datecodec.date.date_format_set_builder;
import datecodec.date.legacy_date_patterns;
import datecodec.test_helper;
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <unicode/locid.h>
#include <unicode/smpdtfmt.h>
#include <unicode/timezone.h>

using namespace datecodec::date;
using datecodec::test::CollectingMessageOutput;
using datecodec::test::makeEnvironment;
using datecodec::test::utcTime;

namespace {

// UTCのen_USパターン書式を作る
std::unique_ptr<DateFormatSpec> makeUtcPatternSpec(const std::string& pattern) {
    UErrorCode status = U_ZERO_ERROR;
    auto format = std::make_unique<icu::SimpleDateFormat>(toUnicode(pattern), icu::Locale::getUS(), status);
    checkIcuStatus(status, "makeUtcPatternSpec");
    std::unique_ptr<icu::TimeZone> utc(icu::TimeZone::createTimeZone("UTC"));
    return std::make_unique<DateFormatSpec>(std::move(format), DateFormatKind::Pattern, icu::Locale::getUS(), *utc);
}

} // namespace

// ******************************************************************************** 構成と順序

TEST(DateFormatSetBuilderTest, PatternInReferenceLocaleHasOneFormat) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DatePattern{"yyyy-MM-dd"}, makeEnvironment("en_US", "UTC"), warnOut);

    ASSERT_EQ(formats.size(), 1u);
    EXPECT_EQ(formats[0]->kind(), DateFormatKind::Pattern);
    EXPECT_EQ(formats[0]->pattern(), std::optional<std::string>("yyyy-MM-dd"));
    EXPECT_TRUE(warnOut.messages().empty());
}

TEST(DateFormatSetBuilderTest, PatternAddsAmbientLocale) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DatePattern{"dd. MMMM yyyy"}, makeEnvironment("de_DE", "UTC"), warnOut);

    ASSERT_EQ(formats.size(), 2u);
    EXPECT_EQ(std::string(formats[0]->locale().getName()), "en_US");
    EXPECT_EQ(std::string(formats[1]->locale().getName()), "de_DE");
    EXPECT_TRUE(formats[0]->isReferenceLocale());
    EXPECT_FALSE(formats[1]->isReferenceLocale());
}

TEST(DateFormatSetBuilderTest, StylesAddLegacyFormatLast) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DateStylePair{DateStyle::Medium, DateStyle::Medium},
        makeEnvironment("en_US", "UTC"), warnOut);

    ASSERT_EQ(formats.size(), 2u);
    EXPECT_EQ(formats[0]->kind(), DateFormatKind::Style);
    EXPECT_EQ(formats[1]->kind(), DateFormatKind::LegacyPattern);
    EXPECT_EQ(formats[1]->pattern(), std::optional<std::string>("MMM d, yyyy h:mm:ss a"));
}

TEST(DateFormatSetBuilderTest, StylesWithAmbientLocale) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DateStylePair{DateStyle::Long, DateStyle::Short},
        makeEnvironment("de_DE", "UTC"), warnOut);

    ASSERT_EQ(formats.size(), 3u);
    EXPECT_EQ(formats[0]->kind(), DateFormatKind::Style);
    EXPECT_EQ(std::string(formats[0]->locale().getName()), "en_US");
    EXPECT_EQ(formats[1]->kind(), DateFormatKind::Style);
    EXPECT_EQ(std::string(formats[1]->locale().getName()), "de_DE");
    EXPECT_EQ(formats[2]->kind(), DateFormatKind::LegacyPattern);
    EXPECT_EQ(std::string(formats[2]->locale().getName()), "en_US");
}

TEST(DateFormatSetBuilderTest, LegacyFallbackCanBeDisabled) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DateStylePair{}, makeEnvironment("de_DE", "UTC", false), warnOut);

    ASSERT_EQ(formats.size(), 2u);
    EXPECT_EQ(formats[1]->kind(), DateFormatKind::Style);
}

TEST(DateFormatSetBuilderTest, FormatsUseEnvironmentTimeZone) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DateStylePair{}, makeEnvironment("fr_FR", "Asia/Tokyo"), warnOut);
    for (const auto& spec : formats) {
        EXPECT_EQ(spec->timeZoneId(), "Asia/Tokyo");
    }
}

// ******************************************************************************** 警告とエラー

TEST(DateFormatSetBuilderTest, WarnsWhenLocaleHasNoData) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DatePattern{"yyyy-MM-dd"}, makeEnvironment("xx_YY", "UTC"), warnOut);

    EXPECT_EQ(formats.size(), 2u);
    auto messages = warnOut.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages[0].find("xx_YY"), std::string::npos);
}

TEST(DateEnvironmentTest, UnknownTimeZoneThrows) {
    EXPECT_THROW(makeEnvironment("en_US", "Mars/Olympus_Mons"), std::runtime_error);
}

TEST(DateEnvironmentTest, CopyKeepsIndependentTimeZone) {
    auto original = makeEnvironment("ja_JP", "Asia/Tokyo", false);
    DateEnvironment copy = original;
    EXPECT_FALSE(copy.isReferenceLocale());
    EXPECT_FALSE(copy.legacyStyleFallback());
    EXPECT_NE(&copy.timeZone(), &original.timeZone());
    EXPECT_TRUE(copy.timeZone() == original.timeZone());
}

// ******************************************************************************** 旧来パターン

TEST(LegacyDatePatternsTest, PatternsPerStyle) {
    EXPECT_EQ(legacyDatePattern(DateStyle::Short), "M/d/yy");
    EXPECT_EQ(legacyDatePattern(DateStyle::Medium), "MMM d, yyyy");
    EXPECT_EQ(legacyDatePattern(DateStyle::Long), "MMMM d, yyyy");
    EXPECT_EQ(legacyDatePattern(DateStyle::Full), "EEEE, MMMM d, yyyy");

    EXPECT_EQ(legacyTimePattern(DateStyle::Short), "h:mm a");
    EXPECT_EQ(legacyTimePattern(DateStyle::Medium), "h:mm:ss a");
    EXPECT_EQ(legacyTimePattern(DateStyle::Long), "h:mm:ss a z");
    EXPECT_EQ(legacyTimePattern(DateStyle::Full), "h:mm:ss a z");

    EXPECT_EQ(legacyDateTimePattern(DateStyle::Short, DateStyle::Short), "M/d/yy h:mm a");
}

TEST(LegacyDatePatternsTest, FormatsLikeTheOldUsEngine) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DateStylePair{DateStyle::Medium, DateStyle::Medium},
        makeEnvironment("en_US", "UTC"), warnOut);

    EXPECT_EQ(formats.back()->format(utcTime(2023, 7, 4, 10, 15, 30)), "Jul 4, 2023 10:15:30 AM");
}

// ******************************************************************************** DateFormatSpec

TEST(DateFormatSpecTest, TimeZoneIsRestoredAfterZoneBearingParse) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DatePattern{"yyyy-MM-dd HH:mm z"}, makeEnvironment("en_US", "UTC"), warnOut);
    auto& spec = *formats[0];

    auto parsed = spec.tryParse("2023-07-04 10:15 PST");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, utcTime(2023, 7, 4, 18, 15));
    EXPECT_EQ(spec.timeZoneId(), "UTC");
}

TEST(DateFormatSpecTest, RequiresFullConsumption) {
    CollectingMessageOutput warnOut;
    auto formats = buildDateFormatSet(DatePattern{"yyyy-MM-dd"}, makeEnvironment("en_US", "UTC"), warnOut);

    EXPECT_TRUE(formats[0]->tryParse("2023-07-04").has_value());
    EXPECT_FALSE(formats[0]->tryParse("2023-07-04T10:15:30Z").has_value());
    EXPECT_FALSE(formats[0]->tryParse("04/07/2023").has_value());
    EXPECT_FALSE(formats[0]->tryParse("").has_value());
    EXPECT_EQ(formats[0]->timeZoneId(), "UTC");
}

TEST(DateFormatSpecTest, AcceptsShortenedNumericFields) {
    auto spec = makeUtcPatternSpec("yyyy-MM-dd");
    EXPECT_EQ(spec->tryParse("2023-7-4"), std::optional<DateTime>(utcTime(2023, 7, 4)));
    EXPECT_EQ(spec->engineName(), "icu::SimpleDateFormat");
}

// ******************************************************************************** 順に試す解析

TEST(ParseWithFormatSetTest, FirstMatchingFormatWins) {
    DateFormatSet formats;
    formats.push_back(makeUtcPatternSpec("dd/MM/yyyy"));
    formats.push_back(makeUtcPatternSpec("MM/dd/yyyy"));

    EXPECT_EQ(parseWithFormatSet(formats, "04/07/2023"), std::optional<DateTime>(utcTime(2023, 7, 4)));
}

TEST(ParseWithFormatSetTest, LaterFormatIsTriedWhenEarlierOnesFail) {
    DateFormatSet formats;
    formats.push_back(makeUtcPatternSpec("dd.MM.yyyy"));
    formats.push_back(makeUtcPatternSpec("yyyy-dd-MM"));

    EXPECT_EQ(parseWithFormatSet(formats, "2023-07-04"), std::optional<DateTime>(utcTime(2023, 4, 7)));
    EXPECT_FALSE(parseWithFormatSet(formats, "tomorrow").has_value());
}
