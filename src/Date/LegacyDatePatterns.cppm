// @file LegacyDatePatterns.cppm
// @brief CLDR以前の米国向け日時書式パターン。

module;
#include <string>

export module datecodec.date.legacy_date_patterns;

import datecodec.date.date_time;

export namespace datecodec::date {

/// @brief 日付部分の旧来パターン。
std::string legacyDatePattern(DateStyle style) {
    switch (style) {
    case DateStyle::Short:
        return "M/d/yy";
    case DateStyle::Medium:
        return "MMM d, yyyy";
    case DateStyle::Long:
        return "MMMM d, yyyy";
    case DateStyle::Full:
        return "EEEE, MMMM d, yyyy";
    }
    return "MMM d, yyyy";
}

/// @brief 時刻部分の旧来パターン。LONGとFULLは同じ。
std::string legacyTimePattern(DateStyle style) {
    switch (style) {
    case DateStyle::Short:
        return "h:mm a";
    case DateStyle::Medium:
        return "h:mm:ss a";
    case DateStyle::Long:
    case DateStyle::Full:
        return "h:mm:ss a z";
    }
    return "h:mm:ss a";
}

/// @brief 日付と時刻を空白1つで連結したパターン。
std::string legacyDateTimePattern(DateStyle dateStyle, DateStyle timeStyle) {
    return legacyDatePattern(dateStyle) + " " + legacyTimePattern(timeStyle);
}

}  // namespace datecodec::date
