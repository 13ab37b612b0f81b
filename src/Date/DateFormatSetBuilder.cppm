// @file DateFormatSetBuilder.cppm
// @brief 書式設定と環境から、解析を試す順に並んだ書式集合を構築する。

module;
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <unicode/datefmt.h>
#include <unicode/locid.h>
#include <unicode/resbund.h>
#include <unicode/smpdtfmt.h>
#include <unicode/utypes.h>

export module datecodec.date.date_format_set_builder;

import datecodec.common.message_output;
import datecodec.date.date_time;
import datecodec.date.date_environment;
import datecodec.date.date_format_spec;
import datecodec.date.legacy_date_patterns;

namespace datecodec::date {

// ******************************************************************************** 設定

/// @brief 明示パターンによる書式設定。
export struct DatePattern {
    std::string pattern;
};

/// @brief 日付・時刻スタイルによる書式設定。
export struct DateStylePair {
    DateStyle date = DateStyle::Default;
    DateStyle time = DateStyle::Default;
};

/// @brief 書式設定。構築後は変更しない。
export using DateFormatConfig = std::variant<DatePattern, DateStylePair>;

/// @brief 解析を試す順に並んだ書式集合。0番目が書き出しに使われる。
export using DateFormatSet = std::vector<std::unique_ptr<DateFormatSpec>>;

// ******************************************************************************** 構築

// ロケールのデータが無く代替データが使われる場合に警告する
void warnIfLocaleFallback(const icu::Locale& locale, common::MessageOutput& warnOut) {
    UErrorCode status = U_ZERO_ERROR;
    icu::ResourceBundle bundle(nullptr, locale, status);
    if (status == U_USING_FALLBACK_WARNING || status == U_USING_DEFAULT_WARNING) {
        warnOut.warning(std::string("Locale '") + locale.getName() +
                        "' has no date format data of its own; using '" +
                        bundle.getLocale().getName() + "' instead (" + u_errorName(status) + ")");
    }
}

std::unique_ptr<DateFormatSpec> makePatternSpec(const std::string& pattern, const icu::Locale& locale,
    const DateEnvironment& env, DateFormatKind kind) {
    UErrorCode status = U_ZERO_ERROR;
    auto format = std::make_unique<icu::SimpleDateFormat>(toUnicode(pattern), locale, status);
    checkIcuStatus(status, "buildDateFormatSet: invalid pattern '" + pattern + "'");
    return std::make_unique<DateFormatSpec>(std::move(format), kind, locale, env.timeZone());
}

std::unique_ptr<DateFormatSpec> makeStyleSpec(const DateStylePair& styles, const icu::Locale& locale,
    const DateEnvironment& env) {
    std::unique_ptr<icu::DateFormat> format(
        icu::DateFormat::createDateTimeInstance(toIcuStyle(styles.date), toIcuStyle(styles.time), locale));
    return std::make_unique<DateFormatSpec>(std::move(format), DateFormatKind::Style, locale, env.timeZone());
}

/// @brief 書式集合を構築する。
/// @param config 書式設定。
/// @param env 環境。構築中に1度だけ参照する。
/// @param warnOut 警告出力先。
/// @return 基準ロケール、環境ロケール（異なる場合）、旧来書式（スタイル指定かつ有効な場合）の順。
/// @throws std::runtime_error ICUが書式の作成に失敗した場合。
export DateFormatSet buildDateFormatSet(const DateFormatConfig& config, const DateEnvironment& env,
    common::MessageOutput& warnOut) {
    const icu::Locale& reference = DateEnvironment::referenceLocale();
    const bool addAmbient = !env.isReferenceLocale();
    if (addAmbient) {
        warnIfLocaleFallback(env.locale(), warnOut);
    }

    DateFormatSet formats;
    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, DatePattern>) {
            formats.push_back(makePatternSpec(value.pattern, reference, env, DateFormatKind::Pattern));
            if (addAmbient) {
                formats.push_back(makePatternSpec(value.pattern, env.locale(), env, DateFormatKind::Pattern));
            }
        }
        else {
            formats.push_back(makeStyleSpec(value, reference, env));
            if (addAmbient) {
                formats.push_back(makeStyleSpec(value, env.locale(), env));
            }
            if (env.legacyStyleFallback()) {
                formats.push_back(makePatternSpec(legacyDateTimePattern(value.date, value.time),
                    reference, env, DateFormatKind::LegacyPattern));
            }
        }
    }, config);
    return formats;
}

/// @brief 書式集合を先頭から順に試し、最初に成功した結果を返す。
/// @return どの書式でも解析できなければstd::nullopt。
export std::optional<DateTime> parseWithFormatSet(const DateFormatSet& formats, std::string_view token) {
    for (const auto& spec : formats) {
        if (auto parsed = spec->tryParse(token)) {
            return parsed;
        }
    }
    return std::nullopt;
}

}  // namespace datecodec::date
