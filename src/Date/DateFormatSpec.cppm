// @file DateFormatSpec.cppm
// @brief ICUの日時書式1つと、その排他制御・タイムゾーン復元を扱う。

module;
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <unicode/datefmt.h>
#include <unicode/locid.h>
#include <unicode/parsepos.h>
#include <unicode/smpdtfmt.h>
#include <unicode/timezone.h>
#include <unicode/udat.h>
#include <unicode/unistr.h>

export module datecodec.date.date_format_spec;

import datecodec.date.date_time;

namespace datecodec::date {

// @brief 解析の前後で書式のタイムゾーンを保存・復元するガード。
// @note 解析が例外で抜けた場合も復元する。
class TimeZoneRestorer {
public:
    explicit TimeZoneRestorer(icu::DateFormat& format)
        : format_(format), saved_(format.getTimeZone().clone()) {}

    ~TimeZoneRestorer() { format_.setTimeZone(*saved_); }

    TimeZoneRestorer(const TimeZoneRestorer&) = delete;
    TimeZoneRestorer& operator=(const TimeZoneRestorer&) = delete;

private:
    icu::DateFormat& format_;
    std::unique_ptr<icu::TimeZone> saved_;
};

// ******************************************************************************** DateFormatSpec

/// @brief 書式の作り方。
export enum class DateFormatKind {
    Pattern,        ///< 明示パターン
    Style,          ///< ロケールのスタイル
    LegacyPattern,  ///< 旧来の米国スタイルを再現したパターン
};

/// @brief 日時書式1つ。
/// @note format と tryParse はこの書式専用のロックの下で行う。
export class DateFormatSpec {
public:
    /// @param format ICUの書式（所有権を受け取る）。
    /// @param kind 書式の作り方。
    /// @param locale 書式のロケール。
    /// @param timeZone 書式に設定するタイムゾーン。
    /// @throws std::runtime_error formatがnullptr、または部分一致を禁止する設定に失敗した場合。
    DateFormatSpec(std::unique_ptr<icu::DateFormat> format, DateFormatKind kind,
        const icu::Locale& locale, const icu::TimeZone& timeZone)
        : format_(std::move(format)), kind_(kind), locale_(locale) {
        if (!format_) {
            throw std::runtime_error("DateFormatSpec: ICU returned no formatter for locale " +
                                     std::string(locale.getName()));
        }
        format_->setTimeZone(timeZone);
        // 寛容な解析（桁数の省略や日付の繰り上げ）は許すが、リテラルの部分一致は許さない
        UErrorCode status = U_ZERO_ERROR;
        format_->setBooleanAttribute(UDAT_PARSE_PARTIAL_LITERAL_MATCH, false, status);
        checkIcuStatus(status, "DateFormatSpec: setBooleanAttribute");
    }

    DateFormatSpec(const DateFormatSpec&) = delete;
    DateFormatSpec& operator=(const DateFormatSpec&) = delete;

    DateFormatKind kind() const { return kind_; }
    const icu::Locale& locale() const { return locale_; }
    bool isReferenceLocale() const { return locale_ == icu::Locale::getUS(); }

    /// @brief 値を文字列化する。
    std::string format(DateTime value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        icu::UnicodeString out;
        format_->format(toUDate(value), out);
        return toUtf8(out);
    }

    /// @brief トークン全体をこの書式で解析する。
    /// @return 解析できなければstd::nullopt。トークンの一部しか消費しない場合も失敗。
    std::optional<DateTime> tryParse(std::string_view token) const {
        std::lock_guard<std::mutex> lock(mutex_);
        TimeZoneRestorer restorer(*format_);

        const icu::UnicodeString text = toUnicode(token);
        icu::ParsePosition position(0);
        const UDate parsed = format_->parse(text, position);
        if (position.getErrorIndex() >= 0 || position.getIndex() != text.length() || text.isEmpty()) {
            return std::nullopt;
        }
        return fromUDate(parsed);
    }

    /// @brief 現在のタイムゾーンIDを返す。
    std::string timeZoneId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        icu::UnicodeString id;
        format_->getTimeZone().getID(id);
        return toUtf8(id);
    }

    /// @brief 書式エンジンのクラス名を返す。
    std::string engineName() const {
        if (dynamic_cast<const icu::SimpleDateFormat*>(format_.get()) != nullptr) {
            return "icu::SimpleDateFormat";
        }
        const icu::DateFormat& engine = *format_;
        return typeid(engine).name();
    }

    /// @brief パターン形式の書式ならパターン文字列を返す。
    std::optional<std::string> pattern() const {
        const auto* simple = dynamic_cast<const icu::SimpleDateFormat*>(format_.get());
        if (simple == nullptr) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        icu::UnicodeString out;
        simple->toPattern(out);
        return toUtf8(out);
    }

private:
    std::unique_ptr<icu::DateFormat> format_;
    DateFormatKind kind_;
    icu::Locale locale_;
    mutable std::mutex mutex_;
};

}  // namespace datecodec::date
