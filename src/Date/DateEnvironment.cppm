// @file DateEnvironment.cppm
// @brief ロケールとタイムゾーンの環境スナップショット。

module;
#include <memory>
#include <stdexcept>
#include <string>
#include <unicode/locid.h>
#include <unicode/timezone.h>
#include <unicode/unistr.h>

export module datecodec.date.date_environment;

import datecodec.date.date_time;

export namespace datecodec::date {

/// @brief 書式集合の構築時に参照する環境。
/// @note 構築後は環境変数やプロセス既定値を再読込しない。
class DateEnvironment {
public:
    /// @param locale 環境ロケール。
    /// @param timeZone 環境タイムゾーン（複製して保持する）。
    /// @param legacyStyleFallback スタイル指定時に旧来の米国書式を末尾へ追加するか。
    DateEnvironment(const icu::Locale& locale, const icu::TimeZone& timeZone, bool legacyStyleFallback)
        : locale_(locale), timeZone_(timeZone.clone()), legacyStyleFallback_(legacyStyleFallback) {}

    DateEnvironment(const DateEnvironment& other)
        : locale_(other.locale_), timeZone_(other.timeZone_->clone()),
          legacyStyleFallback_(other.legacyStyleFallback_) {}

    DateEnvironment& operator=(const DateEnvironment& other) {
        if (this != &other) {
            locale_ = other.locale_;
            timeZone_.reset(other.timeZone_->clone());
            legacyStyleFallback_ = other.legacyStyleFallback_;
        }
        return *this;
    }

    DateEnvironment(DateEnvironment&&) noexcept = default;
    DateEnvironment& operator=(DateEnvironment&&) noexcept = default;

    /// @brief ICUのプロセス既定値を1度だけ読み取る。
    static DateEnvironment current() {
        std::unique_ptr<icu::TimeZone> zone(icu::TimeZone::createDefault());
        return DateEnvironment(icu::Locale::getDefault(), *zone, true);
    }

    /// @brief ロケールIDとタイムゾーンIDから環境を作成する。
    /// @throws std::runtime_error タイムゾーンIDが不明な場合。
    static DateEnvironment create(const std::string& localeId, const std::string& timeZoneId,
        bool legacyStyleFallback = true) {
        std::unique_ptr<icu::TimeZone> zone(icu::TimeZone::createTimeZone(toUnicode(timeZoneId)));
        if (!zone || *zone == icu::TimeZone::getUnknown()) {
            throw std::runtime_error("DateEnvironment: unknown time zone '" + timeZoneId + "'");
        }
        icu::Locale locale(localeId.c_str());
        if (locale.isBogus()) {
            throw std::runtime_error("DateEnvironment: invalid locale '" + localeId + "'");
        }
        return DateEnvironment(locale, *zone, legacyStyleFallback);
    }

    /// @brief 基準ロケール（en_US）。
    static const icu::Locale& referenceLocale() { return icu::Locale::getUS(); }

    const icu::Locale& locale() const { return locale_; }
    const icu::TimeZone& timeZone() const { return *timeZone_; }
    bool legacyStyleFallback() const { return legacyStyleFallback_; }

    bool isReferenceLocale() const { return locale_ == referenceLocale(); }

private:
    icu::Locale locale_;
    std::unique_ptr<icu::TimeZone> timeZone_;
    bool legacyStyleFallback_ = true;
};

}  // namespace datecodec::date
