// @file Iso8601.cppm
// @brief ISO 8601形式の日時の解析と書き出し。

module;
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unicode/gregocal.h>
#include <unicode/timezone.h>
#include <unicode/ucal.h>
#include <unicode/unistr.h>

export module datecodec.date.iso8601;

import datecodec.date.date_time;

namespace datecodec::date {

/// @brief 日時文字列の解析失敗。
export class DateParseError : public std::runtime_error {
public:
    DateParseError(const std::string& message, std::size_t errorOffset)
        : std::runtime_error(message), errorOffset_(errorOffset) {}

    /// @brief 解析を開始した位置。
    std::size_t errorOffset() const noexcept { return errorOffset_; }

private:
    std::size_t errorOffset_;
};

// ******************************************************************************** 解析補助

// 解析途中の失敗理由。呼び出し元でDateParseErrorへ包み直す。
class Iso8601Failure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool checkOffset(std::string_view text, std::size_t offset, char expected) {
    return offset < text.size() && text[offset] == expected;
}

// [begin, end) の10進数を読む
int parseInt(std::string_view text, std::size_t begin, std::size_t end) {
    if (end > text.size() || begin >= end) {
        throw Iso8601Failure("Unexpected end of input");
    }
    int result = 0;
    for (std::size_t i = begin; i < end; ++i) {
        if (!isDigit(text[i])) {
            throw Iso8601Failure("Invalid number: " + std::string(text.substr(begin, end - begin)));
        }
        result = result * 10 + (text[i] - '0');
    }
    return result;
}

std::size_t indexOfNonDigit(std::string_view text, std::size_t offset) {
    for (std::size_t i = offset; i < text.size(); ++i) {
        if (!isDigit(text[i])) {
            return i;
        }
    }
    return text.size();
}

std::string stripColons(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c != ':') {
            out += c;
        }
    }
    return out;
}

// 各フィールドを厳密なグレゴリオ暦で検証し、時刻へ変換する
DateTime resolveFields(const icu::TimeZone& zone, int year, int month, int day,
    int hour, int minute, int second, int millis) {
    UErrorCode status = U_ZERO_ERROR;
    icu::GregorianCalendar calendar(zone, status);
    checkIcuStatus(status, "parseIso8601: GregorianCalendar");
    calendar.setLenient(false);
    calendar.clear();
    calendar.set(UCAL_YEAR, year);
    calendar.set(UCAL_MONTH, month - 1);
    calendar.set(UCAL_DATE, day);
    calendar.set(UCAL_HOUR_OF_DAY, hour);
    calendar.set(UCAL_MINUTE, minute);
    calendar.set(UCAL_SECOND, second);
    calendar.set(UCAL_MILLISECOND, millis);
    const UDate time = calendar.getTime(status);
    if (U_FAILURE(status)) {
        throw Iso8601Failure(std::string("Illegal field value (") + u_errorName(status) + ")");
    }
    return fromUDate(time);
}

DateTime parseFields(std::string_view text, std::size_t& position, const icu::TimeZone& defaultZone) {
    std::size_t offset = position;

    const int year = parseInt(text, offset, offset + 4);
    offset += 4;
    if (checkOffset(text, offset, '-')) {
        ++offset;
    }
    const int month = parseInt(text, offset, offset + 2);
    offset += 2;
    if (checkOffset(text, offset, '-')) {
        ++offset;
    }
    const int day = parseInt(text, offset, offset + 2);
    offset += 2;

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;

    const bool hasTime = checkOffset(text, offset, 'T');
    if (!hasTime && text.size() <= offset) {
        // 日付のみ: 既定タイムゾーンの0時
        DateTime result = resolveFields(defaultZone, year, month, day, 0, 0, 0, 0);
        position = offset;
        return result;
    }

    if (hasTime) {
        ++offset;
        hour = parseInt(text, offset, offset + 2);
        offset += 2;
        if (checkOffset(text, offset, ':')) {
            ++offset;
        }
        minute = parseInt(text, offset, offset + 2);
        offset += 2;
        if (checkOffset(text, offset, ':')) {
            ++offset;
        }
        if (text.size() > offset) {
            const char c = text[offset];
            if (c != 'Z' && c != '+' && c != '-') {
                second = parseInt(text, offset, offset + 2);
                offset += 2;
                // うるう秒
                if (second > 59 && second < 63) {
                    second = 59;
                }
                if (checkOffset(text, offset, '.')) {
                    ++offset;
                    const std::size_t endOffset = indexOfNonDigit(text, offset + 1);
                    const std::size_t parseEndOffset = std::min(endOffset, offset + 3);
                    const int fraction = parseInt(text, offset, parseEndOffset);
                    switch (parseEndOffset - offset) {
                    case 2:
                        millis = fraction * 10;
                        break;
                    case 1:
                        millis = fraction * 100;
                        break;
                    default:
                        millis = fraction;
                    }
                    offset = endOffset;
                }
            }
        }
    }

    if (text.size() <= offset) {
        throw Iso8601Failure("No time zone indicator");
    }

    std::unique_ptr<icu::TimeZone> zone;
    const char indicator = text[offset];
    if (indicator == 'Z') {
        zone.reset(icu::TimeZone::getGMT()->clone());
        ++offset;
    }
    else if (indicator == '+' || indicator == '-') {
        std::string zoneOffset(text.substr(offset));
        if (zoneOffset.size() < 5) {
            zoneOffset += "00";
        }
        offset += zoneOffset.size();
        if (zoneOffset == "+0000" || zoneOffset == "+00:00") {
            zone.reset(icu::TimeZone::getGMT()->clone());
        }
        else {
            const std::string zoneId = "GMT" + zoneOffset;
            zone.reset(icu::TimeZone::createTimeZone(toUnicode(zoneId)));
            icu::UnicodeString resolved;
            zone->getID(resolved);
            const std::string actualId = toUtf8(resolved);
            if (actualId != zoneId && stripColons(actualId) != zoneId) {
                throw Iso8601Failure("Mismatching time zone indicator: " + zoneId +
                                     " given, resolves to " + actualId);
            }
        }
    }
    else {
        throw Iso8601Failure(std::string("Invalid time zone indicator '") + indicator + "'");
    }

    DateTime result = resolveFields(*zone, year, month, day, hour, minute, second, millis);
    position = offset;
    return result;
}

// ******************************************************************************** 公開関数

/// @brief ISO 8601形式の日時を解析する。
/// @param text 入力文字列。
/// @param position 開始位置。成功時は解析を終えた位置へ進む。
/// @param defaultZone 日付のみの場合に使うタイムゾーン。
/// @throws DateParseError 形式が不正な場合。位置は進めない。
export DateTime parseIso8601(std::string_view text, std::size_t& position, const icu::TimeZone& defaultZone) {
    try {
        return parseFields(text, position, defaultZone);
    }
    catch (const Iso8601Failure& e) {
        throw DateParseError("Failed to parse date [\"" + std::string(text) + "\"]: " + e.what(), position);
    }
}

/// @brief ISO 8601形式（yyyy-MM-ddTHH:mm:ss[.SSS](Z|±hh:mm)）で書き出す。
/// @param value 書き出す時刻。
/// @param withMillis ミリ秒を含めるか。
/// @param zone 表示に使うタイムゾーン。
export std::string formatIso8601(DateTime value, bool withMillis, const icu::TimeZone& zone) {
    int32_t rawOffset = 0;
    int32_t dstOffset = 0;
    UErrorCode status = U_ZERO_ERROR;
    zone.getOffset(toUDate(value), false, rawOffset, dstOffset, status);
    checkIcuStatus(status, "formatIso8601: getOffset");
    const int offsetMinutes = (rawOffset + dstOffset) / 60000;

    const auto local = value + std::chrono::minutes(offsetMinutes);
    const auto days = std::chrono::floor<std::chrono::days>(local);
    const std::chrono::year_month_day ymd(days);
    const std::chrono::hh_mm_ss<std::chrono::milliseconds> tod(local - days);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':'
        << std::setw(2) << tod.seconds().count();
    if (withMillis) {
        oss << '.' << std::setw(3) << tod.subseconds().count();
    }
    if (offsetMinutes == 0) {
        oss << 'Z';
    }
    else {
        const int absMinutes = offsetMinutes < 0 ? -offsetMinutes : offsetMinutes;
        oss << (offsetMinutes < 0 ? '-' : '+')
            << std::setw(2) << absMinutes / 60 << ':'
            << std::setw(2) << absMinutes % 60;
    }
    return oss.str();
}

}  // namespace datecodec::date
