// @file DateTime.cppm
// @brief 日時の値型と、ICUとの相互変換ユーティリティ。

module;
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unicode/datefmt.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

export module datecodec.date.date_time;

export namespace datecodec::date {

/// @brief ミリ秒精度のUTC時刻。
using DateTime = std::chrono::sys_time<std::chrono::milliseconds>;

/// @brief ロケール依存の書式スタイル。値はICUのEStyleと同じ並び。
enum class DateStyle {
    Full = 0,
    Long = 1,
    Medium = 2,
    Short = 3,
    Default = Medium,
};

// ******************************************************************************** ICU変換

/// @brief DateTimeをICUのUDate（エポックからのミリ秒）へ変換する。
UDate toUDate(DateTime value) {
    return static_cast<UDate>(value.time_since_epoch().count());
}

/// @brief UDateをDateTimeへ変換する。端数は負の無限大方向へ切り捨てる。
DateTime fromUDate(UDate value) {
    return DateTime(std::chrono::milliseconds(static_cast<std::int64_t>(std::floor(value))));
}

icu::DateFormat::EStyle toIcuStyle(DateStyle style) {
    return static_cast<icu::DateFormat::EStyle>(static_cast<int>(style));
}

/// @brief UTF-8文字列をUnicodeStringへ変換する。
icu::UnicodeString toUnicode(std::string_view text) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

/// @brief UnicodeStringをUTF-8文字列へ変換する。
std::string toUtf8(const icu::UnicodeString& text) {
    std::string out;
    text.toUTF8String(out);
    return out;
}

/// @brief ICUの呼び出し結果を確認し、失敗なら例外を送出する。
/// @param status ICUの状態コード。
/// @param what 失敗した操作の説明。
/// @throws std::runtime_error statusが失敗を示す場合。
void checkIcuStatus(UErrorCode status, const std::string& what) {
    if (U_FAILURE(status)) {
        throw std::runtime_error(what + ": " + u_errorName(status));
    }
}

}  // namespace datecodec::date
