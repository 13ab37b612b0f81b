// @file DateConverter.cppm
// @brief 日時を文字列トークンとして読み書きするコンバータ。
// @note 読み込みは書式集合を順に試し、最後にISO 8601で解析する。

module;
#include <chrono>
#include <concepts>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

export module datecodec.date.date_converter;

import datecodec.common.message_output;
import datecodec.date.date_time;
import datecodec.date.date_environment;
import datecodec.date.date_format_spec;
import datecodec.date.date_format_set_builder;
import datecodec.date.iso8601;
import datecodec.serialization.format_io;
import datecodec.serialization.json_syntax_error;

export namespace datecodec::date {

// ******************************************************************************** 日時型

/// @brief コンバータが扱う日時型の条件。DateTimeとの相互変換を持つこと。
template <typename T>
concept IsDateType = requires(const typename T::Value& value, DateTime instant) {
    { T::fromDateTime(instant) } -> std::same_as<typename T::Value>;
    { T::toDateTime(value) } -> std::same_as<DateTime>;
};

/// @brief DateTimeそのものを扱う。
struct InstantDateType {
    using Value = DateTime;
    static Value fromDateTime(DateTime instant) { return instant; }
    static DateTime toDateTime(const Value& value) { return value; }
};

/// @brief std::chrono::system_clock::time_point を扱う。書き出し時にミリ秒へ切り捨てる。
/// @note system_clock の刻みが細かい実装では表現できる範囲が狭い（ナノ秒なら1677年から2262年）。
struct SystemClockDateType {
    using Value = std::chrono::system_clock::time_point;

    /// @throws std::out_of_range instantがsystem_clockで表現できない場合。
    static Value fromDateTime(DateTime instant) {
        using namespace std::chrono;
        constexpr auto lowest = duration_cast<milliseconds>(system_clock::duration::min());
        constexpr auto highest = duration_cast<milliseconds>(system_clock::duration::max());
        const auto sinceEpoch = instant.time_since_epoch();
        if (sinceEpoch < lowest || sinceEpoch > highest) {
            throw std::out_of_range("SystemClockDateType: " + std::to_string(sinceEpoch.count()) +
                                    " ms is outside the range of system_clock");
        }
        return time_point_cast<system_clock::duration>(instant);
    }
    static DateTime toDateTime(const Value& value) {
        return std::chrono::floor<std::chrono::milliseconds>(value);
    }
};

// ******************************************************************************** DateConverter

/// @brief 日時のコンバータ。
/// @tparam DateType 日時型。
/// @note 書式集合はスレッドごとに1つ持つ。生成したスレッドの分は構築時に作り、
///       他のスレッドの分は初回使用時に同じ設定と環境から作る。
///       書式集合はコンバータと同じだけ生存し、スレッドが終了しても解放されない。
///       短命なスレッドを次々に作って使う場合は、スレッドプールなど寿命の長いスレッドから呼ぶこと。
template <IsDateType DateType>
class DateConverter {
public:
    using Value = typename DateType::Value;

    /// @param config 書式設定。
    /// @param environment 書式集合の構築に使う環境。
    /// @param warnOut 構築時の警告出力先（コンバータより長く生存すること）。
    DateConverter(DateFormatConfig config, DateEnvironment environment,
        common::MessageOutput& warnOut = common::getStdoutMessageOutput())
        : config_(std::move(config)), environment_(std::move(environment)), warnOut_(&warnOut) {
        formatSetForCurrentThread();
    }

    DateConverter(const DateConverter&) = delete;
    DateConverter& operator=(const DateConverter&) = delete;

    // ******************************************************************************** 書き出し

    /// @brief 0番目の書式で文字列化する。
    std::string format(const Value& value) const {
        const DateFormatSet& formats = formatSetForCurrentThread();
        return formats.front()->format(DateType::toDateTime(value));
    }

    void write(serialization::FormatWriter& writer, const Value& value) const {
        writer.writeObject(format(value));
    }

    // ******************************************************************************** 読み込み

    /// @brief トークンを解析する。
    /// @param token 文字列トークン。
    /// @param path エラーメッセージ用の文書内パス。
    /// @throws serialization::JsonSyntaxError どの書式でも解析できない場合（DateParseErrorが入れ子で付く）、
    ///         または解析した日時をDateTypeで表現できない場合（std::out_of_rangeが入れ子で付く）。
    Value parse(const std::string& token, const std::string& path) const {
        const DateFormatSet& formats = formatSetForCurrentThread();
        DateTime instant{};
        if (auto parsed = parseWithFormatSet(formats, token)) {
            instant = *parsed;
        }
        else {
            try {
                std::size_t position = 0;
                instant = parseIso8601(token, position, environment_.timeZone());
            }
            catch (const DateParseError&) {
                throwSyntaxError(token, path);
            }
        }
        try {
            return DateType::fromDateTime(instant);
        }
        catch (const std::out_of_range&) {
            throwSyntaxError(token, path);
        }
    }

    /// @note 数値トークンも文字列として受け付ける。
    Value read(serialization::FormatReader& parser) const {
        const serialization::FormatTokenType type = parser.nextTokenType();
        if (type != serialization::FormatTokenType::String && type != serialization::FormatTokenType::Number) {
            const std::string path = parser.path();
            throw serialization::JsonSyntaxError(std::string("Expected a date string but was ") +
                serialization::tokenTypeName(type) + "; at path " + path, "", path);
        }
        std::string token = parser.readText();
        return parse(token, parser.previousPath());
    }

    // ******************************************************************************** 診断

    /// @brief 診断用の表示名。0番目の書式がパターン形式ならそのパターン、そうでなければエンジン名を含む。
    std::string describe() const {
        const DateFormatSet& formats = formatSetForCurrentThread();
        if (auto pattern = formats.front()->pattern()) {
            return "DateConverter(" + *pattern + ")";
        }
        return "DateConverter(" + formats.front()->engineName() + ")";
    }

    const DateFormatConfig& config() const { return config_; }
    const DateEnvironment& environment() const { return environment_; }

    /// @brief 書式集合を構築済みのスレッド数。
    std::size_t contextCount() const {
        std::lock_guard<std::mutex> lock(registryMutex_);
        return formatSets_.size();
    }

    /// @brief 呼び出しスレッドの書式集合を返す。
    const DateFormatSet& formats() const { return formatSetForCurrentThread(); }

private:
    // 処理中の例外を原因として入れ子にする
    [[noreturn]] static void throwSyntaxError(const std::string& token, const std::string& path) {
        std::throw_with_nested(serialization::JsonSyntaxError(
            "Failed parsing '" + token + "' as Date; at path " + path, token, path));
    }

    DateFormatSet& formatSetForCurrentThread() const {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto& slot = formatSets_[std::this_thread::get_id()];
        if (!slot) {
            slot = std::make_unique<DateFormatSet>(buildDateFormatSet(config_, environment_, *warnOut_));
        }
        return *slot;
    }

    DateFormatConfig config_;
    DateEnvironment environment_;
    common::MessageOutput* warnOut_;

    mutable std::mutex registryMutex_;
    mutable std::unordered_map<std::thread::id, std::unique_ptr<DateFormatSet>> formatSets_;
};

// ******************************************************************************** 生成関数

/// @brief パターン指定のコンバータを作成する。
template <IsDateType DateType = InstantDateType>
DateConverter<DateType> getDateConverter(const std::string& pattern,
    const DateEnvironment& environment = DateEnvironment::current(),
    common::MessageOutput& warnOut = common::getStdoutMessageOutput()) {
    return DateConverter<DateType>(DatePattern{pattern}, environment, warnOut);
}

/// @brief スタイル指定のコンバータを作成する。
template <IsDateType DateType = InstantDateType>
DateConverter<DateType> getDateConverter(DateStyle dateStyle, DateStyle timeStyle,
    const DateEnvironment& environment = DateEnvironment::current(),
    common::MessageOutput& warnOut = common::getStdoutMessageOutput()) {
    return DateConverter<DateType>(DateStylePair{dateStyle, timeStyle}, environment, warnOut);
}

/// @brief 既定スタイル（日付・時刻ともDefault）のDateTime用コンバータ。
DateConverter<InstantDateType> getDefaultStyleDateConverter() {
    return getDateConverter<InstantDateType>(DateStyle::Default, DateStyle::Default);
}

}  // namespace datecodec::date
