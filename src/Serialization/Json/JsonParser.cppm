// @file JsonParser.cppm
// @brief JSON5パーサーの定義。トークン列から値を読み取り、文書内の位置（パス）を追跡する。

module;
#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

export module datecodec.serialization.json_parser;

import datecodec.serialization.json_token;

export namespace datecodec::serialization {

// ******************************************************************************** JsonParser
// @brief JSON5パーサー（トークン列から値を読み取る）
class JsonParser {
public:
    // @param tokens トークン列
    explicit JsonParser(JsonTokenStream& tokens) : tokens_(tokens) {}

    // ******************************************************************************** 位置情報

    // @brief 次のトークンの開始位置を返す。
    std::size_t nextPosition() const { return tokens_.peek().position; }

    // @brief 次のトークンの種類を返す。
    JsonTokenType nextTokenType() const { return tokens_.peek().type; }

    // @brief 次に読む値の文書内パスを返す（例: "$.items[2]"）。
    std::string path() const { return renderPath(false); }

    // @brief 直前に読んだ値の文書内パスを返す。
    // @note エラーメッセージで「どの値が不正だったか」を示すために使う。
    std::string previousPath() const { return renderPath(true); }

    // ******************************************************************************** 構造

    void startObject() {
        takeValue(JsonTokenType::StartObject);
        scopes_.push_back(PathScope{});
    }

    void endObject() {
        take(JsonTokenType::EndObject);
        scopes_.pop_back();
    }

    void startArray() {
        takeValue(JsonTokenType::StartArray);
        scopes_.push_back(PathScope{true});
    }

    void endArray() {
        take(JsonTokenType::EndArray);
        scopes_.pop_back();
    }

    bool nextIsEndObject() const { return nextTokenType() == JsonTokenType::EndObject; }
    bool nextIsEndArray() const { return nextTokenType() == JsonTokenType::EndArray; }
    bool nextIsNull() const { return nextTokenType() == JsonTokenType::Null; }

    std::string nextKey() {
        std::string key = std::move(take(JsonTokenType::Key).text);
        if (!scopes_.empty()) {
            scopes_.back().hasName = true;
            scopes_.back().name = key;
        }
        return key;
    }

    // ******************************************************************************** 値

    void readNull() { takeValue(JsonTokenType::Null); }

    void readTo(bool& out) { out = takeValue(JsonTokenType::Bool).text == "true"; }

    void readTo(std::string& out) { out = std::move(takeValue(JsonTokenType::String).text); }

    // @throws std::runtime_error 整数でない、またはTの範囲を超える場合。
    template <typename T>
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
    void readTo(T& out) {
        const JsonToken& token = takeValue(JsonTokenType::Number);
        convertNumber(token, out, "integer");
    }

    template <typename T>
        requires std::is_floating_point_v<T>
    void readTo(T& out) {
        const JsonToken& token = takeValue(JsonTokenType::Number);
        convertNumber(token, out, "number");
    }

    // @brief 文字列か数値のトークンを字句のまま読む。
    std::string readText() {
        if (nextTokenType() == JsonTokenType::Number) {
            return std::move(takeValue(JsonTokenType::Number).text);
        }
        return std::move(takeValue(JsonTokenType::String).text);
    }

    // @brief 値1つを丸ごと読み飛ばす（未知キーなどで使用）。
    void skipValue() {
        switch (nextTokenType()) {
        case JsonTokenType::StartObject:
            startObject();
            while (!nextIsEndObject()) {
                (void)nextKey();
                skipValue();
            }
            endObject();
            return;
        case JsonTokenType::StartArray:
            startArray();
            while (!nextIsEndArray()) {
                skipValue();
            }
            endArray();
            return;
        case JsonTokenType::Null:
        case JsonTokenType::Bool:
        case JsonTokenType::Number:
        case JsonTokenType::String:
            takeValue(nextTokenType());
            return;
        default:
            throw unexpected("value");
        }
    }

    // ******************************************************************************** 未知キー

    // @brief 未知キーを記録する（後で診断に利用）
    void noteUnknownKey(std::string key) { unknownKeys_.push_back(std::move(key)); }

    const std::vector<std::string>& unknownKeys() const { return unknownKeys_; }

    // @brief 未知キーの一覧を取得して所有権を移動
    std::vector<std::string> takeUnknownKeys() { return std::move(unknownKeys_); }

private:
    // @brief 現在開いているオブジェクト/配列1段分
    struct PathScope {
        bool isArray = false;
        std::size_t count = 0;  ///< 配列: 読み始めた要素数
        bool hasName = false;   ///< オブジェクト: キーを読んだか
        std::string name;       ///< オブジェクト: 直近のキー
    };

    std::string renderPath(bool previous) const {
        std::string out = "$";
        for (std::size_t i = 0; i < scopes_.size(); ++i) {
            const PathScope& scope = scopes_[i];
            if (scope.isArray) {
                std::size_t index = scope.count;
                if ((i + 1 < scopes_.size() || previous) && index > 0) {
                    --index;
                }
                out += '[' + std::to_string(index) + ']';
            } else if (scope.hasName) {
                out += '.' + scope.name;
            }
        }
        return out;
    }

    JsonToken& take(JsonTokenType expected) {
        if (nextTokenType() != expected) {
            throw unexpected(tokenTypeName(expected));
        }
        return tokens_.next();
    }

    // 値を1つ読む。配列内なら要素数を進める。
    JsonToken& takeValue(JsonTokenType expected) {
        JsonToken& token = take(expected);
        if (!scopes_.empty() && scopes_.back().isArray) {
            ++scopes_.back().count;
        }
        return token;
    }

    std::runtime_error unexpected(const std::string& expected) const {
        return std::runtime_error("JsonParser: expected " + expected + " but was " +
                                  tokenTypeName(nextTokenType()) + " at position " +
                                  std::to_string(nextPosition()));
    }

    template <typename T>
    static void convertNumber(const JsonToken& token, T& out, const char* expected) {
        std::string_view digits = token.text;
        // from_charsは先頭の'+'を受け付けない
        if (!digits.empty() && digits.front() == '+') {
            digits.remove_prefix(1);
        }
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
        if (ec == std::errc::result_out_of_range) {
            throw std::runtime_error("JSON5: number out of range '" + token.text + "' at position " +
                                     std::to_string(token.position));
        }
        if (ec != std::errc{} || end != digits.data() + digits.size()) {
            throw std::runtime_error(std::string("JsonParser: expected ") + expected + " but was '" +
                                     token.text + "' at position " + std::to_string(token.position));
        }
    }

    JsonTokenStream& tokens_;                 ///< トークン列
    std::vector<PathScope> scopes_;           ///< 開いているオブジェクト/配列のスタック
    std::vector<std::string> unknownKeys_;    ///< 未知キー記録（診断用）
};

}  // namespace datecodec::serialization
