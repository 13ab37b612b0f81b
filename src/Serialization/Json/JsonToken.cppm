// @file JsonToken.cppm
// @brief JSONトークンと、トークナイザーからパーサーへ渡すトークン列。

module;
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

export module datecodec.serialization.json_token;

export namespace datecodec::serialization {

// @brief JSONトークンの種類
enum class JsonTokenType {
    EndOfStream,
    Null,
    Bool,
    Number,
    String,
    Key,
    StartObject,
    EndObject,
    StartArray,
    EndArray
};

// @brief エラーメッセージ用のトークン種別名
const char* tokenTypeName(JsonTokenType type) {
    switch (type) {
    case JsonTokenType::EndOfStream: return "end of stream";
    case JsonTokenType::Null:        return "null";
    case JsonTokenType::Bool:        return "boolean";
    case JsonTokenType::Number:      return "number";
    case JsonTokenType::String:      return "string";
    case JsonTokenType::Key:         return "key";
    case JsonTokenType::StartObject: return "object";
    case JsonTokenType::EndObject:   return "end of object";
    case JsonTokenType::StartArray:  return "array";
    case JsonTokenType::EndArray:    return "end of array";
    }
    return "unknown token";
}

// @brief JSONトークン
// @note 数値は字句のまま保持し、読み取る型が決まった時点で変換する。
struct JsonToken {
    JsonTokenType type = JsonTokenType::EndOfStream;
    std::string text;        ///< String/Key: 復号済みの内容、Number: 字句、Bool: "true"か"false"
    std::size_t position{};  ///< 入力内での開始位置
};

// @brief トークナイザーが生成したトークン列。パーサーは先頭から順に取り出す。
// @note トークン化は読み込み前に完了しているため同期は行わない。
class JsonTokenStream {
public:
    void push(JsonTokenType type, std::size_t position, std::string text = {}) {
        tokens_.push_back(JsonToken{type, std::move(text), position});
    }

    // @brief 次のトークンを参照する（消費しない）
    const JsonToken& peek() const {
        if (cursor_ >= tokens_.size()) {
            throw std::runtime_error("JsonTokenStream: no more tokens");
        }
        return tokens_[cursor_];
    }

    // @brief 次のトークンを消費して返す
    // @note 末尾のEndOfStreamは消費しない
    JsonToken& next() {
        peek();
        JsonToken& token = tokens_[cursor_];
        if (token.type != JsonTokenType::EndOfStream) {
            ++cursor_;
        }
        return token;
    }

private:
    std::vector<JsonToken> tokens_;
    std::size_t cursor_ = 0;  ///< 次に取り出す位置
};

}  // namespace datecodec::serialization
