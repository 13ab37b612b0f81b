// @file JsonTokenizer.cppm
// @brief JSON5トークナイザー。入力文字列からトークン列を生成する。
// @note 日付トークンを運ぶ文書に必要な範囲（ASCII識別子キー、10進数、文字列、コメント）に限定している。

module;
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

export module datecodec.serialization.json_tokenizer;

import datecodec.serialization.json_token;
import datecodec.common.message_output;

export namespace datecodec::serialization {

// 入力文字列取得元のconcept
template <typename T>
concept InputSource = requires(T& t, const T& ct, std::size_t offset, std::size_t count) {
    { ct.peekAhead(offset) } -> std::same_as<char>;
    { t.consume(count) } -> std::same_as<void>;
    { ct.position() } -> std::same_as<std::size_t>;
};

// ******************************************************************************** JsonTokenizer
// @brief JSON5トークナイザー
// @note 入力末尾は'\0'として見える。
template <InputSource Input>
class JsonTokenizer {
public:
    // @param inputSource 入力文字列取得元
    // @param tokens トークンの格納先
    // @param warnOut 警告メッセージの出力先
    JsonTokenizer(Input& inputSource, JsonTokenStream& tokens, common::MessageOutput& warnOut)
        : input_(inputSource), tokens_(tokens), warnOut_(warnOut) {}

    // @brief 入力全体をトークン列に変換する。末尾にEndOfStreamを置く。
    // @throws std::runtime_error 字句エラー。メッセージに位置を含む。
    void tokenize() {
        try {
            while (readToken()) {
            }
            tokens_.push(JsonTokenType::EndOfStream, input_.position());
        } catch (const std::exception& e) {
            throw std::runtime_error("JSON5 parse error at position " +
                                     std::to_string(input_.position()) + ": " + e.what());
        }
    }

private:
    char peek(std::size_t offset = 0) const { return input_.peekAhead(offset); }
    void consume(std::size_t count = 1) { input_.consume(count); }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }
    static bool isIdentifierStart(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
    }
    static bool isIdentifierPart(char c) { return isIdentifierStart(c) || isDigit(c); }

    // ******************************************************************************** 1トークン
    // @return 入力が残っていればtrue
    bool readToken() {
        skipBlank();
        const std::size_t start = input_.position();
        const char c = peek();
        switch (c) {
        case '\0':
            return false;
        case '{': consume(); tokens_.push(JsonTokenType::StartObject, start); return true;
        case '}': consume(); tokens_.push(JsonTokenType::EndObject, start); return true;
        case '[': consume(); tokens_.push(JsonTokenType::StartArray, start); return true;
        case ']': consume(); tokens_.push(JsonTokenType::EndArray, start); return true;
        case ',':
        case ':':
            consume();
            return true;
        case '"':
        case '\'':
            pushKeyOrValue(JsonTokenType::String, readQuoted(c), start);
            return true;
        default:
            break;
        }
        if (isDigit(c) || c == '+' || c == '-' || c == '.') {
            pushValue(JsonTokenType::Number, readNumber(), start);
            return true;
        }
        if (!isIdentifierStart(c)) {
            throw std::runtime_error(std::string("JSON5: unexpected character '") + c + "'");
        }
        std::string word = readIdentifier();
        if (followedByColon()) {
            tokens_.push(JsonTokenType::Key, start, std::move(word));
        } else if (word == "null") {
            pushValue(JsonTokenType::Null, std::move(word), start);
        } else if (word == "true" || word == "false") {
            pushValue(JsonTokenType::Bool, std::move(word), start);
        } else {
            throw std::runtime_error("JSON5: unexpected identifier '" + word + "' in value position");
        }
        return true;
    }

    // 文字列はコロンが続けばキー
    void pushKeyOrValue(JsonTokenType valueType, std::string text, std::size_t start) {
        if (followedByColon()) {
            tokens_.push(JsonTokenType::Key, start, std::move(text));
        } else {
            pushValue(valueType, std::move(text), start);
        }
    }

    // 値の後は , } ] または末尾のみ
    void pushValue(JsonTokenType type, std::string text, std::size_t start) {
        tokens_.push(type, start, std::move(text));
        skipBlank();
        const char c = peek();
        if (c != '\0' && c != ',' && c != '}' && c != ']') {
            throw std::runtime_error(std::string("JSON5: unexpected character '") + c + "' after value");
        }
    }

    bool followedByColon() {
        skipBlank();
        return peek() == ':';
    }

    // ******************************************************************************** 空白とコメント
    void skipBlank() {
        for (;;) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
                consume();
            } else if (c == '/' && peek(1) == '/') {
                while (peek() != '\0' && peek() != '\n' && peek() != '\r') {
                    consume();
                }
            } else if (c == '/' && peek(1) == '*') {
                consume(2);
                while (!(peek() == '*' && peek(1) == '/')) {
                    if (peek() == '\0') {
                        throw std::runtime_error("JSON5: unterminated comment");
                    }
                    consume();
                }
                consume(2);
            } else {
                return;
            }
        }
    }

    // ******************************************************************************** 文字列
    // @param quote 開始引用符（'または"）
    std::string readQuoted(char quote) {
        consume();
        std::string text;
        for (;;) {
            const char c = peek();
            if (c == '\0') {
                throw std::runtime_error("JSON5: unterminated string");
            }
            if (c == quote) {
                consume();
                return text;
            }
            if (c == '\\') {
                consume();
                readEscape(text);
                continue;
            }
            if (isUnescapedSeparator()) {
                warnOut_.warning(std::string("Unescaped ") + (peek(2) == '\xA8' ? "U+2028" : "U+2029") +
                                 " in string at position " + std::to_string(input_.position()));
            }
            text += c;
            consume();
        }
    }

    // U+2028 / U+2029 のUTF-8表現 E2 80 A8 / E2 80 A9
    bool isUnescapedSeparator() const {
        return peek() == '\xE2' && peek(1) == '\x80' && (peek(2) == '\xA8' || peek(2) == '\xA9');
    }

    // '\' の直後から1つ解釈する
    void readEscape(std::string& text) {
        const char c = peek();
        switch (c) {
        case '\0':
            throw std::runtime_error("JSON5: unterminated string");
        case 'b': text += '\b'; break;
        case 'f': text += '\f'; break;
        case 'n': text += '\n'; break;
        case 'r': text += '\r'; break;
        case 't': text += '\t'; break;
        case 'v': text += '\v'; break;
        case '0': text += '\0'; break;
        case '\r':
            // 行継続（CRLFはまとめて読み飛ばす）
            if (peek(1) == '\n') {
                consume();
            }
            break;
        case '\n':
            break;
        case 'u':
            consume();
            appendCodePoint(text, readUtf16Escape());
            return;
        default:
            text += c;
            break;
        }
        consume();
    }

    // \uXXXX（サロゲートペアなら\uXXXX\uXXXXの2つ組）を1文字として読む
    UChar32 readUtf16Escape() {
        const UChar lead = readHex4();
        if (!U16_IS_SURROGATE(lead)) {
            return lead;
        }
        if (!U16_IS_SURROGATE_LEAD(lead) || peek() != '\\' || peek(1) != 'u') {
            throw std::runtime_error("JSON5: unpaired surrogate in \\u escape");
        }
        consume(2);
        const UChar trail = readHex4();
        if (!U16_IS_TRAIL(trail)) {
            throw std::runtime_error("JSON5: invalid surrogate pair");
        }
        return U16_GET_SUPPLEMENTARY(lead, trail);
    }

    UChar readHex4() {
        UChar value = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = peek();
            int digit = -1;
            if (isDigit(h)) {
                digit = h - '0';
            } else if (h >= 'a' && h <= 'f') {
                digit = h - 'a' + 10;
            } else if (h >= 'A' && h <= 'F') {
                digit = h - 'A' + 10;
            } else {
                throw std::runtime_error(std::string("JSON5: expected hex digit in \\u escape but got '") + h + "'");
            }
            value = static_cast<UChar>((value << 4) | digit);
            consume();
        }
        return value;
    }

    static void appendCodePoint(std::string& text, UChar32 codePoint) {
        std::uint8_t bytes[U8_MAX_LENGTH];
        std::int32_t length = 0;
        U8_APPEND_UNSAFE(bytes, length, codePoint);
        text.append(reinterpret_cast<const char*>(bytes), static_cast<std::size_t>(length));
    }

    // ******************************************************************************** 識別子と数値
    std::string readIdentifier() {
        std::string word;
        while (isIdentifierPart(peek())) {
            word += peek();
            consume();
        }
        return word;
    }

    // @return 数字の個数
    std::size_t readDigits(std::string& text) {
        std::size_t count = 0;
        while (isDigit(peek())) {
            text += peek();
            consume();
            ++count;
        }
        return count;
    }

    // 符号・整数部・小数部・指数部の字句をそのまま返す。値への変換はパーサーで行う。
    std::string readNumber() {
        std::string text;
        if (peek() == '+' || peek() == '-') {
            text += peek();
            consume();
        }
        std::size_t digits = readDigits(text);
        if (peek() == '.') {
            text += '.';
            consume();
            digits += readDigits(text);
        }
        if (digits == 0) {
            throw std::runtime_error("JSON5: invalid number format");
        }
        if (peek() == 'e' || peek() == 'E') {
            text += peek();
            consume();
            if (peek() == '+' || peek() == '-') {
                text += peek();
                consume();
            }
            if (readDigits(text) == 0) {
                throw std::runtime_error("JSON5: invalid exponent");
            }
        }
        return text;
    }

    Input& input_;                     ///< 入力文字列取得元
    JsonTokenStream& tokens_;          ///< トークン格納先
    common::MessageOutput& warnOut_;   ///< 警告メッセージ出力先
};

}  // namespace datecodec::serialization
