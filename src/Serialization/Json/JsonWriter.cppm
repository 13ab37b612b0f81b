// @file JsonWriter.cppm
// @brief JSONライターの定義。値をJSON5形式で出力する。

module;
#include <charconv>
#include <cmath>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

export module datecodec.serialization.json_writer;

export namespace datecodec::serialization {

// @brief JSON5出力用のWriter。
// @note キーは識別子として書けるなら引用符なしで出力する。
class JsonWriter {
public:
    // @param os 出力先ストリーム
    explicit JsonWriter(std::ostream& os) : out_(os) {}

    void startObject() { open('{'); }
    void endObject() { close('}'); }
    void startArray() { open('['); }
    void endArray() { close(']'); }

    void key(std::string_view name) {
        separate();
        if (isBareKey(name)) {
            out_ << name;
        } else {
            writeQuoted(name);
        }
        out_ << ':';
        afterKey_ = true;
    }

    void null() {
        separate();
        out_ << "null";
    }

    void writeObject(bool value) {
        separate();
        out_ << (value ? "true" : "false");
    }

    // @brief 数値の書き込み。浮動小数点数は最短で元に戻る表記、有限値のみ。
    template <typename T>
        requires std::is_arithmetic_v<T> && (!std::is_same_v<T, bool>)
    void writeObject(T value) {
        if constexpr (std::is_floating_point_v<T>) {
            if (!std::isfinite(value)) {
                throw std::runtime_error("JsonWriter: non-finite number");
            }
        }
        char buffer[64];
        const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        if (ec != std::errc{}) {
            throw std::runtime_error("JsonWriter: number conversion failed");
        }
        separate();
        out_.write(buffer, end - buffer);
    }

    void writeObject(std::string_view value) {
        separate();
        writeQuoted(value);
    }

    void writeObject(const std::string& value) { writeObject(std::string_view(value)); }
    void writeObject(const char* value) { writeObject(std::string_view(value)); }

private:
    void open(char bracket) {
        separate();
        out_ << bracket;
        first_ = true;
    }

    void close(char bracket) {
        out_ << bracket;
        first_ = false;
    }

    // 要素の前に区切りのカンマを出す。キー直後の値には出さない。
    void separate() {
        if (afterKey_) {
            afterKey_ = false;
        } else if (!first_) {
            out_ << ',';
        }
        first_ = false;
    }

    void writeQuoted(std::string_view text) {
        static constexpr char hex[] = "0123456789abcdef";
        out_ << '"';
        for (const char c : text) {
            switch (c) {
            case '"':  out_ << "\\\""; break;
            case '\\': out_ << "\\\\"; break;
            case '\b': out_ << "\\b"; break;
            case '\f': out_ << "\\f"; break;
            case '\n': out_ << "\\n"; break;
            case '\r': out_ << "\\r"; break;
            case '\t': out_ << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out_ << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                } else {
                    out_ << c;
                }
                break;
            }
        }
        out_ << '"';
    }

    // 予約語を裸で出すと値として読まれてしまう
    static bool isBareKey(std::string_view name) {
        if (name.empty() || name == "null" || name == "true" || name == "false") {
            return false;
        }
        for (std::size_t i = 0; i < name.size(); ++i) {
            const char c = name[i];
            const bool letter = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
            if (!letter && !(i > 0 && c >= '0' && c <= '9')) {
                return false;
            }
        }
        return true;
    }

    std::ostream& out_;
    bool first_ = true;      ///< 文書またはコンテナの最初の要素か
    bool afterKey_ = false;  ///< 直前にキーを書いたか
};

}  // namespace datecodec::serialization
