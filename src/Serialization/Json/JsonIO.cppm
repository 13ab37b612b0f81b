// @file JsonIO.cppm
// @brief JSON文字列と値の相互変換。オブジェクトはObjectSerializer、単一の値はコンバータで読み書きする。

module;
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

export module datecodec.serialization.json_io;

import datecodec.common.message_output;
import datecodec.serialization.object_converter;
import datecodec.serialization.object_serializer;
import datecodec.serialization.json_writer;
import datecodec.serialization.json_parser;
import datecodec.serialization.json_tokenizer;
import datecodec.serialization.json_token;
import datecodec.serialization.reading_ahead_buffer;

namespace datecodec::serialization {

constexpr std::size_t aheadSize = 8;  ///< トークナイザーが先読みする最大byte数

/// @brief 文書全体をトークン化し、readで値を1つ読み、残りがないことを確かめる。
/// @return readの戻り値。
template <typename Read>
auto readDocument(const std::string& jsonText, common::MessageOutput& warnOut, Read&& read) {
    JsonTokenStream tokens;
    ReadingAheadBuffer input(std::string(jsonText), aheadSize);
    JsonTokenizer<ReadingAheadBuffer>(input, tokens, warnOut).tokenize();

    JsonParser parser(tokens);
    auto result = read(parser);
    if (parser.nextTokenType() != JsonTokenType::EndOfStream) {
        throw std::runtime_error("JsonParser: unexpected trailing content at position " +
                                 std::to_string(parser.nextPosition()));
    }
    return result;
}

/// @brief writeで書き出した内容を文字列として返す。
template <typename Write>
std::string writeDocument(Write&& write) {
    std::ostringstream out;
    JsonWriter writer(out);
    write(writer);
    return out.str();
}

// ******************************************************************************** オブジェクト

/// @brief オブジェクトをJSON5文字列にする。
export template <HasSerializer T>
std::string getJsonContent(const T& obj) {
    return writeDocument([&obj](JsonWriter& writer) {
        writer.startObject();
        obj.serializer().writeFields(writer, &obj);
        writer.endObject();
    });
}

/// @brief JSON文字列からオブジェクトを読み込む。
/// @param unknownKeysOut 読み飛ばした未知キーの格納先。
/// @param warnOut トークナイザーの警告出力先。
/// @throws std::runtime_error 構文エラー、型の不一致、必須キーの欠落、重複キー。
export template <HasSerializer T>
void readJsonString(const std::string& jsonText, T& out, std::vector<std::string>& unknownKeysOut,
    common::MessageOutput& warnOut = common::getStdoutMessageOutput()) {
    unknownKeysOut = readDocument(jsonText, warnOut, [&out](JsonParser& parser) {
        parser.startObject();
        out.serializer().readFields(parser, &out);
        parser.endObject();
        return parser.takeUnknownKeys();
    });
}

/// @brief 未知キーを捨てる版。
export template <HasSerializer T>
void readJsonString(const std::string& jsonText, T& out) {
    std::vector<std::string> ignored;
    readJsonString(jsonText, out, ignored);
}

// ******************************************************************************** 単一の値

/// @brief 値1つをコンバータで書き出す（例: "\"2023-07-04\""）。
export template <typename Converter>
std::string getJsonValueContent(const typename Converter::Value& value, const Converter& converter) {
    return writeDocument([&](JsonWriter& writer) { converter.write(writer, value); });
}

/// @brief 値1つだけからなるJSON文字列をコンバータで読み込む。
export template <typename Converter>
    requires IsJsonConverter<Converter, typename Converter::Value>
typename Converter::Value readJsonValueString(const std::string& jsonText, const Converter& converter,
    common::MessageOutput& warnOut = common::getStdoutMessageOutput()) {
    return readDocument(jsonText, warnOut, [&converter](JsonParser& parser) { return converter.read(parser); });
}

}  // namespace datecodec::serialization
