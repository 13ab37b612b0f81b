/// @file FormatIO.cppm
/// @brief 既定フォーマットのReader/Writer型を束ねる。

module;

export module datecodec.serialization.format_io;

export import datecodec.serialization.json_writer;
export import datecodec.serialization.json_parser;
export import datecodec.serialization.json_token;

export namespace datecodec::serialization {

/// @brief 既定フォーマットの書き込み型。
using FormatWriter = JsonWriter;

/// @brief 既定フォーマットの読み込み型。
using FormatReader = JsonParser;

/// @brief 既定フォーマットのトークン種別。
using FormatTokenType = JsonTokenType;

}  // namespace datecodec::serialization
