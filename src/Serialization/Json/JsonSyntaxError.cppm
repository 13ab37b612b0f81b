// @file JsonSyntaxError.cppm
// @brief 文書中の値が期待する構文に合わないことを表す例外。

module;
#include <stdexcept>
#include <string>
#include <utility>

export module datecodec.serialization.json_syntax_error;

export namespace datecodec::serialization {

/// @brief 値の構文エラー。元のトークンと文書内パスを保持する。
/// @note 原因となった例外は std::throw_with_nested で入れ子にして送出され、
///       std::rethrow_if_nested で取り出せる。
class JsonSyntaxError : public std::runtime_error {
public:
    /// @param message 表示用メッセージ。
    /// @param token 解釈できなかったトークン（未加工）。
    /// @param path トークンが現れた文書内パス。
    JsonSyntaxError(const std::string& message, std::string token, std::string path)
        : std::runtime_error(message), token_(std::move(token)), path_(std::move(path)) {}

    const std::string& token() const noexcept { return token_; }
    const std::string& path() const noexcept { return path_; }

private:
    std::string token_;
    std::string path_;
};

}  // namespace datecodec::serialization
