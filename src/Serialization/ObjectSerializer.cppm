// @file ObjectSerializer.cppm
// @brief フィールド集合の定義。構造体と文書の相互変換を提供する。

module;
#include <array>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

export module datecodec.serialization.object_serializer;

import datecodec.serialization.format_io;

namespace datecodec::serialization {

/// @brief オブジェクトを永続化するクラス。
/// @note 仮想関数の戻り値型として使用可能にするための基底クラス。
export class ObjectSerializer {
public:
    virtual ~ObjectSerializer() = default;

    /// @brief オブジェクトのフィールドのみを書き出す（startObject/endObjectなし）。
    virtual void writeFields(FormatWriter& writer, const void* obj) const = 0;

    /// @brief オブジェクトのフィールドを読み込む（startObject/endObjectは呼び出し側）。
    virtual void readFields(FormatReader& parser, void* obj) const = 0;
};

/// @brief serializer() メンバー関数を持つ型を表す concept。
export template <typename T>
concept HasSerializer = requires(const T& t) {
    { t.serializer() } -> std::convertible_to<const ObjectSerializer&>;
};

/// @brief フィールド集合の要素に要求される条件。
export template <typename Field>
concept IsObjectField = requires(const Field& field, FormatReader& parser, FormatWriter& writer,
    typename Field::Owner& owner) {
    { field.key } -> std::convertible_to<const char*>;
    field.read(parser, owner);
    field.write(writer, std::as_const(owner));
    field.applyMissing(owner);
};

/// @brief フィールド集合による永続化クラス。
/// @tparam Owner 所有者型。全フィールドで共通。
/// @note 未知キーは記録して読み飛ばし、重複キーは例外とする。
export template <typename Owner, IsObjectField... Fields>
class FieldsObjectSerializer : public ObjectSerializer {
    static_assert((std::is_same_v<typename Fields::Owner, Owner> && ...),
        "FieldsObjectSerializer fields must share one owner type");

public:
    explicit FieldsObjectSerializer(Fields... fields) : fields_(std::move(fields)...) {}

    void writeFields(FormatWriter& writer, const void* obj) const override {
        const Owner& owner = *static_cast<const Owner*>(obj);
        std::apply([&](const auto&... field) { (field.write(writer, owner), ...); }, fields_);
    }

    void readFields(FormatReader& parser, void* obj) const override {
        Owner& owner = *static_cast<Owner*>(obj);
        std::array<bool, sizeof...(Fields)> seen{};
        while (!parser.nextIsEndObject()) {
            std::string key = parser.nextKey();
            if (!readField(parser, owner, key, seen)) {
                parser.noteUnknownKey(std::move(key));
                parser.skipValue();
            }
        }
        applyMissing(owner, seen, std::index_sequence_for<Fields...>{});
    }

private:
    // keyに一致するフィールドを探して読む。見つからなければfalse。
    template <std::size_t I = 0>
    bool readField(FormatReader& parser, Owner& owner, const std::string& key,
        std::array<bool, sizeof...(Fields)>& seen) const {
        if constexpr (I == sizeof...(Fields)) {
            return false;
        } else {
            const auto& field = std::get<I>(fields_);
            if (key != field.key) {
                return readField<I + 1>(parser, owner, key, seen);
            }
            if (seen[I]) {
                throw std::runtime_error("ObjectSerializer: duplicate key '" + key + "' at path " + parser.path());
            }
            seen[I] = true;
            field.read(parser, owner);
            return true;
        }
    }

    template <std::size_t... I>
    void applyMissing(Owner& owner, const std::array<bool, sizeof...(Fields)>& seen,
        std::index_sequence<I...>) const {
        ((seen[I] ? void() : std::get<I>(fields_).applyMissing(owner)), ...);
    }

    std::tuple<Fields...> fields_;  ///< フィールド定義群（書き出し順）
};

/// @brief FieldsObjectSerializerを生成する。所有者型は先頭フィールドのもの。
export template <typename First, typename... Rest>
auto getFieldSet(First first, Rest... rest) {
    return FieldsObjectSerializer<typename First::Owner, First, Rest...>(std::move(first), std::move(rest)...);
}

}  // namespace datecodec::serialization
