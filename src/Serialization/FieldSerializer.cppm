/// @file FieldSerializer.cppm
/// @brief メンバー変数1つ分の読み書きを定義する。

module;
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>

export module datecodec.serialization.field_serializer;

import datecodec.serialization.format_io;
import datecodec.serialization.object_converter;

namespace datecodec::serialization {

/// @brief メンバーポインタの特性を抽出するメタ関数。
template <typename T>
struct MemberPointerTraits;

template <typename Owner, typename Value>
struct MemberPointerTraits<Value Owner::*> {
    using OwnerType = Owner;
    using ValueType = Value;
};

/// @brief メンバー変数とキー、コンバータを結び付けたフィールド定義。
/// @tparam MemberPtrType メンバー変数へのポインタ型。
/// @tparam Converter 値の変換方法。
export template <typename MemberPtrType, typename Converter>
struct FieldSerializer {
    static_assert(std::is_member_object_pointer_v<MemberPtrType>,
        "FieldSerializer requires a data member pointer");
    using Owner = typename MemberPointerTraits<MemberPtrType>::OwnerType;
    using ValueType = typename MemberPointerTraits<MemberPtrType>::ValueType;
    using ConverterT = std::remove_cvref_t<Converter>;
    static_assert(IsJsonConverter<ConverterT, ValueType>,
        "FieldSerializer requires Converter to be a JsonConverter for the member type");

    constexpr FieldSerializer(MemberPtrType memberPtr, const char* keyName,
        const ConverterT& conv, bool req)
        : member(memberPtr), key(keyName), required(req), converter(std::cref(conv)) {}

    /// @brief フィールドをキー付きで書き出す。
    void write(FormatWriter& writer, const Owner& owner) const {
        writer.key(key);
        converter.get().write(writer, owner.*member);
    }

    /// @brief キーを読んだ直後の値を読み込み、メンバーへ格納する。
    void read(FormatReader& parser, Owner& owner) const {
        owner.*member = converter.get().read(parser);
    }

    /// @brief 入力にキーがなかった場合の処理。必須なら例外、任意なら既定値のまま。
    void applyMissing(Owner&) const {
        if (required) {
            throw std::runtime_error(std::string("Missing required field '") + key + "'");
        }
    }

    MemberPtrType member{};  ///< 対象メンバー
    const char* key{};       ///< キー名
    bool required{false};    ///< 必須かどうか
    std::reference_wrapper<const ConverterT> converter; ///< 値の変換方法
};

/// @brief 必須フィールドを作成する。
/// @param memberPtr 対象メンバー
/// @param keyName キー名
/// @param conv 値の変換方法（フィールドより長く生存すること）
export template <typename MemberPtrType, typename Converter>
constexpr auto getRequiredField(MemberPtrType memberPtr, const char* keyName, const Converter& conv) {
    return FieldSerializer<MemberPtrType, Converter>(memberPtr, keyName, conv, true);
}

/// @brief 任意フィールドを作成する。
export template <typename MemberPtrType, typename Converter>
constexpr auto getOptionalField(MemberPtrType memberPtr, const char* keyName, const Converter& conv) {
    return FieldSerializer<MemberPtrType, Converter>(memberPtr, keyName, conv, false);
}

/// @brief 既定コンバータを使う必須フィールドを作成する。
export template <typename MemberPtrType>
constexpr auto getRequiredField(MemberPtrType memberPtr, const char* keyName) {
    using Value = typename MemberPointerTraits<MemberPtrType>::ValueType;
    return getRequiredField(memberPtr, keyName, getConverter<Value>());
}

}  // namespace datecodec::serialization
