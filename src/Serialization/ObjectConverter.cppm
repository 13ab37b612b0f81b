/// @file ObjectConverter.cppm
/// @brief 値とトークンの変換を行うコンバータ群を提供する。
/// @note コンバータは値1つを読み書きする。nullの扱いはOptionalConverterだけが持つ。

module;
#include <concepts>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>

export module datecodec.serialization.object_converter;

import datecodec.serialization.format_io;

export namespace datecodec::serialization {

/// @brief Converterが値型Valueを読み書きできること。
template <typename Converter, typename Value>
concept IsJsonConverter = std::is_class_v<Converter>
    && std::same_as<typename Converter::Value, Value>
    && requires(const Converter& converter, FormatWriter& writer, FormatReader& parser, const Value& value) {
        converter.write(writer, value);
        { converter.read(parser) } -> std::same_as<Value>;
    };

// ******************************************************************************** 基本型

/// @brief 真偽値・数値・文字列。FormatWriter/FormatReaderがそのまま扱える型。
template <typename T>
concept IsScalarValue = std::is_arithmetic_v<T> || std::same_as<T, std::string>;

/// @brief 基本型のコンバータ。
template <IsScalarValue T>
struct FundamentalConverter {
    using Value = T;

    void write(FormatWriter& writer, const T& value) const { writer.writeObject(value); }

    T read(FormatReader& parser) const {
        T value{};
        parser.readTo(value);
        return value;
    }
};

/// @brief 基本型Tの既定コンバータを返す。
template <IsScalarValue T>
const FundamentalConverter<T>& getConverter() {
    static const FundamentalConverter<T> converter;
    return converter;
}

// ******************************************************************************** optional

/// @brief std::optional<E> のコンバータ。空ならnullを書き、nullを読めば空を返す。
/// @tparam ElementConverter 要素のコンバータ（このコンバータより長く生存すること）。
template <typename T, typename ElementConverter>
    requires std::same_as<T, std::optional<typename T::value_type>>
          && IsJsonConverter<ElementConverter, typename T::value_type>
class OptionalConverter {
public:
    using Value = T;

    explicit OptionalConverter(const ElementConverter& element) : element_(&element) {}

    void write(FormatWriter& writer, const T& value) const {
        if (value) {
            element_->write(writer, *value);
        } else {
            writer.null();
        }
    }

    T read(FormatReader& parser) const {
        if (!parser.nextIsNull()) {
            return element_->read(parser);
        }
        parser.readNull();
        return std::nullopt;
    }

private:
    const ElementConverter* element_;
};

/// @brief 要素コンバータからstd::optional用のコンバータを作る。
/// @tparam T std::optional型
template <typename T, typename ElementConverter>
OptionalConverter<T, ElementConverter> getOptionalConverter(const ElementConverter& element) {
    return OptionalConverter<T, ElementConverter>(element);
}

// ******************************************************************************** コンテナ

/// @brief 配列として読み書きするコンテナ（push_backで要素を追加できるレンジ）。
template <typename T>
concept IsSequenceContainer = std::ranges::range<T> && !std::same_as<T, std::string>
    && requires(T& container, std::ranges::range_value_t<T> element) { container.push_back(element); };

/// @brief コンテナのコンバータ。要素ごとにElementConverterへ委譲する。
template <IsSequenceContainer Container, typename ElementConverter>
    requires IsJsonConverter<ElementConverter, std::ranges::range_value_t<Container>>
class ContainerConverter {
public:
    using Value = Container;

    explicit ContainerConverter(const ElementConverter& element) : element_(&element) {}

    void write(FormatWriter& writer, const Container& container) const {
        writer.startArray();
        for (const auto& element : container) {
            element_->write(writer, element);
        }
        writer.endArray();
    }

    Container read(FormatReader& parser) const {
        Container container;
        parser.startArray();
        while (!parser.nextIsEndArray()) {
            container.push_back(element_->read(parser));
        }
        parser.endArray();
        return container;
    }

private:
    const ElementConverter* element_;
};

/// @brief 要素コンバータからコンテナ用のコンバータを作る。
template <typename Container, typename ElementConverter>
ContainerConverter<Container, ElementConverter> getContainerConverter(const ElementConverter& element) {
    return ContainerConverter<Container, ElementConverter>(element);
}

}  // namespace datecodec::serialization
