import datecodec.serialization.json_writer;
import datecodec.serialization.json_parser;
import datecodec.serialization.json_tokenizer;
import datecodec.serialization.json_token;
import datecodec.serialization.reading_ahead_buffer;
import datecodec.serialization.object_converter;
import datecodec.serialization.field_serializer;
import datecodec.serialization.object_serializer;
import datecodec.serialization.json_io;
import datecodec.test_helper;
#include <gtest/gtest.h>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace datecodec::serialization;
using datecodec::test::CollectingMessageOutput;
using datecodec::test::testJsonRoundTrip;

namespace {

/// @brief テスト用の構造体。
struct Point {
    bool visible = true;
    int x = 1;
    std::string label = "p";
    std::optional<int> weight;

    const ObjectSerializer& serializer() const {
        static const auto weightConverter = getOptionalConverter<std::optional<int>>(getConverter<int>());
        static const auto fields = getFieldSet(
            getRequiredField(&Point::visible, "visible"),
            getRequiredField(&Point::x, "x"),
            getOptionalField(&Point::label, "label", getConverter<std::string>()),
            getOptionalField(&Point::weight, "weight", weightConverter)
        );
        return fields;
    }

    bool operator==(const Point&) const = default;
};

/// @brief 配列を持つ構造体。
struct Path {
    std::vector<int> steps;

    const ObjectSerializer& serializer() const {
        static const auto stepsConverter = getContainerConverter<std::vector<int>>(getConverter<int>());
        static const auto fields = getFieldSet(
            getRequiredField(&Path::steps, "steps", stepsConverter)
        );
        return fields;
    }

    bool operator==(const Path&) const = default;
};

// 文字列をトークン化する
JsonTokenStream tokenize(const std::string& text, CollectingMessageOutput& warnOut) {
    JsonTokenStream tokens;
    ReadingAheadBuffer input{std::string(text), 8};
    JsonTokenizer<ReadingAheadBuffer> tokenizer(input, tokens, warnOut);
    tokenizer.tokenize();
    return tokens;
}

} // namespace

// ******************************************************************************** JsonWriter

TEST(JsonWriterTest, SimpleObject) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startObject();
    writer.key("x"); writer.writeObject(42);
    writer.key("s"); writer.writeObject(std::string_view("hi"));
    writer.endObject();

    EXPECT_EQ(oss.str(), "{x:42,s:\"hi\"}");
}

TEST(JsonWriterTest, QuotesKeysThatAreNotIdentifiers) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startObject();
    writer.key("a b"); writer.writeObject(1);
    writer.key("null"); writer.null();
    writer.endObject();

    EXPECT_EQ(oss.str(), "{\"a b\":1,\"null\":null}");
}

TEST(JsonWriterTest, EscapesStrings) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startArray();
    writer.writeObject("a\"b\\c\n");
    writer.writeObject(std::string("\x01"));
    writer.endArray();

    EXPECT_EQ(oss.str(), "[\"a\\\"b\\\\c\\n\",\"\\u0001\"]");
}

TEST(JsonWriterTest, NestedContainers) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startObject();
    writer.key("a"); writer.startArray();
    writer.startObject(); writer.endObject();
    writer.startArray(); writer.endArray();
    writer.writeObject(-3);
    writer.endArray();
    writer.key("b"); writer.writeObject(0.25);
    writer.endObject();

    EXPECT_EQ(oss.str(), "{a:[{},[],-3],b:0.25}");
}

TEST(JsonWriterTest, RejectsNonFiniteNumbers) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    EXPECT_THROW(writer.writeObject(std::numeric_limits<double>::infinity()), std::runtime_error);
}

// ******************************************************************************** JsonParser

TEST(JsonParserTest, TracksDocumentPath) {
    CollectingMessageOutput warnOut;
    auto tokens = tokenize("{a: {b: [10, 20, 30]}}", warnOut);
    JsonParser parser(tokens);

    parser.startObject();
    EXPECT_EQ(parser.nextKey(), "a");
    parser.startObject();
    EXPECT_EQ(parser.nextKey(), "b");
    parser.startArray();
    int value = 0;
    parser.readTo(value);
    parser.readTo(value);
    EXPECT_EQ(value, 20);
    EXPECT_EQ(parser.previousPath(), "$.a.b[1]");
    EXPECT_EQ(parser.path(), "$.a.b[2]");
}

TEST(JsonParserTest, SkipsComments) {
    CollectingMessageOutput warnOut;
    auto tokens = tokenize("// head\n{ /* inline */ s: 'single' }", warnOut);
    JsonParser parser(tokens);

    parser.startObject();
    EXPECT_EQ(parser.nextKey(), "s");
    std::string s;
    parser.readTo(s);
    EXPECT_EQ(s, "single");
    parser.endObject();
    EXPECT_EQ(parser.nextTokenType(), JsonTokenType::EndOfStream);
}

TEST(JsonParserTest, DecodesUnicodeEscapes) {
    CollectingMessageOutput warnOut;
    auto tokens = tokenize("[\"\\u00e9\\ud83d\\ude00\"]", warnOut);
    JsonParser parser(tokens);

    parser.startArray();
    std::string s;
    parser.readTo(s);
    EXPECT_EQ(s, "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JsonParserTest, WarnsOnLineSeparatorInString) {
    CollectingMessageOutput warnOut;
    // U+2028 をそのまま含む
    auto tokens = tokenize("[\"a\xE2\x80\xA8\x62\"]", warnOut);
    EXPECT_EQ(warnOut.messages().size(), 1u);
}

TEST(JsonParserTest, ReadsNumbersOfEachForm) {
    CollectingMessageOutput warnOut;
    auto tokens = tokenize("[+7, -12, .5, 2.5e2, 9223372036854775807]", warnOut);
    JsonParser parser(tokens);
    parser.startArray();

    int i = 0;
    parser.readTo(i);
    EXPECT_EQ(i, 7);
    parser.readTo(i);
    EXPECT_EQ(i, -12);
    double d = 0.0;
    parser.readTo(d);
    EXPECT_DOUBLE_EQ(d, 0.5);
    parser.readTo(d);
    EXPECT_DOUBLE_EQ(d, 250.0);
    long long big = 0;
    parser.readTo(big);
    EXPECT_EQ(big, 9223372036854775807LL);
}

TEST(JsonParserTest, IntegerOutOfRangeThrows) {
    Point p;
    try {
        readJsonString("{visible:true,x:99999999999999999999}", p);
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("number out of range"), std::string::npos);
    }
}

TEST(JsonParserTest, NarrowIntegerOutOfRangeThrows) {
    Point p;
    EXPECT_THROW(readJsonString("{visible:true,x:4294967296}", p), std::runtime_error);
}

TEST(JsonParserTest, ExponentOutOfRangeThrows) {
    CollectingMessageOutput warnOut;
    auto tokens = tokenize("[1e99999999999999999999]", warnOut);
    JsonParser parser(tokens);
    parser.startArray();
    double d = 0.0;
    EXPECT_THROW(parser.readTo(d), std::runtime_error);
}

TEST(JsonParserTest, FractionIsNotAnInteger) {
    Point p;
    EXPECT_THROW(readJsonString("{visible:true,x:1.5}", p), std::runtime_error);
}

TEST(JsonParserTest, UnpairedSurrogateThrows) {
    CollectingMessageOutput warnOut;
    EXPECT_THROW(tokenize("[\"\\ud83d\"]", warnOut), std::runtime_error);
}

TEST(JsonParserTest, TypeMismatchThrows) {
    CollectingMessageOutput warnOut;
    auto tokens = tokenize("[true]", warnOut);
    JsonParser parser(tokens);
    parser.startArray();
    std::string s;
    EXPECT_THROW(parser.readTo(s), std::runtime_error);
}

// ******************************************************************************** ObjectSerializer

TEST(ObjectSerializerTest, RoundTrip) {
    Point p;
    p.x = 5;
    p.label = "five";
    p.weight = 3;
    testJsonRoundTrip(p, "{visible:true,x:5,label:\"five\",weight:3}");
}

TEST(ObjectSerializerTest, OptionalWritesNull) {
    Point p;
    testJsonRoundTrip(p, "{visible:true,x:1,label:\"p\",weight:null}");
}

TEST(ObjectSerializerTest, ContainerField) {
    Path path;
    path.steps = {3, 1, 2};
    testJsonRoundTrip(path, "{steps:[3,1,2]}");
}

TEST(ObjectSerializerTest, OptionalFieldMayBeMissing) {
    Point p;
    readJsonString("{visible:false,x:7}", p);
    EXPECT_FALSE(p.visible);
    EXPECT_EQ(p.x, 7);
    EXPECT_EQ(p.label, "p");
    EXPECT_FALSE(p.weight.has_value());
}

TEST(ObjectSerializerTest, MissingRequiredFieldThrows) {
    Point p;
    EXPECT_THROW(readJsonString("{visible:true}", p), std::runtime_error);
}

TEST(ObjectSerializerTest, DuplicateKeyThrows) {
    Point p;
    EXPECT_THROW(readJsonString("{visible:true,x:1,x:2}", p), std::runtime_error);
}

TEST(ObjectSerializerTest, UnknownKeysAreCollected) {
    Point p;
    std::vector<std::string> unknownKeys;
    readJsonString("{visible:true,extra:{a:[1,2]},x:3,other:null}", p, unknownKeys);
    EXPECT_EQ(p.x, 3);
    ASSERT_EQ(unknownKeys.size(), 2u);
    EXPECT_EQ(unknownKeys[0], "extra");
    EXPECT_EQ(unknownKeys[1], "other");
}

TEST(ObjectSerializerTest, TrailingContentThrows) {
    Point p;
    EXPECT_THROW(readJsonString("{visible:true,x:1} 5", p), std::runtime_error);
}

TEST(JsonIOTest, SingleValue) {
    const auto& converter = getConverter<int>();
    EXPECT_EQ(getJsonValueContent(12, converter), "12");
    EXPECT_EQ(readJsonValueString(" 12 ", converter), 12);
}
