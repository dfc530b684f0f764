#include "symseal/data/serializer.hpp"
#include "symseal/data/value.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

using Symseal::byte_vec;
using Symseal::SerializationError;
using Symseal::Data::Value;
using Symseal::Data::deserialize;
using Symseal::Data::serialize;

namespace {

Value nested_arrays(size_t depth) {
    Value v = Value::Array{};
    for (size_t i = 0; i < depth; ++i) {
        v = Value::Array{v};
    }
    return v;
}

} // namespace

TEST(SerializerTest, RoundTripsEveryType) {
    Value original = Value::Map{
        {"null", nullptr},
        {"yes", true},
        {"no", false},
        {"int", 42},
        {"negative", -7},
        {"min", static_cast<long long>(std::numeric_limits<int64_t>::min())},
        {"float", 3.25},
        {"text", "h\xC3\xA9llo"},
        {"empty_text", ""},
        {"bytes", byte_vec{0x00, 0xff, 0x10, 0x00}},
        {"list", Value::Array{1, "two", 3.0, Value::Array{}, Value::Map{}}},
        {"nested", Value::Map{{"inner", Value::Map{{"deep", Value::Array{nullptr}}}}}},
    };

    Value restored = deserialize(serialize(original));
    EXPECT_EQ(restored, original);
    EXPECT_EQ(restored.at("min").as_integer(), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(restored.at("nested").at("inner").at("deep").at(0), Value(nullptr));
}

TEST(SerializerTest, KeepsIntegerAndFloatDistinct) {
    Value as_int = deserialize(serialize(Value(1)));
    Value as_float = deserialize(serialize(Value(1.0)));

    EXPECT_TRUE(as_int.is_integer());
    EXPECT_TRUE(as_float.is_float());
    EXPECT_NE(as_int, as_float);
}

TEST(SerializerTest, KeepsStringAndBytesDistinct) {
    Value text = deserialize(serialize(Value("ab")));
    Value raw = deserialize(serialize(Value(byte_vec{'a', 'b'})));

    EXPECT_TRUE(text.is_string());
    EXPECT_TRUE(raw.is_bytes());
}

TEST(SerializerTest, ProducesDocumentedEncoding) {
    EXPECT_EQ(serialize(Value()), (byte_vec{0x01, 0x00}));
    EXPECT_EQ(serialize(Value(true)), (byte_vec{0x01, 0x01, 0x01}));
    EXPECT_EQ(serialize(Value(1)), (byte_vec{0x01, 0x02, 0, 0, 0, 0, 0, 0, 0, 1}));
    EXPECT_EQ(serialize(Value("hi")), (byte_vec{0x01, 0x04, 0, 0, 0, 2, 'h', 'i'}));
    EXPECT_EQ(serialize(Value(Value::Map{{"b", 1}, {"a", nullptr}})),
              (byte_vec{0x01, 0x07, 0, 0, 0, 2,
                        0, 0, 0, 1, 'a', 0x00,
                        0, 0, 0, 1, 'b', 0x02, 0, 0, 0, 0, 0, 0, 0, 1}));
}

TEST(SerializerTest, SameValueAlwaysSerializesIdentically) {
    Value::Map first;
    first["zeta"] = 1;
    first["alpha"] = 2;
    Value::Map second;
    second["alpha"] = 2;
    second["zeta"] = 1;

    EXPECT_EQ(serialize(Value(first)), serialize(Value(second)));
}

TEST(SerializerTest, RejectsExcessiveNestingOnSerialize) {
    EXPECT_NO_THROW(serialize(nested_arrays(100)));
    EXPECT_THROW(serialize(nested_arrays(200)), SerializationError);
}

TEST(SerializerTest, RejectsExcessiveNestingOnDeserialize) {
    byte_vec bytes{0x01};
    for (int i = 0; i < 200; ++i) {
        bytes.insert(bytes.end(), {0x06, 0, 0, 0, 1});
    }
    bytes.push_back(0x00);
    EXPECT_THROW(deserialize(bytes), SerializationError);
}

TEST(SerializerTest, RejectsEmptyAndWrongFormat) {
    EXPECT_THROW(deserialize({}), SerializationError);
    EXPECT_THROW(deserialize({0x02, 0x00}), SerializationError);
}

TEST(SerializerTest, RejectsUnknownTag) {
    EXPECT_THROW(deserialize({0x01, 0x09}), SerializationError);
}

TEST(SerializerTest, RejectsTruncatedInput) {
    EXPECT_THROW(deserialize({0x01, 0x02, 0, 0, 0}), SerializationError);
    EXPECT_THROW(deserialize({0x01, 0x04, 0, 0, 0, 10, 'a'}), SerializationError);
    EXPECT_THROW(deserialize({0x01, 0x06, 0, 0, 0, 2, 0x00}), SerializationError);
}

TEST(SerializerTest, RejectsTrailingBytes) {
    EXPECT_THROW(deserialize({0x01, 0x00, 0x00}), SerializationError);
}

TEST(SerializerTest, RejectsInvalidBoolean) {
    EXPECT_THROW(deserialize({0x01, 0x01, 0x02}), SerializationError);
}

TEST(SerializerTest, RejectsNonCanonicalMapKeys) {
    byte_vec unordered{0x01, 0x07, 0, 0, 0, 2,
                       0, 0, 0, 1, 'b', 0x00,
                       0, 0, 0, 1, 'a', 0x00};
    byte_vec duplicated{0x01, 0x07, 0, 0, 0, 2,
                        0, 0, 0, 1, 'a', 0x00,
                        0, 0, 0, 1, 'a', 0x00};
    EXPECT_THROW(deserialize(unordered), SerializationError);
    EXPECT_THROW(deserialize(duplicated), SerializationError);
}

TEST(ValueTest, TypedAccessorsRejectMismatch) {
    Value v(5);
    EXPECT_EQ(v.as_integer(), 5);
    EXPECT_THROW(v.as_string(), SerializationError);
    EXPECT_THROW(v.at("key"), SerializationError);
    EXPECT_THROW(Value(Value::Array{}).at(0), SerializationError);
}

TEST(ValueTest, InspectRendersNestedValues) {
    Value v = Value::Map{{"id", 42}, {"name", "alice"}, {"tags", Value::Array{true, nullptr}}};
    EXPECT_EQ(v.inspect(), "{\"id\": 42, \"name\": \"alice\", \"tags\": [true, null]}");
    EXPECT_EQ(Value(byte_vec{0x0a, 0xff}).inspect(), "<bytes:0aff>");
}
