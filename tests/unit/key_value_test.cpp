/**
 * key_value_test.cpp - Binary KeyValue decoder
 *
 * Tests:
 * - Empty stream, leaf types, nested containers
 * - Sibling overwrite and missing-lookup sentinel
 * - Error kinds: truncated input, bad tags, wide strings
 * - Coercing accessors and to_string formatting
 */

#include "keyvalue/key_value.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include "kv_bytes.hpp"

using namespace statforge::keyvalue;
using statforge::tests::KvBytes;

namespace {

bool decode(const KvBytes &bytes, KeyValue &out, KeyValueError &error) {
    std::istringstream input(bytes.str());
    return KeyValue::decode(input, out, error);
}

KeyValue decode_ok(const KvBytes &bytes) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;
    EXPECT_TRUE(decode(bytes, kv, error)) << error.to_string();
    return kv;
}

}  // namespace

// ===== Decoding =====

TEST(KeyValueDecodeTest, EndTagAloneYieldsEmptyRoot) {
    KeyValue kv = decode_ok(KvBytes().end());

    EXPECT_EQ(kv.name(), "<root>");
    EXPECT_TRUE(kv.valid());
    EXPECT_TRUE(kv.children().empty());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(kv.data()));
}

TEST(KeyValueDecodeTest, StringLeaf) {
    KeyValue kv = decode_ok(KvBytes().string("foo", "bar").end());

    const KeyValue &foo = kv["foo"];
    ASSERT_TRUE(foo.valid());
    EXPECT_EQ(foo.name(), "foo");
    EXPECT_EQ(foo.as_string("x"), "bar");
    EXPECT_EQ(foo.as_i32(-1), -1);
}

TEST(KeyValueDecodeTest, NumericLeavesAreLittleEndian) {
    KeyValue kv = decode_ok(KvBytes()
                                .int32("neg", -2)
                                .int32("big", 0x01020304)
                                .float32("ratio", 2.5f)
                                .uint64("wide", 0x1122334455667788ull)
                                .color("tint", 0xAABBCCDDu)
                                .end());

    EXPECT_EQ(std::get<int32_t>(kv["neg"].data()), -2);
    EXPECT_EQ(std::get<int32_t>(kv["big"].data()), 0x01020304);
    EXPECT_FLOAT_EQ(std::get<float>(kv["ratio"].data()), 2.5f);
    EXPECT_EQ(std::get<uint64_t>(kv["wide"].data()), 0x1122334455667788ull);
    EXPECT_EQ(std::get<ColorValue>(kv["tint"].data()).value, 0xAABBCCDDu);
}

TEST(KeyValueDecodeTest, PointerIsStoredLikeColor) {
    KeyValue kv = decode_ok(KvBytes().tag(KeyValueType::POINTER).cstr("ptr").u32(42).end());

    ASSERT_TRUE(std::holds_alternative<ColorValue>(kv["ptr"].data()));
    EXPECT_EQ(std::get<ColorValue>(kv["ptr"].data()).value, 42u);
}

TEST(KeyValueDecodeTest, NestedContainers) {
    KeyValue kv = decode_ok(KvBytes()
                                .begin("480")
                                .begin("stats")
                                .begin("1")
                                .int32("type_int", 1)
                                .string("name", "kills")
                                .end()
                                .end()
                                .end()
                                .end());

    const KeyValue &stat = kv["480"]["stats"]["1"];
    ASSERT_TRUE(stat.valid());
    EXPECT_EQ(stat["type_int"].as_i32(0), 1);
    EXPECT_EQ(stat["name"].as_string(""), "kills");
    EXPECT_EQ(kv["480"].children().size(), 1u);
}

TEST(KeyValueDecodeTest, LaterSiblingReplacesEarlier) {
    KeyValue kv = decode_ok(KvBytes().string("dup", "first").int32("dup", 7).end());

    ASSERT_EQ(kv.children().size(), 1u);
    EXPECT_EQ(std::get<int32_t>(kv["dup"].data()), 7);
}

TEST(KeyValueDecodeTest, LongStringsGrowPastOneChunk) {
    std::string long_value(300, 'x');
    std::string long_name(130, 'n');
    KeyValue kv = decode_ok(KvBytes().string(long_name, long_value).end());

    EXPECT_EQ(kv[long_name].as_string(""), long_value);
}

TEST(KeyValueDecodeTest, InvalidUtf8BecomesEmptyString) {
    KeyValue kv = decode_ok(KvBytes().tag(KeyValueType::STRING).cstr("bad").raw(0xC3).raw(0x28).raw(0).end());

    ASSERT_TRUE(kv["bad"].valid());
    EXPECT_EQ(kv["bad"].as_string("x"), "");
}

TEST(KeyValueDecodeTest, MultibyteUtf8IsKept) {
    KeyValue kv = decode_ok(KvBytes().string("name", "Caf\xC3\xA9").end());

    EXPECT_EQ(kv["name"].as_string(""), "Caf\xC3\xA9");
}

// ===== Errors =====

TEST(KeyValueDecodeTest, WideStringIsUnsupported) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;

    EXPECT_FALSE(decode(KvBytes().string("ok", "1").tag(KeyValueType::WIDE_STRING).cstr("w").end(), kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::UNSUPPORTED_TYPE);
    // Output untouched on failure
    EXPECT_TRUE(kv.children().empty());
}

TEST(KeyValueDecodeTest, WideStringInsideContainerIsUnsupported) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;

    EXPECT_FALSE(decode(KvBytes().begin("a").tag(KeyValueType::WIDE_STRING).cstr("w").end().end(), kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::UNSUPPORTED_TYPE);
}

TEST(KeyValueDecodeTest, TagAboveEndIsFormatError) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;

    EXPECT_FALSE(decode(KvBytes().raw(9), kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::FORMAT);
    EXPECT_NE(error.to_string().find("9"), std::string::npos);
}

TEST(KeyValueDecodeTest, EmptyStreamIsIoError) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;

    EXPECT_FALSE(decode(KvBytes(), kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::IO);
}

TEST(KeyValueDecodeTest, MissingEndTagIsIoError) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;

    EXPECT_FALSE(decode(KvBytes().string("a", "b"), kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::IO);
}

TEST(KeyValueDecodeTest, UnterminatedStringIsIoError) {
    KvBytes bytes;
    bytes.tag(KeyValueType::STRING).cstr("name");
    std::string truncated = bytes.str() + "no terminator";
    std::istringstream input(truncated);

    KeyValue kv = KeyValue::root();
    KeyValueError error;
    EXPECT_FALSE(KeyValue::decode(input, kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::IO);
}

TEST(KeyValueDecodeTest, TruncatedNumberIsIoError) {
    KvBytes bytes;
    bytes.tag(KeyValueType::UINT64).cstr("n").u32(1);

    KeyValue kv = KeyValue::root();
    KeyValueError error;
    EXPECT_FALSE(decode(bytes, kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::IO);
}

TEST(KeyValueDecodeTest, ExcessiveNestingIsFormatError) {
    KvBytes bytes;
    for (int i = 0; i < 300; ++i) {
        bytes.begin("n");
    }

    KeyValue kv = KeyValue::root();
    KeyValueError error;
    EXPECT_FALSE(decode(bytes, kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::FORMAT);
}

TEST(KeyValueDecodeTest, LoadBinaryReadsFile) {
    auto path = std::filesystem::temp_directory_path() / "statforge_kv_test.bin";
    {
        std::ofstream file(path, std::ios::binary);
        file << KvBytes().int32("answer", 42).end().str();
    }

    KeyValue kv = KeyValue::root();
    KeyValueError error;
    ASSERT_TRUE(KeyValue::load_binary(path.string(), kv, error)) << error.to_string();
    EXPECT_EQ(kv["answer"].as_i32(0), 42);

    std::filesystem::remove(path);
}

TEST(KeyValueDecodeTest, LoadBinaryMissingFile) {
    KeyValue kv = KeyValue::root();
    KeyValueError error;

    EXPECT_FALSE(KeyValue::load_binary("/nonexistent/statforge/schema.bin", kv, error));
    EXPECT_EQ(error.kind, KeyValueErrorKind::IO);
}

// ===== Lookups and accessors =====

TEST(KeyValueAccessTest, MissingChildReturnsSentinel) {
    KeyValue kv = decode_ok(KvBytes().string("a", "1").end());

    const KeyValue &missing = kv.get("nope");
    EXPECT_FALSE(missing.valid());
    EXPECT_EQ(&missing, &KeyValue::invalid());
    EXPECT_TRUE(missing.as_bool(true));
    EXPECT_FALSE(missing.as_bool(false));
    EXPECT_EQ(missing.as_string("dflt"), "dflt");
    EXPECT_EQ(missing.as_i32(9), 9);
    EXPECT_FLOAT_EQ(missing.as_f32(1.25f), 1.25f);

    // Chained lookups through the sentinel stay on the sentinel
    EXPECT_FALSE(kv["nope"]["deeper"]["still"].valid());
}

TEST(KeyValueAccessTest, StringCoercion) {
    KeyValue kv = decode_ok(KvBytes()
                                .string("num", "42")
                                .string("neg", "-7")
                                .string("flt", "1.5")
                                .string("zero", "0")
                                .string("word", "yes")
                                .string("spaced", " 3")
                                .string("huge", "99999999999")
                                .end());

    EXPECT_EQ(kv["num"].as_i32(0), 42);
    EXPECT_EQ(kv["neg"].as_i32(0), -7);
    EXPECT_EQ(kv["flt"].as_i32(-1), -1);
    EXPECT_FLOAT_EQ(kv["flt"].as_f32(0.0f), 1.5f);
    EXPECT_FLOAT_EQ(kv["num"].as_f32(0.0f), 42.0f);
    EXPECT_FLOAT_EQ(kv["word"].as_f32(-1.0f), -1.0f);
    EXPECT_EQ(kv["spaced"].as_i32(-1), -1);
    EXPECT_EQ(kv["huge"].as_i32(-1), -1);

    EXPECT_TRUE(kv["num"].as_bool(false));
    EXPECT_FALSE(kv["zero"].as_bool(true));
    EXPECT_TRUE(kv["word"].as_bool(true));
    EXPECT_FALSE(kv["word"].as_bool(false));
}

TEST(KeyValueAccessTest, NumericCoercion) {
    KeyValue kv = decode_ok(KvBytes()
                                .int32("i", 12)
                                .int32("izero", 0)
                                .float32("f", 3.75f)
                                .float32("fbig", 1e20f)
                                .float32("fsmall", -1e20f)
                                .uint64("u", 0x100000005ull)
                                .end());

    EXPECT_EQ(kv["i"].as_string(""), "12");
    EXPECT_FLOAT_EQ(kv["i"].as_f32(0.0f), 12.0f);
    EXPECT_TRUE(kv["i"].as_bool(false));
    EXPECT_FALSE(kv["izero"].as_bool(true));

    EXPECT_EQ(kv["f"].as_i32(0), 3);
    EXPECT_EQ(kv["f"].as_string(""), "3.75");
    EXPECT_EQ(kv["fbig"].as_i32(0), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(kv["fsmall"].as_i32(0), std::numeric_limits<int32_t>::min());

    // 64-bit values truncate to the low 32 bits
    EXPECT_EQ(kv["u"].as_i32(0), 5);
    EXPECT_EQ(kv["u"].as_string(""), "4294967301");
    EXPECT_TRUE(kv["u"].as_bool(false));
}

TEST(KeyValueAccessTest, FloatTextIsShortestExact) {
    KeyValue kv = decode_ok(KvBytes()
                                .float32("pi", 3.14159274f)
                                .float32("tenth", 0.1f)
                                .float32("one", 1.0f)
                                .float32("neg", -2.5f)
                                .float32("big", 1e20f)
                                .end());

    EXPECT_EQ(kv["pi"].as_string(""), "3.1415927");
    EXPECT_EQ(kv["tenth"].as_string(""), "0.1");
    EXPECT_EQ(kv["one"].as_string(""), "1");
    EXPECT_EQ(kv["neg"].as_string(""), "-2.5");
    EXPECT_EQ(kv["big"].as_string(""), "100000000000000000000");
    EXPECT_EQ(kv["pi"].to_string(), "pi = 3.1415927");
}

TEST(KeyValueAccessTest, ContainerWithoutDataUsesDefaults) {
    KeyValue kv = decode_ok(KvBytes().begin("group").int32("x", 1).end().end());

    const KeyValue &group = kv["group"];
    EXPECT_TRUE(group.valid());
    EXPECT_EQ(group.as_string("d"), "d");
    EXPECT_EQ(group.as_i32(5), 5);
    EXPECT_TRUE(group.as_bool(true));
}

TEST(KeyValueAccessTest, ColorHasNoNumericCoercion) {
    KeyValue kv = decode_ok(KvBytes().color("c", 16).end());

    EXPECT_EQ(kv["c"].as_string(""), "16");
    EXPECT_EQ(kv["c"].as_i32(-1), -1);
    EXPECT_TRUE(kv["c"].as_bool(true));
}

TEST(KeyValueAccessTest, ToStringFormats) {
    KeyValue kv = decode_ok(KvBytes().begin("group").string("name", "value").end().end());

    EXPECT_EQ(kv["group"].to_string(), "group");
    EXPECT_EQ(kv["group"]["name"].to_string(), "name = value");
    EXPECT_EQ(KeyValue::invalid().to_string(), "<invalid>");

    std::ostringstream oss;
    oss << kv["group"]["name"];
    EXPECT_EQ(oss.str(), "name = value");
}

TEST(KeyValueAccessTest, TypeNames) {
    EXPECT_STREQ(key_value_type_to_string(KeyValueType::NONE), "None");
    EXPECT_STREQ(key_value_type_to_string(KeyValueType::WIDE_STRING), "WideString");
    EXPECT_STREQ(key_value_type_to_string(KeyValueType::END), "End");
}
