#include "stats/stat_schema.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <filesystem>
#include <limits>
#include <sstream>

#include "kv_bytes.hpp"

namespace fs = std::filesystem;
using namespace statforge::stats;
using statforge::keyvalue::KeyValue;
using statforge::keyvalue::KeyValueError;
using statforge::tests::KvBytes;

namespace {

KeyValue decode_tree(const KvBytes &bytes) {
    std::istringstream input(bytes.str());
    KeyValue root = KeyValue::root();
    KeyValueError error;
    EXPECT_TRUE(KeyValue::decode(input, root, error)) << error.to_string();
    return root;
}

}  // namespace

class StatSchemaTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "statforge_schema_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }
};

TEST_F(StatSchemaTest, ParsesSampleSchema) {
    KeyValue root = decode_tree(statforge::tests::sample_schema_bytes());
    StatSchema schema;
    std::string error;

    ASSERT_TRUE(parse_stat_schema(root, 480, "english", schema, error)) << error;
    EXPECT_EQ(schema.app_id, 480u);
    EXPECT_FALSE(schema.empty());

    ASSERT_EQ(schema.integer_stats.size(), 1u);
    const auto &kills = schema.integer_stats[0];
    EXPECT_EQ(kills.id, "kills");
    EXPECT_EQ(kills.display_name, "Kills");
    EXPECT_EQ(kills.min_value, 0);
    EXPECT_EQ(kills.max_value, 1000);
    EXPECT_TRUE(kills.increment_only);
    EXPECT_EQ(kills.permission, 0);

    ASSERT_EQ(schema.float_stats.size(), 1u);
    const auto &distance = schema.float_stats[0];
    EXPECT_EQ(distance.id, "distance");
    EXPECT_EQ(distance.display_name, "distance");
    EXPECT_EQ(distance.permission, 2);
    EXPECT_EQ(distance.min_value, std::numeric_limits<float>::lowest());
    EXPECT_EQ(distance.max_value, std::numeric_limits<float>::max());

    ASSERT_EQ(schema.achievements.size(), 2u);
    EXPECT_EQ(schema.achievements[0].id, "ACH_WIN");
    EXPECT_EQ(schema.achievements[0].name, "Winner");
    EXPECT_EQ(schema.achievements[0].description, "Win a game");
    EXPECT_EQ(schema.achievements[0].icon_normal, "win.jpg");
    EXPECT_EQ(schema.achievements[0].icon_locked, "win_gray.jpg");
    EXPECT_FALSE(schema.achievements[0].is_hidden);

    EXPECT_EQ(schema.achievements[1].id, "ACH_SECRET");
    EXPECT_EQ(schema.achievements[1].name, "ACH_SECRET");
    EXPECT_TRUE(schema.achievements[1].is_hidden);
}

TEST_F(StatSchemaTest, PrefersRequestedLanguage) {
    KeyValue root = decode_tree(statforge::tests::sample_schema_bytes());
    StatSchema schema;
    std::string error;

    ASSERT_TRUE(parse_stat_schema(root, 480, "german", schema, error)) << error;
    EXPECT_EQ(schema.integer_stats[0].display_name, "Abschuesse");
    // No german text for the achievement: english is used
    EXPECT_EQ(schema.achievements[0].name, "Winner");
}

TEST_F(StatSchemaTest, MissingAppSectionFails) {
    KeyValue root = decode_tree(statforge::tests::sample_schema_bytes());
    StatSchema schema;
    std::string error;

    EXPECT_FALSE(parse_stat_schema(root, 730, "english", schema, error));
    EXPECT_NE(error.find("730"), std::string::npos);
}

TEST_F(StatSchemaTest, EntriesFollowNumericOrder) {
    KvBytes bytes;
    bytes.begin("1").begin("stats");
    for (int i : {10, 2, 1}) {
        bytes.begin(std::to_string(i)).int32("type_int", 1).string("name", "stat_" + std::to_string(i)).end();
    }
    bytes.end().end().end();

    KeyValue root = decode_tree(bytes);
    StatSchema schema;
    std::string error;
    ASSERT_TRUE(parse_stat_schema(root, 1, "english", schema, error)) << error;

    ASSERT_EQ(schema.integer_stats.size(), 3u);
    EXPECT_EQ(schema.integer_stats[0].id, "stat_1");
    EXPECT_EQ(schema.integer_stats[1].id, "stat_2");
    EXPECT_EQ(schema.integer_stats[2].id, "stat_10");
}

TEST_F(StatSchemaTest, UnknownTypesAndUnnamedBitsAreSkipped) {
    KvBytes bytes;
    bytes.begin("5")
        .begin("stats")
        .begin("1")
        .int32("type_int", 99)
        .string("name", "weird")
        .end()
        .begin("2")
        .int32("type_int", 0)
        .end()
        .begin("3")
        .int32("type_int", 5)
        .begin("BITS")
        .begin("0")
        .string("name", "")
        .end()
        .begin("1")
        .string("name", "ACH_GROUP")
        .end()
        .end()
        .end()
        .begin("4")
        .int32("type_int", 3)
        .string("name", "rate")
        .end()
        .end()
        .end()
        .end();

    KeyValue root = decode_tree(bytes);
    StatSchema schema;
    std::string error;
    ASSERT_TRUE(parse_stat_schema(root, 5, "english", schema, error)) << error;

    EXPECT_TRUE(schema.integer_stats.empty());
    ASSERT_EQ(schema.float_stats.size(), 1u);
    EXPECT_EQ(schema.float_stats[0].id, "rate");
    ASSERT_EQ(schema.achievements.size(), 1u);
    EXPECT_EQ(schema.achievements[0].id, "ACH_GROUP");
}

TEST_F(StatSchemaTest, IntegerBoundsDefaultToFullRange) {
    KvBytes bytes;
    bytes.begin("7").begin("stats").begin("0").int32("type_int", 1).string("name", "n").end().end().end().end();

    KeyValue root = decode_tree(bytes);
    StatSchema schema;
    std::string error;
    ASSERT_TRUE(parse_stat_schema(root, 7, "english", schema, error)) << error;

    ASSERT_EQ(schema.integer_stats.size(), 1u);
    EXPECT_EQ(schema.integer_stats[0].min_value, INT32_MIN);
    EXPECT_EQ(schema.integer_stats[0].max_value, INT32_MAX);
    EXPECT_FALSE(schema.integer_stats[0].increment_only);
}

TEST_F(StatSchemaTest, LoadFromFile) {
    fs::path path = temp_dir / "UserGameStatsSchema_480.bin";
    statforge::tests::sample_schema_bytes().write_to(path);

    StatSchema schema;
    std::string error;
    ASSERT_TRUE(load_stat_schema(path.string(), 480, "english", schema, error)) << error;
    EXPECT_EQ(schema.achievements.size(), 2u);
}

TEST_F(StatSchemaTest, LoadCorruptFileFails) {
    fs::path path = temp_dir / "UserGameStatsSchema_1.bin";
    KvBytes().begin("1").tag(KvBytes::Type::WIDE_STRING).cstr("x").write_to(path);

    StatSchema schema;
    std::string error;
    EXPECT_FALSE(load_stat_schema(path.string(), 1, "english", schema, error));
    EXPECT_NE(error.find("Unsupported"), std::string::npos);
}

TEST(LocalizedStringTest, FallbackChain) {
    KvBytes bytes;
    bytes.begin("name")
        .string("english", "Hello")
        .string("french", "")
        .end()
        .string("plain", "Plain")
        .end();
    KeyValue root = decode_tree(bytes);

    EXPECT_EQ(localized_string(root["name"], "english", "fb"), "Hello");
    EXPECT_EQ(localized_string(root["name"], "french", "fb"), "Hello");
    EXPECT_EQ(localized_string(root["plain"], "french", "fb"), "Plain");
    EXPECT_EQ(localized_string(root["missing"], "english", "fb"), "fb");
}
