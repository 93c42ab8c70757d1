#include "stats/stat_definitions.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace statforge::stats;
using nlohmann::json;

namespace {

IntStatInfo make_int_stat(int32_t permission) {
    IntStatInfo stat;
    stat.id = "kills";
    stat.app_id = 480;
    stat.display_name = "Kills";
    stat.permission = permission;
    stat.original_value = 10;
    stat.int_value = 10;
    return stat;
}

FloatStatInfo make_float_stat(int32_t permission) {
    FloatStatInfo stat;
    stat.id = "distance";
    stat.app_id = 480;
    stat.display_name = "Distance";
    stat.is_increment_only = true;
    stat.permission = permission;
    stat.original_value = 1.5f;
    stat.float_value = 1.5f;
    return stat;
}

}  // namespace

TEST(StatDefinitionsTest, PermissionFlags) {
    EXPECT_EQ(permission_flags(false, 0), kStatFlagNone);
    EXPECT_EQ(permission_flags(true, 0), kStatFlagIncrementOnly);
    EXPECT_EQ(permission_flags(false, 2), kStatFlagProtected);
    EXPECT_EQ(permission_flags(false, 1), kStatFlagUnknownPermission);
    EXPECT_EQ(permission_flags(true, 3), kStatFlagIncrementOnly | kStatFlagProtected | kStatFlagUnknownPermission);
}

TEST(StatDefinitionsTest, SetValueMarksModified) {
    IntStatInfo stat = make_int_stat(0);
    std::string error;

    EXPECT_FALSE(stat.is_modified());
    ASSERT_TRUE(stat.set_value(25, error)) << error;
    EXPECT_EQ(stat.value(), 25);
    EXPECT_TRUE(stat.is_modified());

    ASSERT_TRUE(stat.set_value(10, error));
    EXPECT_FALSE(stat.is_modified());
}

TEST(StatDefinitionsTest, ProtectedStatRefusesChange) {
    IntStatInfo stat = make_int_stat(kPermissionProtected);
    std::string error;

    EXPECT_FALSE(stat.set_value(11, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(stat.value(), 10);

    // Writing the same value is not a change
    error.clear();
    EXPECT_TRUE(stat.set_value(10, error));
    EXPECT_TRUE(error.empty());

    FloatStatInfo fstat = make_float_stat(kPermissionProtected);
    EXPECT_FALSE(fstat.set_value(2.0f, error));
    EXPECT_FLOAT_EQ(fstat.value(), 1.5f);
}

TEST(StatDefinitionsTest, StatInfoDispatchesOnKind) {
    StatInfo int_stat(make_int_stat(0));
    StatInfo float_stat(make_float_stat(2));

    EXPECT_TRUE(int_stat.is_integer());
    EXPECT_FALSE(int_stat.is_float());
    EXPECT_EQ(int_stat.id(), "kills");
    EXPECT_EQ(int_stat.display_name(), "Kills");
    EXPECT_EQ(int_stat.value_string(), "10");
    EXPECT_EQ(int_stat.flags(), kStatFlagNone);

    EXPECT_TRUE(float_stat.is_float());
    EXPECT_EQ(float_stat.id(), "distance");
    EXPECT_EQ(float_stat.permission(), 2);
    EXPECT_EQ(float_stat.value_string(), "1.5");
    EXPECT_EQ(float_stat.flags(), kStatFlagIncrementOnly | kStatFlagProtected);
    EXPECT_FALSE(float_stat.is_modified());
}

TEST(StatDefinitionsTest, StatInfoJsonIsExternallyTagged) {
    json j = StatInfo(make_int_stat(0));

    ASSERT_TRUE(j.contains("Integer"));
    EXPECT_EQ(j["Integer"]["id"], "kills");
    EXPECT_EQ(j["Integer"]["int_value"], 10);

    StatInfo back = j.get<StatInfo>();
    ASSERT_TRUE(back.is_integer());
    EXPECT_EQ(back.as_integer().app_id, 480u);

    json f = StatInfo(make_float_stat(0));
    ASSERT_TRUE(f.contains("Float"));
    StatInfo fback = f.get<StatInfo>();
    ASSERT_TRUE(fback.is_float());
    EXPECT_TRUE(fback.as_float().is_increment_only);
}

TEST(StatDefinitionsTest, StatInfoJsonWithoutTagThrows) {
    json j = {{"Double", {{"id", "x"}}}};
    EXPECT_THROW(j.get<StatInfo>(), json::exception);
}

TEST(StatDefinitionsTest, AchievementOptionalsAreNull) {
    AchievementInfo info;
    info.id = "ACH_WIN";
    info.name = "Winner";

    json j = info;
    EXPECT_TRUE(j["unlock_time"].is_null());
    EXPECT_TRUE(j["global_achieved_percent"].is_null());

    info.is_achieved = true;
    info.unlock_time = 1700000000u;
    info.global_achieved_percent = 12.5f;
    AchievementInfo back = json(info).get<AchievementInfo>();
    EXPECT_EQ(back, info);
}

TEST(StatDefinitionsTest, AchievementMissingOptionalsReadAsAbsent) {
    json j = {{"id", "ACH"},       {"is_achieved", false}, {"permission", 0}, {"icon_normal", ""},
              {"icon_locked", ""}, {"name", "A"},          {"description", ""}};

    AchievementInfo info = j.get<AchievementInfo>();
    EXPECT_FALSE(info.unlock_time.has_value());
    EXPECT_FALSE(info.global_achieved_percent.has_value());
}
