#include <gtest/gtest.h>
#include "../core/Target.hpp"
#include <string>
#include <vector>

using namespace nearme;

namespace {

struct KeyCase {
    std::string id;
    std::string name;
};

} // namespace

TEST(GeofenceKeyTest, NameSurvivesTheKey) {
    const std::vector<KeyCase> cases = {
        {"a", "Home"},
        {"a", ""},
        {"a", "Gate:3"},
        {"a", ":Home"},
        {"a", "Home:"},
        {"a", ":"},
        {"cafe-7", "Caf\xC3\xA9 M\xC3\xBCller"},
        {"tokyo", "\xE6\x9D\xB1\xE4\xBA\xAC\xE9\xA7\x85"},
        {"", "Unnamed id"},
    };

    for (const auto& c : cases) {
        const std::string key = makeGeofenceKey(c.id, c.name);
        EXPECT_EQ(geofenceNameFromKey(key), c.name) << "key=" << key;
    }
}

TEST(GeofenceKeyTest, KeyJoinsIdAndName) {
    EXPECT_EQ(makeGeofenceKey("a", "Home"), "a::Home");

    Target target;
    target.id = "b";
    target.name = "Work";
    EXPECT_EQ(target.geofenceKey(), "b::Work");
}

TEST(GeofenceKeyTest, KeyWithoutSeparatorIsItsOwnName) {
    EXPECT_EQ(geofenceNameFromKey("legacy"), "legacy");
    EXPECT_EQ(geofenceNameFromKey("a:Home"), "a:Home");
    EXPECT_EQ(geofenceNameFromKey(""), "");
}

TEST(GeofenceKeyTest, OnlyTheFirstSeparatorSplits) {
    EXPECT_EQ(geofenceNameFromKey("a::b::c"), "b::c");
    EXPECT_EQ(geofenceNameFromKey("::Home"), "Home");
    EXPECT_EQ(geofenceNameFromKey("a::"), "");
}
