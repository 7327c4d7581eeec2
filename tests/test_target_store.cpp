#include <gtest/gtest.h>
#include "../core/domain/TargetStore.hpp"
#include <cstdio>
#include <fstream>

using namespace nearme;
using domain::LoadError;
using domain::TargetStore;

namespace {

std::string writeTempFile(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST(TargetStoreTest, ParsesRecordsInFileOrder) {
    auto targets = TargetStore::parse(R"([
        {"id": "a", "name": "Home", "latitude": 1.0, "longitude": 2.0, "radiusMeters": 150},
        {"id": "b", "name": "Work", "latitude": -33.5, "longitude": 151.2}
    ])");

    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].id, "a");
    EXPECT_EQ(targets[0].name, "Home");
    EXPECT_DOUBLE_EQ(targets[0].latitude, 1.0);
    EXPECT_DOUBLE_EQ(targets[0].longitude, 2.0);
    EXPECT_DOUBLE_EQ(targets[0].effectiveRadius(), 150.0);
    EXPECT_EQ(targets[0].geofenceKey(), "a::Home");
    EXPECT_EQ(targets[1].id, "b");
}

TEST(TargetStoreTest, AppliesDefaultsForOptionalFields) {
    auto targets = TargetStore::parse(R"([{"id": "x", "latitude": 10, "longitude": 20}])");

    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].name, "Saved place");
    EXPECT_FALSE(targets[0].radiusMeters.has_value());
    EXPECT_DOUBLE_EQ(targets[0].effectiveRadius(), 200.0);
    EXPECT_EQ(targets[0].geofenceKey(), "x::Saved place");
}

TEST(TargetStoreTest, EmptyArrayIsValid) {
    EXPECT_TRUE(TargetStore::parse("[]").empty());
}

TEST(TargetStoreTest, RejectsMalformedSources) {
    EXPECT_THROW(TargetStore::parse("not json"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"({"id": "a"})"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a", "longitude": 2.0}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a", "latitude": "1", "longitude": 2.0}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"latitude": 1.0, "longitude": 2.0}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([42])"), LoadError);
}

TEST(TargetStoreTest, OneBadRecordRejectsTheWholeSet) {
    EXPECT_THROW(TargetStore::parse(R"([
        {"id": "a", "latitude": 1.0, "longitude": 2.0},
        {"id": "b", "latitude": 1.0}
    ])"), LoadError);
}

TEST(TargetStoreTest, RejectsValuesThatCannotBecomeGeofences) {
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a", "latitude": 91, "longitude": 0}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a", "latitude": 0, "longitude": -181}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a", "latitude": 0, "longitude": 0, "radiusMeters": 0}])"),
                 LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "", "latitude": 0, "longitude": 0}])"), LoadError);
}

TEST(TargetStoreTest, RejectsKeySeparatorInIdOrName) {
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a::b", "latitude": 0, "longitude": 0}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a:", "name": "Home", "latitude": 0, "longitude": 0}])"),
                 LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a:b", "latitude": 0, "longitude": 0}])"), LoadError);
    EXPECT_THROW(TargetStore::parse(R"([{"id": "a", "name": "x::y", "latitude": 0, "longitude": 0}])"),
                 LoadError);
}

TEST(TargetStoreTest, AcceptedTargetsKeepTheirNameThroughTheKey) {
    auto targets = TargetStore::parse(R"([
        {"id": "a", "name": ":Home", "latitude": 0, "longitude": 0},
        {"id": "b", "name": "Home:", "latitude": 0, "longitude": 0},
        {"id": "c", "name": "", "latitude": 0, "longitude": 0}
    ])");

    ASSERT_EQ(targets.size(), 3u);
    for (const auto& target : targets) {
        EXPECT_EQ(geofenceNameFromKey(target.geofenceKey()), target.name) << target.id;
    }
}

TEST(TargetStoreTest, RejectsDuplicateGeofenceKeys) {
    try {
        TargetStore::parse(R"([
            {"id": "a", "name": "Home", "latitude": 0, "longitude": 0},
            {"id": "a", "name": "Home", "latitude": 5, "longitude": 5}
        ])");
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_NE(std::string(e.what()).find("a::Home"), std::string::npos);
    }

    // Same id with a different name is a different key
    EXPECT_NO_THROW(TargetStore::parse(R"([
        {"id": "a", "name": "Home", "latitude": 0, "longitude": 0},
        {"id": "a", "name": "Cabin", "latitude": 5, "longitude": 5}
    ])"));
}

TEST(TargetStoreTest, LoadReadsFile) {
    auto path = writeTempFile("nearme_targets_ok.json",
                              R"([{"id": "a", "name": "Home", "latitude": 1, "longitude": 2}])");
    TargetStore store(path);

    const auto& targets = store.load();
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(store.targets().front().geofenceKey(), "a::Home");
    std::remove(path.c_str());
}

TEST(TargetStoreTest, MissingFileIsLoadError) {
    TargetStore store(::testing::TempDir() + "nearme_does_not_exist.json");
    EXPECT_THROW(store.load(), LoadError);
    EXPECT_TRUE(store.targets().empty());
}

TEST(TargetStoreTest, FailedReloadKeepsPreviousSet) {
    auto path = writeTempFile("nearme_targets_reload.json",
                              R"([{"id": "a", "latitude": 1, "longitude": 2}])");
    TargetStore store(path);
    store.load();

    writeTempFile("nearme_targets_reload.json", "[{");
    EXPECT_THROW(store.load(), LoadError);
    ASSERT_EQ(store.targets().size(), 1u);
    EXPECT_EQ(store.targets().front().id, "a");
    std::remove(path.c_str());
}

TEST(TargetStoreTest, BundledSampleLoads) {
    TargetStore store(std::string(NEARME_TEST_ASSETS) + "/coordinates.json");
    auto targets = store.load();
    EXPECT_FALSE(targets.empty());
}
