#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "host/scene_document.hpp"

namespace {

using hostbridge::host::Point3;
using hostbridge::host::SceneDocument;
using hostbridge::host::format_iso8601;
using hostbridge::host::wildcard_match;

// 2024-05-01T12:34:56Z
const auto kCreated = std::chrono::system_clock::from_time_t(1714566896);

TEST(SceneDocumentTest, StartsWithDefaultLayer) {
    SceneDocument document;
    ASSERT_EQ(document.layers().size(), 1u);
    EXPECT_EQ(document.current_layer().name, "Default");
    EXPECT_EQ(document.units(), "Millimeters");
    EXPECT_TRUE(document.objects().empty());
}

TEST(SceneDocumentTest, EnsureLayerCreatesOnce) {
    SceneDocument document;
    const std::string id = document.ensure_layer("Walls").id;
    EXPECT_EQ(document.ensure_layer("Walls").id, id);
    EXPECT_EQ(document.layers().size(), 2u);
    EXPECT_NE(document.find_layer("Walls")->color, document.find_layer("Default")->color);

    EXPECT_TRUE(document.set_current_layer("Walls"));
    EXPECT_EQ(document.current_layer().name, "Walls");
    EXPECT_FALSE(document.set_current_layer("Roof"));
    EXPECT_EQ(document.current_layer().name, "Walls");
}

TEST(SceneDocumentTest, AddBoxFillsGeometryAndDefaults) {
    SceneDocument document;
    const auto& box = document.add_box(Point3{1.0, 2.0, 3.0}, 2.0, "", "", kCreated);

    EXPECT_EQ(box.id, "obj-1");
    EXPECT_EQ(box.short_id, "01123456");
    EXPECT_EQ(box.created_at, "2024-05-01T12:34:56Z");
    EXPECT_EQ(box.name, "Box_01123456");
    EXPECT_EQ(box.type, "Box");
    EXPECT_EQ(box.layer, "Default");
    EXPECT_EQ(box.max_corner, (Point3{3.0, 4.0, 5.0}));
}

TEST(SceneDocumentTest, AddBoxOnNewLayerCreatesIt) {
    SceneDocument document;
    const auto& box = document.add_box(Point3{0.0, 0.0, 0.0}, 1.0, "Slab", "Floors", kCreated);
    EXPECT_EQ(box.name, "Slab");
    EXPECT_EQ(box.layer, "Floors");
    EXPECT_NE(document.find_layer("Floors"), nullptr);
    EXPECT_EQ(document.current_layer().name, "Default");
}

TEST(SceneDocumentTest, ShortIdsStayUniqueWithinOneSecond) {
    SceneDocument document;
    const std::string first = document.add_box(Point3{}, 1.0, "a", "", kCreated).short_id;
    const std::string second = document.add_box(Point3{}, 1.0, "b", "", kCreated).short_id;
    const std::string third = document.add_box(Point3{}, 1.0, "c", "", kCreated).short_id;

    EXPECT_EQ(first, "01123456");
    EXPECT_EQ(second, "01123456-2");
    EXPECT_EQ(third, "01123456-3");
}

TEST(SceneDocumentTest, FindObjectById) {
    SceneDocument document;
    document.add_box(Point3{}, 1.0, "a", "", kCreated);
    ASSERT_NE(document.find_object("obj-1"), nullptr);
    document.find_object("obj-1")->description = "first";
    EXPECT_EQ(document.objects().front().description, "first");
    EXPECT_EQ(document.find_object("obj-2"), nullptr);
}

TEST(SceneDocumentTest, FormatsIso8601InUtc) {
    EXPECT_EQ(format_iso8601(std::chrono::system_clock::from_time_t(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_iso8601(kCreated), "2024-05-01T12:34:56Z");
}

TEST(WildcardMatchTest, SupportsStarAndQuestionMark) {
    EXPECT_TRUE(wildcard_match("*", ""));
    EXPECT_TRUE(wildcard_match("Box*", "Box_01123456"));
    EXPECT_TRUE(wildcard_match("*Wall*", "NorthWallA"));
    EXPECT_TRUE(wildcard_match("Lay?r", "Layer"));
    EXPECT_TRUE(wildcard_match("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(wildcard_match("Box?", "Box"));
    EXPECT_FALSE(wildcard_match("box*", "Box_1"));
    EXPECT_FALSE(wildcard_match("a*b", "aXXbc"));
    EXPECT_FALSE(wildcard_match("", "x"));
}

}  // namespace
