#include "../scene.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using json = nlohmann::json;

TEST(SceneTest, ParsesInstancesAndLights) {
    const json j = json::parse(R"({
        "sprite_root": "assets/tiles",
        "instances": [
            { "sprite": "stone_wall_2X1_a.png", "cell_x": 4, "cell_y": 1, "rotation": 1, "occluder": true },
            { "sprite": "rug.png", "cell_x": 0, "cell_y": 0, "center": [0.25, 0.75], "scale": 0.5 },
            { "sprite": "pillar.png", "footprint": [1, 2], "mirror_x": true, "occluder": true }
        ],
        "lights": [ { "cell_x": 3, "cell_y": 2 }, { "cell_x": 0, "cell_y": 1, "radius": 6 } ]
    })");

    const Scene scene = scene_from_json(j);
    EXPECT_EQ(scene.sprite_root, "assets/tiles");
    ASSERT_EQ(scene.instances.size(), 3u);

    const PlacedInstance& wall = scene.instances[0];
    EXPECT_EQ(wall.footprint.w, 2);
    EXPECT_EQ(wall.footprint.h, 1);
    EXPECT_EQ(wall.oriented_footprint().w, 1);
    EXPECT_TRUE(wall.is_occluder);
    EXPECT_DOUBLE_EQ(wall.resolved_center().x, 4.5);
    EXPECT_DOUBLE_EQ(wall.resolved_center().y, 2.0);

    const PlacedInstance& rug = scene.instances[1];
    EXPECT_FALSE(rug.is_occluder);
    ASSERT_TRUE(rug.center.has_value());
    EXPECT_DOUBLE_EQ(rug.resolved_center().y, 0.75);
    EXPECT_DOUBLE_EQ(rug.scale, 0.5);

    EXPECT_EQ(scene.instances[2].footprint.h, 2);
    EXPECT_TRUE(scene.instances[2].mirror_x);

    ASSERT_EQ(scene.lights.size(), 2u);
    EXPECT_FALSE(scene.lights[0].radius.has_value());
    EXPECT_DOUBLE_EQ(*scene.lights[1].radius, 6.0);
    EXPECT_DOUBLE_EQ(scene.lights[0].center().x, 3.5);
}

TEST(SceneTest, MalformedEntriesThrow) {
    EXPECT_THROW(scene_from_json(json::parse(R"({ "instances": [ { "cell_x": 1 } ] })")), std::runtime_error);
    EXPECT_THROW(scene_from_json(json::parse(R"({ "instances": [ { "sprite": "a.png", "rotation": 5 } ] })")),
                 std::runtime_error);
    EXPECT_THROW(scene_from_json(json::parse(R"({ "instances": [ { "sprite": "a.png", "center": [1] } ] })")),
                 std::runtime_error);
    EXPECT_THROW(scene_from_json(json::parse(R"({ "lights": [ { "cell_x": "far" } ] })")), std::runtime_error);
    EXPECT_THROW(load_scene("/nonexistent/scene.json"), std::runtime_error);
}

TEST(SceneTest, RegionsSerializeWithVersion) {
    LitRegion region;
    region.light.cell_x = 1;
    region.origin = { 1.5, 0.5 };
    region.radius = 4.0;
    region.polygon = { { 0, 0 }, { 1, 0 }, { 0, 1 } };

    const json out = lit_regions_to_json({ region }, 7);
    EXPECT_EQ(out["occluder_version"].get<uint64_t>(), 7u);
    ASSERT_EQ(out["lights"].size(), 1u);
    EXPECT_EQ(out["lights"][0]["polygon"].size(), 3u);
    EXPECT_DOUBLE_EQ(out["lights"][0]["origin"][0].get<double>(), 1.5);
}
