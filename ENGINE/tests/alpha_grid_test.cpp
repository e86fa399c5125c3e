#include "../alpha_grid.hpp"
#include "../sprite_footprint.hpp"
#include "fake_alpha_sampler.hpp"

#include <gtest/gtest.h>

namespace {

// 3x2 grid with distinct values:
//   1 2 3
//   4 5 6
AlphaGrid numbered() {
    AlphaGrid g;
    g.width = 3;
    g.height = 2;
    g.alpha = { 1, 2, 3, 4, 5, 6 };
    return g;
}

} // namespace

TEST(OrientAlphaGridTest, IdentityKeepsPixels) {
    const AlphaGrid out = orient_alpha_grid(numbered(), 0, false, false);
    EXPECT_EQ(out.width, 3);
    EXPECT_EQ(out.height, 2);
    EXPECT_EQ(out.alpha, numbered().alpha);
}

TEST(OrientAlphaGridTest, QuarterTurnIsClockwiseAndSwapsAxes) {
    const AlphaGrid out = orient_alpha_grid(numbered(), 1, false, false);
    ASSERT_EQ(out.width, 2);
    ASSERT_EQ(out.height, 3);
    //   4 1
    //   5 2
    //   6 3
    EXPECT_EQ(out.alpha, (std::vector<uint8_t>{ 4, 1, 5, 2, 6, 3 }));
}

TEST(OrientAlphaGridTest, HalfTurnReversesPixels) {
    const AlphaGrid out = orient_alpha_grid(numbered(), 2, false, false);
    EXPECT_EQ(out.alpha, (std::vector<uint8_t>{ 6, 5, 4, 3, 2, 1 }));
}

TEST(OrientAlphaGridTest, ThreeQuarterTurnIsCounterClockwise) {
    const AlphaGrid out = orient_alpha_grid(numbered(), 3, false, false);
    ASSERT_EQ(out.width, 2);
    //   3 6
    //   2 5
    //   1 4
    EXPECT_EQ(out.alpha, (std::vector<uint8_t>{ 3, 6, 2, 5, 1, 4 }));
    EXPECT_EQ(orient_alpha_grid(numbered(), -1, false, false).alpha, out.alpha);
}

TEST(OrientAlphaGridTest, MirrorsFlipTheirAxis) {
    EXPECT_EQ(orient_alpha_grid(numbered(), 0, true, false).alpha,
              (std::vector<uint8_t>{ 3, 2, 1, 6, 5, 4 }));
    EXPECT_EQ(orient_alpha_grid(numbered(), 0, false, true).alpha,
              (std::vector<uint8_t>{ 4, 5, 6, 1, 2, 3 }));
}

TEST(OrientAlphaGridTest, MirrorAppliesBeforeRotation) {
    // Mirror X gives 3 2 1 / 6 5 4, then a clockwise quarter turn.
    const AlphaGrid out = orient_alpha_grid(numbered(), 1, true, false);
    EXPECT_EQ(out.alpha, (std::vector<uint8_t>{ 6, 3, 5, 2, 4, 1 }));
}

TEST(OrientAlphaGridTest, InvalidGridComesBackEmpty) {
    AlphaGrid bad = make_grid(3, 3, 255);
    bad.alpha.pop_back();
    EXPECT_FALSE(orient_alpha_grid(bad, 1, false, false).valid());
}

TEST(SpriteFootprintTest, ReadsSizeTagCaseInsensitively) {
    const FootprintCells a = footprint_from_sprite_id("walls/stone_wall_2X1_a.png");
    EXPECT_EQ(a.w, 2);
    EXPECT_EQ(a.h, 1);

    const FootprintCells b = footprint_from_sprite_id("table_3x2_oak.png");
    EXPECT_EQ(b.w, 3);
    EXPECT_EQ(b.h, 2);
}

TEST(SpriteFootprintTest, UntaggedOrBrokenTagsDefaultToOneCell) {
    for (const char* id : { "barrel.png", "rug_2X_.png", "pillar_0X3_.png", "big_99999999999X1_.png" }) {
        const FootprintCells f = footprint_from_sprite_id(id);
        EXPECT_EQ(f.w, 1) << id;
        EXPECT_EQ(f.h, 1) << id;
    }
}
