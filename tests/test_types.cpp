#include <gtest/gtest.h>
#include <mui/types.hpp>
#include <mui/version.hpp>
#include <cstdio>

using namespace mui;

// --- Size type aliases ---

TEST(TypeAliases, SizeTypes) {
    static_assert(sizeof(i16) == 2, "i16 must be 2 bytes");
    static_assert(sizeof(i32) == 4, "i32 must be 4 bytes");
    static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
    static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");
    static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
    static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
    static_assert(sizeof(f32) == 4, "f32 must be 4 bytes");
    static_assert(sizeof(f64) == 8, "f64 must be 8 bytes");
}

// --- Point ---

TEST(Point, DefaultConstruction) {
    Point p;
    EXPECT_FLOAT_EQ(p.x, 0.0f);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
}

TEST(Point, ValueConstruction) {
    Point p{3.5f, -7.25f};
    EXPECT_FLOAT_EQ(p.x, 3.5f);
    EXPECT_FLOAT_EQ(p.y, -7.25f);
}

// --- Size ---

TEST(Size, DefaultIsEmpty) {
    Size s;
    EXPECT_EQ(s.w, 0);
    EXPECT_EQ(s.h, 0);
}

TEST(Size, Equality) {
    EXPECT_EQ((Size{800, 480}), (Size{800, 480}));
    EXPECT_NE((Size{800, 480}), (Size{480, 800}));
}

// --- Rect ---

TEST(Rect, ValueConstruction) {
    Rect r{-1920, 0, 1920, 1080};
    EXPECT_EQ(r.x, -1920);
    EXPECT_EQ(r.y, 0);
    EXPECT_EQ(r.w, 1920);
    EXPECT_EQ(r.h, 1080);
}

// --- Color ---

TEST(Color, DefaultIsOpaqueBlack) {
    Color c;
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.g, 0);
    EXPECT_EQ(c.b, 0);
    EXPECT_EQ(c.a, 255);
}

TEST(Color, ThreeComponentInitKeepsOpaqueAlpha) {
    Color c{10, 20, 30};
    EXPECT_EQ(c.r, 10);
    EXPECT_EQ(c.b, 30);
    EXPECT_EQ(c.a, 255);
}

// --- Version ---

TEST(Version, StringMatchesMacros) {
    char expected[32];
    std::snprintf(expected, sizeof(expected), "%d.%d.%d",
                  MUI_VERSION_MAJOR, MUI_VERSION_MINOR, MUI_VERSION_PATCH);
    EXPECT_STREQ(version(), expected);
    EXPECT_EQ(versionMajor(), MUI_VERSION_MAJOR);
}
