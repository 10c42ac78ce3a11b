#include <gtest/gtest.h>

#include "color.h"

TEST(Color, ChannelRange) {
    EXPECT_TRUE(valid_channel(0));
    EXPECT_TRUE(valid_channel(255));
    EXPECT_FALSE(valid_channel(-1));
    EXPECT_FALSE(valid_channel(256));
}

TEST(Color, MakeColorRejectsOutOfRange) {
    EXPECT_THROW(make_color(256, 0, 0), InvalidColor);
    EXPECT_THROW(make_color(0, -1, 0), InvalidColor);
    EXPECT_THROW(make_color(0, 0, 1000), InvalidColor);

    Color c = make_color(1, 2, 3);
    EXPECT_EQ(c.r, 1);
    EXPECT_EQ(c.g, 2);
    EXPECT_EQ(c.b, 3);
}

TEST(Color, WireOrderIsGrb) {
    auto grb = to_wire_order(Color{10, 20, 30});
    EXPECT_EQ(grb[0], 20);
    EXPECT_EQ(grb[1], 10);
    EXPECT_EQ(grb[2], 30);
}

TEST(Color, FlattenSingleColorForAllChannelValues) {
    for (int v = 0; v <= 255; v += 15) {
        Color c = make_color(v, 255 - v, v / 2);
        std::vector<uint8_t> expected = {c.g, c.r, c.b};
        EXPECT_EQ(flatten({c}), expected) << "v=" << v;
    }
}

TEST(Color, FlattenKeepsSequenceOrder) {
    std::vector<Color> colors = {{255, 0, 0}, {0, 255, 0}, {0, 0, 255}};
    std::vector<uint8_t> expected = {0, 255, 0, 255, 0, 0, 0, 0, 255};
    EXPECT_EQ(flatten(colors), expected);
    EXPECT_TRUE(flatten({}).empty());
}

TEST(Color, ParseDecimalAndHex) {
    EXPECT_EQ(parse_color("255,0,0"), (Color{255, 0, 0}));
    EXPECT_EQ(parse_color(" 1, 2 ,3 "), (Color{1, 2, 3}));
    EXPECT_EQ(parse_color("#ff0000"), parse_color("255,0,0"));
    EXPECT_EQ(parse_color("00FF80"), (Color{0, 255, 128}));
}

TEST(Color, ParseRejectsMalformed) {
    EXPECT_THROW(parse_color("256,0,0"), InvalidColor);
    EXPECT_THROW(parse_color("1,2"), InvalidColor);
    EXPECT_THROW(parse_color("-1,0,0"), InvalidColor);
    EXPECT_THROW(parse_color("#ff00"), InvalidColor);
    EXPECT_THROW(parse_color("red"), InvalidColor);
    EXPECT_THROW(parse_color(""), InvalidColor);
}

TEST(Color, ToString) {
    Color c{255, 8, 0};
    EXPECT_EQ(color_to_string(c), "255,8,0");
}
