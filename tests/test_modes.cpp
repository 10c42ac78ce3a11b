#include <gtest/gtest.h>

#include <set>

#include "modes.h"

static const Color RED{255, 0, 0};
static const Color BLUE{0, 0, 255};

// -----------------------------------------------------------------------
// Preset modes
// -----------------------------------------------------------------------

TEST(Modes, FixedRed) {
    FrameSequence seq = mode_fixed(RED);
    ASSERT_EQ(seq.size(), 1u);
    const FramePair& fp = seq[0];

    EXPECT_EQ(fp.frame1[0], 2);
    EXPECT_EQ(fp.frame1[1], 75);
    EXPECT_EQ(fp.frame1[2], 0);
    EXPECT_EQ(fp.frame1[3], 0);
    EXPECT_EQ(fp.frame1[4], 2);

    // 20 x GRB (0,255,0), first 57 bytes in frame 1
    for (int i = 0; i < 57; ++i)
        EXPECT_EQ(fp.frame1[5 + i], (i % 3 == 1) ? 255 : 0) << "i=" << i;
    for (int i = 62; i < 65; ++i)
        EXPECT_EQ(fp.frame1[i], 0);

    EXPECT_EQ(fp.frame2[0], 3);
    EXPECT_EQ(fp.frame2[1], 0);
    EXPECT_EQ(fp.frame2[2], 255);
    EXPECT_EQ(fp.frame2[3], 0);
    for (int i = 4; i < 65; ++i)
        EXPECT_EQ(fp.frame2[i], 0);
}

TEST(Modes, Off) {
    FrameSequence seq = mode_off();
    ASSERT_EQ(seq.size(), 1u);
    FramePair off = build_off_frames();
    EXPECT_EQ(seq[0].frame1, off.frame1);
    EXPECT_EQ(seq[0].frame2, off.frame2);
}

TEST(Modes, MarqueeSizeBounds) {
    EXPECT_THROW(mode_marquee(RED, Speed::Normal, Direction::Forward, 2), InvalidParameter);
    EXPECT_THROW(mode_marquee(RED, Speed::Normal, Direction::Forward, 7), InvalidParameter);
    EXPECT_NO_THROW(mode_marquee(RED, Speed::Normal, Direction::Forward, 3));
    EXPECT_NO_THROW(mode_marquee(RED, Speed::Normal, Direction::Forward, 6));
}

TEST(Modes, MarqueeHeader) {
    FrameSequence seq = mode_marquee(RED, Speed::Fast, Direction::Backward, 5);
    ASSERT_EQ(seq.size(), 1u);
    EXPECT_EQ(seq[0].frame1[2], 3);
    EXPECT_EQ(seq[0].frame1[3], 1 << 4);
    EXPECT_EQ(seq[0].frame1[4], (2 << 3) | 3);
}

TEST(Modes, AlternatingSendsTwoSteps) {
    FrameSequence seq = mode_alternating(RED, BLUE, Speed::Normal, Direction::Forward, 4, true);
    ASSERT_EQ(seq.size(), 2u);

    for (size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(seq[i].frame1[2], 5);
        EXPECT_EQ(seq[i].frame1[3], 1 << 3) << "option bit set";
        EXPECT_EQ(seq[i].frame1[4] >> 5, static_cast<int>(i)) << "index";
        EXPECT_EQ((seq[i].frame1[4] >> 3) & 0x03, 1) << "group size 4 - 3";
        EXPECT_EQ(seq[i].frame1[4] & 0x07, 2) << "speed";
    }
    // color1 then color2, GRB
    EXPECT_EQ(seq[0].frame1[5], 0);
    EXPECT_EQ(seq[0].frame1[6], 255);
    EXPECT_EQ(seq[1].frame1[7], 255);

    EXPECT_THROW(mode_alternating(RED, BLUE, Speed::Normal, Direction::Forward, 7), InvalidParameter);
}

TEST(Modes, MultiColorStepsUseIndex) {
    std::vector<Color> colors = {RED, BLUE, Color{0, 255, 0}};
    FrameSequence seq = mode_breathing(colors, Speed::Slow);
    ASSERT_EQ(seq.size(), 3u);
    for (size_t i = 0; i < seq.size(); ++i) {
        EXPECT_EQ(seq[i].frame1[2], 7);
        EXPECT_EQ(seq[i].frame1[4], static_cast<uint8_t>((i << 5) | 1));
        // whole strip carries step i's color
        auto grb = to_wire_order(colors[i]);
        EXPECT_EQ(seq[i].frame1[5], grb[0]);
        EXPECT_EQ(seq[i].frame1[6], grb[1]);
        EXPECT_EQ(seq[i].frame1[7], grb[2]);
        EXPECT_EQ(seq[i].frame2[1], grb[0]);
    }

    EXPECT_EQ(mode_fading(colors)[2].frame1[2], 1);
    EXPECT_EQ(mode_pulse(colors)[1].frame1[2], 6);

    FrameSequence cm = mode_covering_marquee(colors, Speed::Normal, Direction::Backward);
    ASSERT_EQ(cm.size(), 3u);
    EXPECT_EQ(cm[2].frame1[2], 4);
    EXPECT_EQ(cm[2].frame1[3], 1 << 4);
}

TEST(Modes, MultiColorEmptyListSendsNothing) {
    EXPECT_TRUE(mode_breathing({}).empty());
    EXPECT_TRUE(mode_fading({}).empty());
    EXPECT_TRUE(mode_covering_marquee({}).empty());
    EXPECT_TRUE(mode_pulse({}).empty());
    EXPECT_EQ(mode_pulse(std::vector<Color>(20, RED)).size(), 20u);
    EXPECT_THROW(mode_pulse(std::vector<Color>(21, RED)), InvalidParameter);
}

TEST(Modes, SpectrumWaveIgnoresColor) {
    FrameSequence seq = mode_spectrum_wave(Speed::Fastest, Direction::Backward);
    ASSERT_EQ(seq.size(), 1u);
    EXPECT_EQ(seq[0].frame1[2], 2);
    EXPECT_EQ(seq[0].frame1[3], 1 << 4);
    EXPECT_EQ(seq[0].frame1[4], 4);
}

TEST(Modes, WingsAndCandle) {
    EXPECT_EQ(mode_wings(RED, Speed::Fast)[0].frame1[2], 12);
    EXPECT_EQ(mode_wings(RED, Speed::Fast)[0].frame1[4], 3);
    EXPECT_EQ(mode_candle(RED)[0].frame1[2], 9);
}

TEST(Modes, CustomIsOneCallPerStrip) {
    std::vector<Color> colors = {RED, BLUE};
    FrameSequence seq = mode_custom(CustomMode::Wave, colors, Speed::Fast);
    ASSERT_EQ(seq.size(), 1u);
    EXPECT_EQ(seq[0].frame1[2], 13);
    EXPECT_EQ(seq[0].frame1[4], 3);
    EXPECT_EQ(seq[0].frame1[5], 0);
    EXPECT_EQ(seq[0].frame1[6], 255);
    EXPECT_EQ(seq[0].frame1[10], 255);
    EXPECT_EQ(seq[0].frame1[11], 0) << "LED 2 is off";

    EXPECT_THROW(mode_custom(CustomMode::Fixed, std::vector<Color>(21, RED)), TooManyColors);
}

// -----------------------------------------------------------------------
// Catalog / dispatch
// -----------------------------------------------------------------------

TEST(Catalog, NamesAreUniqueAndFindable) {
    std::set<std::string> names;
    for (auto& d : mode_catalog()) {
        EXPECT_TRUE(names.insert(d.name).second) << d.name;
        EXPECT_EQ(find_mode(d.name), &d);
        EXPECT_NE(std::string(d.help), "");
    }
    for (const char* n : {"off", "fixed", "breathing", "fading", "marquee", "covering_marquee",
                          "pulse", "spectrum_wave", "alternating", "wings", "candle",
                          "custom_fixed", "custom_breathing", "custom_wave"})
        EXPECT_NE(find_mode(n), nullptr) << n;
    EXPECT_EQ(find_mode("rainbow"), nullptr);
}

TEST(Catalog, UnknownMode) {
    EXPECT_THROW(run_mode("nope", {}), UnknownMode);
}

TEST(Catalog, RunModeMatchesDirectCall) {
    ModeOptions opts;
    opts.size   = 4;
    opts.moving = true;
    FrameSequence a = run_mode("alternating", {RED, BLUE}, opts);
    FrameSequence b = mode_alternating(RED, BLUE, Speed::Normal, Direction::Forward, 4, true);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].frame1, b[i].frame1);
        EXPECT_EQ(a[i].frame2, b[i].frame2);
    }
}

TEST(Catalog, ColorCountChecked) {
    EXPECT_THROW(run_mode("fixed", {}), InvalidParameter);
    EXPECT_THROW(run_mode("fixed", {RED, BLUE}), InvalidParameter);
    EXPECT_THROW(run_mode("alternating", {RED}), InvalidParameter);
    EXPECT_THROW(run_mode("off", {RED}), InvalidParameter);
    EXPECT_THROW(run_mode("spectrum_wave", {RED}), InvalidParameter);
    EXPECT_TRUE(run_mode("breathing", {}).empty());
    EXPECT_TRUE(run_mode("covering_marquee", {}).empty());
    EXPECT_NO_THROW(run_mode("custom_fixed", {}));
    EXPECT_THROW(run_mode("custom_fixed", std::vector<Color>(21, RED)), TooManyColors);
}

TEST(Catalog, DescriptorRunChecksColorsAndOptions) {
    EXPECT_THROW(find_mode("alternating")->run({}, {}), InvalidParameter);
    EXPECT_THROW(find_mode("alternating")->run({RED}, {}), InvalidParameter);
    EXPECT_THROW(find_mode("fixed")->run({}, {}), InvalidParameter);
    EXPECT_THROW(find_mode("marquee")->run({}, {}), InvalidParameter);
    EXPECT_THROW(find_mode("off")->run({RED}, {}), InvalidParameter);

    ModeOptions moving;
    moving.moving = true;
    EXPECT_THROW(find_mode("wings")->run({RED}, moving), InvalidParameter);

    for (auto& d : mode_catalog()) {
        if (d.colors == ColorArity::One || d.colors == ColorArity::Two)
            EXPECT_THROW(d.run({}, {}), InvalidParameter) << d.name;
        else
            EXPECT_NO_THROW(d.run({}, {})) << d.name;
    }

    EXPECT_EQ(find_mode("alternating")->run({RED, BLUE}, {}).size(), 2u);
}

TEST(Catalog, UndeclaredOptionRejected) {
    ModeOptions speed;
    speed.speed = Speed::Fast;
    EXPECT_THROW(run_mode("off", {}, speed), InvalidParameter);
    EXPECT_THROW(run_mode("candle", {RED}, speed), InvalidParameter);
    EXPECT_NO_THROW(run_mode("wings", {RED}, speed));

    ModeOptions moving;
    moving.moving = true;
    EXPECT_THROW(run_mode("marquee", {RED}, moving), InvalidParameter);
}

TEST(Catalog, SizeValidatedThroughDispatch) {
    ModeOptions opts;
    opts.size = 2;
    EXPECT_THROW(run_mode("marquee", {RED}, opts), InvalidParameter);
    opts.size = 6;
    EXPECT_EQ(run_mode("marquee", {RED}, opts)[0].frame1[4], (3 << 3) | 2);
}

TEST(Catalog, FlagsString) {
    EXPECT_EQ(mode_flags_string(*find_mode("off")), "");
    EXPECT_EQ(mode_flags_string(*find_mode("breathing")), "speed");
    EXPECT_EQ(mode_flags_string(*find_mode("alternating")), "speed, direction, size, moving");
}

TEST(Options, CommandLineOverridesFile) {
    ModeOptions file;
    file.speed     = Speed::Slowest;
    file.direction = Direction::Backward;
    file.size      = 5;
    ModeOptions cli;
    cli.speed = Speed::Fastest;

    ModeOptions opts = merge_options(file, cli, *find_mode("marquee"));
    EXPECT_EQ(opts.speed, Speed::Fastest);
    EXPECT_EQ(opts.direction, Direction::Backward);
    EXPECT_EQ(opts.size, 5);
    EXPECT_FALSE(opts.moving.has_value());

    FrameSequence seq = run_mode("marquee", {RED}, opts);
    EXPECT_EQ(seq[0].frame1[3], 1 << 4);
    EXPECT_EQ(seq[0].frame1[4], (2 << 3) | 4);
}

TEST(Options, FileOptionDroppedForModeWithoutIt) {
    ModeOptions file;
    file.speed  = Speed::Fast;
    file.moving = true;

    ModeOptions opts = merge_options(file, {}, *find_mode("fixed"));
    EXPECT_FALSE(opts.speed.has_value());
    EXPECT_FALSE(opts.moving.has_value());
    EXPECT_NO_THROW(run_mode("fixed", {RED}, opts));

    // wings takes speed but not moving
    opts = merge_options(file, {}, *find_mode("wings"));
    EXPECT_EQ(opts.speed, Speed::Fast);
    EXPECT_FALSE(opts.moving.has_value());

    // An explicit request is never dropped.
    ModeOptions cli;
    cli.speed = Speed::Fast;
    opts = merge_options({}, cli, *find_mode("fixed"));
    EXPECT_THROW(run_mode("fixed", {RED}, opts), InvalidParameter);
}

TEST(Options, ParseSize) {
    EXPECT_EQ(parse_size("3"), 3);
    EXPECT_EQ(parse_size("6"), 6);
    EXPECT_THROW(parse_size("4abc"), InvalidParameter);
    EXPECT_THROW(parse_size("2"), InvalidParameter);
    EXPECT_THROW(parse_size("7"), InvalidParameter);
    EXPECT_THROW(parse_size("4294967299"), InvalidParameter);
    EXPECT_THROW(parse_size("99999999999999999999999"), InvalidParameter);
    EXPECT_THROW(parse_size(""), InvalidParameter);
}

TEST(Options, ParseSpeedAndDirection) {
    EXPECT_EQ(parse_speed("fastest"), Speed::Fastest);
    EXPECT_EQ(parse_speed("SLOW"), Speed::Slow);
    EXPECT_EQ(parse_speed("0"), Speed::Slowest);
    EXPECT_EQ(parse_speed("4"), Speed::Fastest);
    EXPECT_THROW(parse_speed("5"), InvalidParameter);
    EXPECT_THROW(parse_speed("quick"), InvalidParameter);

    EXPECT_EQ(parse_direction("backward"), Direction::Backward);
    EXPECT_EQ(parse_direction("0"), Direction::Forward);
    EXPECT_THROW(parse_direction("sideways"), InvalidParameter);
}
