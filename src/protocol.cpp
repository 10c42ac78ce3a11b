#include "protocol.h"

#include <algorithm>
#include <iomanip>
#include <iostream>

// -----------------------------------------------------------------------
// Mode tables
//
// Preset and custom modes share the same wire byte space but are not
// interchangeable (e.g. 2 is only valid as a preset, 13 only as a custom
// mode), so each enumeration gets its own lookup.
// -----------------------------------------------------------------------

static const struct { PresetMode mode; uint8_t wire; } preset_table[] = {
    {PresetMode::Fixed,            0},
    {PresetMode::Fading,           1},
    {PresetMode::SpectrumWave,     2},
    {PresetMode::Marquee,          3},
    {PresetMode::CoveringMarquee,  4},
    {PresetMode::Alternating,      5},
    {PresetMode::Pulse,            6},
    {PresetMode::Breathing,        7},
    {PresetMode::Candle,           9},
    {PresetMode::Wings,           12},
};

static const struct { CustomMode mode; uint8_t wire; } custom_table[] = {
    {CustomMode::Fixed,            0},
    {CustomMode::Fading,           1},
    {CustomMode::Marquee,          3},
    {CustomMode::CoveringMarquee,  4},
    {CustomMode::Pulse,            6},
    {CustomMode::Breathing,        7},
    {CustomMode::Wings,           12},
    {CustomMode::Wave,            13},
};

uint8_t wire_mode(PresetMode mode) {
    for (auto& e : preset_table)
        if (e.mode == mode) return e.wire;
    throw InvalidParameter("unmapped preset mode " +
                           std::to_string(static_cast<int>(mode)));
}

uint8_t wire_mode(CustomMode mode) {
    for (auto& e : custom_table)
        if (e.mode == mode) return e.wire;
    throw InvalidParameter("unmapped custom mode " +
                           std::to_string(static_cast<int>(mode)));
}

// -----------------------------------------------------------------------
// Frame builders
// -----------------------------------------------------------------------

FramePair build_frames(uint8_t mode,
                       const std::vector<Color>& colors,
                       uint8_t index,
                       uint8_t speed,
                       uint8_t direction,
                       bool    option,
                       uint8_t group_size) {
    if (colors.size() > static_cast<size_t>(NZXT_LED_COUNT))
        throw TooManyColors(
            "too many colors (" + std::to_string(colors.size()) + "), there are only " +
            std::to_string(NZXT_LED_COUNT) + " leds");

    // Frame{} value-initializes, so everything not written below is padding.
    FramePair fp;
    Frame& f1 = fp.frame1;
    Frame& f2 = fp.frame2;

    f1[0] = NZXT_REPORT_ID_1;
    f1[1] = NZXT_CMD_SET_LED;
    f1[2] = mode;
    f1[3] = static_cast<uint8_t>((direction << 4) | ((option ? 1 : 0) << 3));
    f1[4] = static_cast<uint8_t>((index << 5) | (group_size << 3) | speed);

    f2[0] = NZXT_REPORT_ID_2;

    // Split the GRB stream at byte 57; frame 1 bytes 62..64 stay unused.
    std::vector<uint8_t> flat = flatten(colors);
    size_t n1 = std::min(flat.size(), static_cast<size_t>(NZXT_FRAME1_COLOR_BYTES));
    std::copy(flat.begin(), flat.begin() + n1, f1.begin() + NZXT_FRAME1_HEADER);
    std::copy(flat.begin() + n1, flat.end(), f2.begin() + NZXT_FRAME2_HEADER);

    return fp;
}

FramePair build_uniform_frames(uint8_t mode,
                               const Color& color,
                               uint8_t index,
                               uint8_t speed,
                               uint8_t direction,
                               bool    option,
                               uint8_t group_size) {
    std::vector<Color> colors(NZXT_LED_COUNT, color);
    return build_frames(mode, colors, index, speed, direction, option, group_size);
}

FramePair build_off_frames() {
    FramePair fp;
    fp.frame1[0] = NZXT_REPORT_ID_1;
    fp.frame1[1] = NZXT_CMD_SET_LED;
    fp.frame2[0] = NZXT_REPORT_ID_2;
    return fp;
}

// -----------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------

void hexdump_frame(const Frame& f, const std::string& label) {
    if (!label.empty())
        std::cout << label << "\n";

    // 65 bytes do not fit on one line; wrap after 16 like `xxd`.
    std::cout << std::hex << std::setfill('0');
    for (int i = 0; i < NZXT_FRAME_SIZE; ++i) {
        std::cout << std::setw(2) << static_cast<int>(f[i]);
        if (i == NZXT_FRAME_SIZE - 1)
            break;
        std::cout << (((i + 1) % 16 == 0) ? "\n        " : " ");
    }
    std::cout << std::dec << "\n";
}
