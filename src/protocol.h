#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "color.h"

// -----------------------------------------------------------------------
// NZXT Smart Device (H500i) LED frame layout
//
// Every LED command is a pair of 65-byte frames written back to back.
//
//  Frame 1
//  Byte   | Role
//  -------|-----------------------------------------------------------
//   0     | Report id 0x02
//   1     | Command 0x4B (set LEDs)
//   2     | Mode byte (see PresetMode / CustomMode)
//   3     | (direction << 4) | (option << 3)
//   4     | (index << 5) | (group_size << 3) | speed
//   5-61  | First 57 color bytes, GRB order
//   62-64 | Always zero (the firmware never reads color data here)
//
//  Frame 2
//   0     | Report id 0x03
//   1-64  | Remaining color bytes (at most 3), then zero padding
// -----------------------------------------------------------------------

static constexpr int NZXT_FRAME_SIZE = 65;
static constexpr int NZXT_LED_COUNT  = 20;

static constexpr uint8_t NZXT_REPORT_ID_1 = 0x02;
static constexpr uint8_t NZXT_REPORT_ID_2 = 0x03;
static constexpr uint8_t NZXT_CMD_SET_LED = 0x4B;

// Header sizes and how many flattened color bytes frame 1 carries.
static constexpr int NZXT_FRAME1_HEADER   = 5;
static constexpr int NZXT_FRAME2_HEADER   = 1;
static constexpr int NZXT_FRAME1_COLOR_BYTES = 57;

// Modes that take one color broadcast to every LED.
// Alert (8), rpm (11), wave (13) and audio (14) are not driven as presets.
enum class PresetMode : uint8_t {
    Fixed           = 0,
    Fading          = 1,
    SpectrumWave    = 2,
    Marquee         = 3,
    CoveringMarquee = 4,
    Alternating     = 5,
    Pulse           = 6,
    Breathing       = 7,
    Candle          = 9,
    Wings           = 12,
};

// Modes where each LED carries its own color.
enum class CustomMode : uint8_t {
    Fixed           = 0,
    Fading          = 1,
    Marquee         = 3,
    CoveringMarquee = 4,
    Pulse           = 6,
    Breathing       = 7,
    Wings           = 12,
    Wave            = 13,
};

// Animation speed (low 3 bits of header byte 4)
enum class Speed : uint8_t {
    Slowest = 0,
    Slow    = 1,
    Normal  = 2,
    Fast    = 3,
    Fastest = 4,
};

enum class Direction : uint8_t {
    Forward  = 0,
    Backward = 1,
};

// A raw 65-byte frame
using Frame = std::array<uint8_t, NZXT_FRAME_SIZE>;

// The two frames of one LED command, always sent frame1 then frame2.
struct FramePair {
    Frame frame1{};
    Frame frame2{};
};

// Wire mode byte for each mode enumeration.
uint8_t wire_mode(PresetMode mode);
uint8_t wire_mode(CustomMode mode);

// -----------------------------------------------------------------------
// Frame builders
// -----------------------------------------------------------------------

// Low-level LED command.
//
// colors: one entry per LED, at most NZXT_LED_COUNT. Missing LEDs are off.
// index, group_size and speed are packed as-is; values too wide for their
// bit fields are truncated by the shift, matching the firmware protocol.
//
// Throws TooManyColors if colors.size() > NZXT_LED_COUNT.
FramePair build_frames(uint8_t mode,
                       const std::vector<Color>& colors,
                       uint8_t index      = 0,
                       uint8_t speed      = 0,
                       uint8_t direction  = 0,
                       bool    option     = false,
                       uint8_t group_size = 0);

// Same as build_frames() with `color` repeated on all NZXT_LED_COUNT LEDs.
FramePair build_uniform_frames(uint8_t mode,
                               const Color& color,
                               uint8_t index      = 0,
                               uint8_t speed      = 0,
                               uint8_t direction  = 0,
                               bool    option     = false,
                               uint8_t group_size = 0);

// "Lights off": both frames zero except the report id / command bytes.
FramePair build_off_frames();

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

// Pretty-print a frame as a hex dump to stdout
void hexdump_frame(const Frame& f, const std::string& label = "");
