#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "color.h"
#include "protocol.h"

// -----------------------------------------------------------------------
// Mode library
//
// Every mode returns the complete, already validated list of frame pairs
// to send, in order. Nothing is written to the device until the whole
// list has been built, so a bad parameter never produces partial output.
//
// Multi-color presets (breathing, fading, covering_marquee, pulse) send
// one pair per color with index = position: each pair fills one step of
// the device's animation table, not one LED.
// -----------------------------------------------------------------------

static constexpr int NZXT_MIN_GROUP_SIZE = 3;
static constexpr int NZXT_MAX_GROUP_SIZE = 6;

// Color sent for modes whose colors are generated by the firmware.
static constexpr Color NZXT_DEFAULT_COLOR = {0, 0, 255};

using FrameSequence = std::vector<FramePair>;

FrameSequence mode_off();
FrameSequence mode_fixed(const Color& color);
FrameSequence mode_breathing(const std::vector<Color>& colors, Speed speed = Speed::Normal);
FrameSequence mode_fading(const std::vector<Color>& colors, Speed speed = Speed::Normal);
FrameSequence mode_marquee(const Color& color,
                           Speed     speed     = Speed::Normal,
                           Direction direction = Direction::Forward,
                           int       size      = NZXT_MIN_GROUP_SIZE);
FrameSequence mode_covering_marquee(const std::vector<Color>& colors,
                                    Speed     speed     = Speed::Normal,
                                    Direction direction = Direction::Forward);
FrameSequence mode_pulse(const std::vector<Color>& colors, Speed speed = Speed::Normal);
FrameSequence mode_spectrum_wave(Speed     speed     = Speed::Normal,
                                 Direction direction = Direction::Forward);
FrameSequence mode_alternating(const Color& color1,
                               const Color& color2,
                               Speed     speed     = Speed::Normal,
                               Direction direction = Direction::Forward,
                               int       size      = NZXT_MIN_GROUP_SIZE,
                               bool      moving    = false);
FrameSequence mode_wings(const Color& color, Speed speed = Speed::Normal);
FrameSequence mode_candle(const Color& color);

// Per-LED modes: colors[i] lands on LED i, all in a single pair.
// Throws TooManyColors for more than NZXT_LED_COUNT colors.
FrameSequence mode_custom(CustomMode mode,
                          const std::vector<Color>& colors,
                          Speed     speed     = Speed::Normal,
                          Direction direction = Direction::Forward);

// -----------------------------------------------------------------------
// Catalog / dispatch
// -----------------------------------------------------------------------

// Options a caller may set for a named mode. Unset fields take the mode's
// default; a set field the mode does not accept is an error.
struct ModeOptions {
    std::optional<Speed>     speed;
    std::optional<Direction> direction;
    std::optional<int>       size;
    std::optional<bool>      moving;
};

// Bit flags for the options a mode accepts
enum ModeFlag : uint8_t {
    FLAG_SPEED     = 0x01,
    FLAG_DIRECTION = 0x02,
    FLAG_SIZE      = 0x04,
    FLAG_MOVING    = 0x08,
};

// How many colors a mode takes
enum class ColorArity : uint8_t {
    None,    // no colors at all
    One,     // exactly one
    Two,     // exactly two
    Steps,   // 0..NZXT_LED_COUNT animation steps
    PerLed,  // 0..NZXT_LED_COUNT, one per LED
};

using ModeHandler = FrameSequence (*)(const std::vector<Color>& colors,
                                      const ModeOptions& opts);

class ModeDescriptor {
public:
    ModeDescriptor(const char* name, const char* help, ColorArity colors, uint8_t flags,
                   ModeHandler handler)
        : name(name), help(help), colors(colors), flags(flags), _handler(handler) {}

    // Check colors and options against this descriptor, then build the frames.
    // Throws InvalidParameter, InvalidColor or TooManyColors.
    FrameSequence run(const std::vector<Color>& mode_colors, const ModeOptions& opts) const;

    const char* name;
    const char* help;
    ColorArity  colors;
    uint8_t     flags;

private:
    ModeHandler _handler;
};

// All modes, in help order. Built once, never modified.
const std::vector<ModeDescriptor>& mode_catalog();

// Returns nullptr if no mode has this name.
const ModeDescriptor* find_mode(const std::string& name);

// Look up `name` and run its descriptor.
// Throws UnknownMode, InvalidParameter, InvalidColor or TooManyColors.
FrameSequence run_mode(const std::string& name,
                       const std::vector<Color>& colors,
                       const ModeOptions& opts = {});

// Config-file options are defaults: only those `desc` accepts are kept,
// and every option set in `cli` replaces the file value.
ModeOptions merge_options(const ModeOptions& file,
                          const ModeOptions& cli,
                          const ModeDescriptor& desc);

// Accepted flags as a comma separated list, e.g. "speed, direction".
std::string mode_flags_string(const ModeDescriptor& desc);

// Parse a speed name ("slowest".."fastest") or number 0-4.
// Throws InvalidParameter.
Speed parse_speed(const std::string& s);

// Parse "forward" / "backward" (or 0 / 1). Throws InvalidParameter.
Direction parse_direction(const std::string& s);

// Parse a decimal row length in NZXT_MIN_GROUP_SIZE..NZXT_MAX_GROUP_SIZE.
// Throws InvalidParameter on trailing characters or out-of-range values.
int parse_size(const std::string& s);

// ASCII lower-case copy.
std::string to_lower(std::string s);
