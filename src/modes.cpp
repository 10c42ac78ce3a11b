#include "modes.h"

#include <cctype>
#include <stdexcept>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static uint8_t u8(Speed s)     { return static_cast<uint8_t>(s); }
static uint8_t u8(Direction d) { return static_cast<uint8_t>(d); }

// Row width for marquee / alternating, encoded as size - 3.
static uint8_t encode_group_size(int size) {
    if (size < NZXT_MIN_GROUP_SIZE || size > NZXT_MAX_GROUP_SIZE)
        throw InvalidParameter("size has to be between " +
                               std::to_string(NZXT_MIN_GROUP_SIZE) + " and " +
                               std::to_string(NZXT_MAX_GROUP_SIZE) +
                               " (got " + std::to_string(size) + ")");
    return static_cast<uint8_t>(size - NZXT_MIN_GROUP_SIZE);
}

// An empty list is allowed and sends nothing.
static void check_steps(const char* mode, const std::vector<Color>& colors) {
    if (colors.size() > static_cast<size_t>(NZXT_LED_COUNT))
        throw InvalidParameter(std::string(mode) + " takes at most " +
                               std::to_string(NZXT_LED_COUNT) + " colors (got " +
                               std::to_string(colors.size()) + ")");
}

// One uniform pair per color; index selects the animation step.
static FrameSequence build_steps(PresetMode mode,
                                 const std::vector<Color>& colors,
                                 Speed speed,
                                 Direction direction = Direction::Forward) {
    FrameSequence result;
    result.reserve(colors.size());
    for (size_t i = 0; i < colors.size(); ++i)
        result.push_back(build_uniform_frames(wire_mode(mode), colors[i],
                                              static_cast<uint8_t>(i),
                                              u8(speed), u8(direction)));
    return result;
}

// -----------------------------------------------------------------------
// Modes
// -----------------------------------------------------------------------

FrameSequence mode_off() {
    return {build_off_frames()};
}

FrameSequence mode_fixed(const Color& color) {
    return {build_uniform_frames(wire_mode(PresetMode::Fixed), color, 0, u8(Speed::Normal))};
}

FrameSequence mode_breathing(const std::vector<Color>& colors, Speed speed) {
    check_steps("breathing", colors);
    return build_steps(PresetMode::Breathing, colors, speed);
}

FrameSequence mode_fading(const std::vector<Color>& colors, Speed speed) {
    check_steps("fading", colors);
    return build_steps(PresetMode::Fading, colors, speed);
}

FrameSequence mode_marquee(const Color& color, Speed speed, Direction direction, int size) {
    uint8_t group = encode_group_size(size);
    return {build_uniform_frames(wire_mode(PresetMode::Marquee), color, 0,
                                 u8(speed), u8(direction), false, group)};
}

FrameSequence mode_covering_marquee(const std::vector<Color>& colors,
                                    Speed speed, Direction direction) {
    check_steps("covering_marquee", colors);
    return build_steps(PresetMode::CoveringMarquee, colors, speed, direction);
}

FrameSequence mode_pulse(const std::vector<Color>& colors, Speed speed) {
    check_steps("pulse", colors);
    return build_steps(PresetMode::Pulse, colors, speed);
}

FrameSequence mode_spectrum_wave(Speed speed, Direction direction) {
    // The rainbow is generated by the firmware; the color is ignored.
    return {build_uniform_frames(wire_mode(PresetMode::SpectrumWave), NZXT_DEFAULT_COLOR, 0,
                                 u8(speed), u8(direction))};
}

FrameSequence mode_alternating(const Color& color1, const Color& color2,
                               Speed speed, Direction direction, int size, bool moving) {
    uint8_t group = encode_group_size(size);
    uint8_t mode  = wire_mode(PresetMode::Alternating);
    return {
        build_uniform_frames(mode, color1, 0, u8(speed), u8(direction), moving, group),
        build_uniform_frames(mode, color2, 1, u8(speed), u8(direction), moving, group),
    };
}

FrameSequence mode_wings(const Color& color, Speed speed) {
    return {build_uniform_frames(wire_mode(PresetMode::Wings), color, 0, u8(speed))};
}

FrameSequence mode_candle(const Color& color) {
    return {build_uniform_frames(wire_mode(PresetMode::Candle), color, 0, u8(Speed::Normal))};
}

FrameSequence mode_custom(CustomMode mode, const std::vector<Color>& colors,
                          Speed speed, Direction direction) {
    return {build_frames(wire_mode(mode), colors, 0, u8(speed), u8(direction))};
}

// -----------------------------------------------------------------------
// Catalog
// -----------------------------------------------------------------------

static Speed     speed_of(const ModeOptions& o)     { return o.speed.value_or(Speed::Normal); }
static Direction direction_of(const ModeOptions& o) { return o.direction.value_or(Direction::Forward); }
static int       size_of(const ModeOptions& o)      { return o.size.value_or(NZXT_MIN_GROUP_SIZE); }

using Colors = std::vector<Color>;

static const std::vector<ModeDescriptor> catalog = {
    {"off", "turn off all leds",
     ColorArity::None, 0,
     [](const Colors&, const ModeOptions&) { return mode_off(); }},

    {"fixed", "fixed color for all leds",
     ColorArity::One, 0,
     [](const Colors& c, const ModeOptions&) { return mode_fixed(c[0]); }},

    {"breathing", "fade brightness in, out and then change color",
     ColorArity::Steps, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) { return mode_breathing(c, speed_of(o)); }},

    {"fading", "fade between given colors",
     ColorArity::Steps, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) { return mode_fading(c, speed_of(o)); }},

    {"marquee", "moving row of leds",
     ColorArity::One, FLAG_SPEED | FLAG_DIRECTION | FLAG_SIZE,
     [](const Colors& c, const ModeOptions& o) {
         return mode_marquee(c[0], speed_of(o), direction_of(o), size_of(o));
     }},

    {"covering_marquee", "marquee consisting of multiple colors",
     ColorArity::Steps, FLAG_SPEED | FLAG_DIRECTION,
     [](const Colors& c, const ModeOptions& o) {
         return mode_covering_marquee(c, speed_of(o), direction_of(o));
     }},

    {"pulse", "fade color out and then show next color with full brightness",
     ColorArity::Steps, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) { return mode_pulse(c, speed_of(o)); }},

    {"spectrum_wave", "(hard coded) rgb marquee",
     ColorArity::None, FLAG_SPEED | FLAG_DIRECTION,
     [](const Colors&, const ModeOptions& o) {
         return mode_spectrum_wave(speed_of(o), direction_of(o));
     }},

    {"alternating", "alternate led rows between two colors",
     ColorArity::Two, FLAG_SPEED | FLAG_DIRECTION | FLAG_SIZE | FLAG_MOVING,
     [](const Colors& c, const ModeOptions& o) {
         return mode_alternating(c[0], c[1], speed_of(o), direction_of(o), size_of(o),
                                 o.moving.value_or(false));
     }},

    {"wings", "symmetric marquee (looks like flapping wings)",
     ColorArity::One, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) { return mode_wings(c[0], speed_of(o)); }},

    {"candle", "flickering candle",
     ColorArity::One, 0,
     [](const Colors& c, const ModeOptions&) { return mode_candle(c[0]); }},

    {"custom_fixed", "set each led to a fixed color",
     ColorArity::PerLed, 0,
     [](const Colors& c, const ModeOptions&) { return mode_custom(CustomMode::Fixed, c); }},

    {"custom_fading", "fading with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::Fading, c, speed_of(o));
     }},

    {"custom_marquee", "marquee with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED | FLAG_DIRECTION,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::Marquee, c, speed_of(o), direction_of(o));
     }},

    {"custom_covering_marquee", "covering marquee with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED | FLAG_DIRECTION,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::CoveringMarquee, c, speed_of(o), direction_of(o));
     }},

    {"custom_pulse", "pulse with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::Pulse, c, speed_of(o));
     }},

    {"custom_breathing", "breathing but with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::Breathing, c, speed_of(o));
     }},

    {"custom_wings", "wings with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::Wings, c, speed_of(o));
     }},

    {"custom_wave", "wave with a different color for each led",
     ColorArity::PerLed, FLAG_SPEED,
     [](const Colors& c, const ModeOptions& o) {
         return mode_custom(CustomMode::Wave, c, speed_of(o));
     }},
};

const std::vector<ModeDescriptor>& mode_catalog() {
    return catalog;
}

const ModeDescriptor* find_mode(const std::string& name) {
    for (auto& d : catalog)
        if (name == d.name) return &d;
    return nullptr;
}

// -----------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------

static void check_arity(const ModeDescriptor& d, const std::vector<Color>& colors) {
    const std::string name = d.name;
    const size_t n = colors.size();
    switch (d.colors) {
    case ColorArity::None:
        if (n != 0)
            throw InvalidParameter(name + " takes no colors");
        break;
    case ColorArity::One:
        if (n != 1)
            throw InvalidParameter(name + " needs exactly one color (got " +
                                   std::to_string(n) + ")");
        break;
    case ColorArity::Two:
        if (n != 2)
            throw InvalidParameter(name + " needs exactly two colors (got " +
                                   std::to_string(n) + ")");
        break;
    case ColorArity::Steps:
        check_steps(d.name, colors);
        break;
    case ColorArity::PerLed:
        // Over-long lists are rejected by build_frames() as TooManyColors.
        break;
    }
}

static void check_options(const ModeDescriptor& d, const ModeOptions& opts) {
    static const struct { uint8_t flag; const char* option; } options[] = {
        {FLAG_SPEED,     "speed"},
        {FLAG_DIRECTION, "direction"},
        {FLAG_SIZE,      "size"},
        {FLAG_MOVING,    "moving"},
    };
    const bool given[] = {
        opts.speed.has_value(),
        opts.direction.has_value(),
        opts.size.has_value(),
        opts.moving.has_value(),
    };
    for (int i = 0; i < 4; ++i) {
        if (given[i] && !(d.flags & options[i].flag))
            throw InvalidParameter(std::string("mode ") + d.name + " does not accept " +
                                   options[i].option);
    }
}

FrameSequence ModeDescriptor::run(const std::vector<Color>& mode_colors,
                                  const ModeOptions& opts) const {
    check_arity(*this, mode_colors);
    check_options(*this, opts);
    return _handler(mode_colors, opts);
}

FrameSequence run_mode(const std::string& name,
                       const std::vector<Color>& colors,
                       const ModeOptions& opts) {
    const ModeDescriptor* d = find_mode(name);
    if (!d)
        throw UnknownMode("invalid mode '" + name + "'");
    return d->run(colors, opts);
}

ModeOptions merge_options(const ModeOptions& file,
                          const ModeOptions& cli,
                          const ModeDescriptor& desc) {
    ModeOptions out;
    if (desc.flags & FLAG_SPEED)     out.speed     = file.speed;
    if (desc.flags & FLAG_DIRECTION) out.direction = file.direction;
    if (desc.flags & FLAG_SIZE)      out.size      = file.size;
    if (desc.flags & FLAG_MOVING)    out.moving    = file.moving;

    if (cli.speed)     out.speed     = cli.speed;
    if (cli.direction) out.direction = cli.direction;
    if (cli.size)      out.size      = cli.size;
    if (cli.moving)    out.moving    = cli.moving;
    return out;
}

std::string mode_flags_string(const ModeDescriptor& desc) {
    std::string out;
    auto add = [&](uint8_t flag, const char* name) {
        if (!(desc.flags & flag)) return;
        if (!out.empty()) out += ", ";
        out += name;
    };
    add(FLAG_SPEED,     "speed");
    add(FLAG_DIRECTION, "direction");
    add(FLAG_SIZE,      "size");
    add(FLAG_MOVING,    "moving");
    return out;
}

// -----------------------------------------------------------------------
// Option parsing
// -----------------------------------------------------------------------

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

Speed parse_speed(const std::string& s) {
    static const struct { const char* name; Speed speed; } names[] = {
        {"slowest", Speed::Slowest},
        {"slow",    Speed::Slow},
        {"normal",  Speed::Normal},
        {"fast",    Speed::Fast},
        {"fastest", Speed::Fastest},
    };
    std::string sl = to_lower(s);
    for (auto& e : names)
        if (sl == e.name) return e.speed;
    if (sl.size() == 1 && sl[0] >= '0' && sl[0] <= '4')
        return static_cast<Speed>(sl[0] - '0');
    throw InvalidParameter("invalid speed '" + s + "' (expected 0-4 or slowest..fastest)");
}

Direction parse_direction(const std::string& s) {
    std::string sl = to_lower(s);
    if (sl == "forward" || sl == "0")  return Direction::Forward;
    if (sl == "backward" || sl == "1") return Direction::Backward;
    throw InvalidParameter("invalid direction '" + s + "' (expected forward or backward)");
}

int parse_size(const std::string& s) {
    const std::string expected = " (expected " + std::to_string(NZXT_MIN_GROUP_SIZE) + "-" +
                                 std::to_string(NZXT_MAX_GROUP_SIZE) + ")";
    size_t used = 0;
    long v = 0;
    try {
        v = std::stol(s, &used, 10);
    } catch (const std::logic_error&) {
        throw InvalidParameter("invalid size '" + s + "'" + expected);
    }
    if (used != s.size() || v < NZXT_MIN_GROUP_SIZE || v > NZXT_MAX_GROUP_SIZE)
        throw InvalidParameter("invalid size '" + s + "'" + expected);
    return static_cast<int>(v);
}
