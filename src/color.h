#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.h"

// An RGB color as the user supplies it. The device wants GRB on the
// wire; see to_wire_order().
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

// True if the value fits in one 8-bit channel.
bool valid_channel(int value);

// Build a color from wider integers.
// Throws InvalidColor if any channel is outside 0-255.
Color make_color(int r, int g, int b);

// Reorder (R,G,B) to the (G,R,B) order the controller expects.
std::array<uint8_t, 3> to_wire_order(const Color& c);

// Map every color through to_wire_order() and concatenate the bytes.
// Result length is always 3 * colors.size().
std::vector<uint8_t> flatten(const std::vector<Color>& colors);

// Parse a color from text.
// Accepts:
//   - "R,G,B"   decimal channels, e.g. "255,0,0"
//   - "#RRGGBB" or "RRGGBB" hex, e.g. "#ff0000"
// Throws InvalidColor on malformed text or out-of-range channels.
Color parse_color(const std::string& text);

// Format as "R,G,B" (used in verbose / dry-run output).
std::string color_to_string(const Color& c);
