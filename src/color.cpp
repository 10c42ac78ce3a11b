#include "color.h"

#include <regex>

bool valid_channel(int value) {
    return value >= 0 && value <= 255;
}

Color make_color(int r, int g, int b) {
    static const char* names[3] = {"red", "green", "blue"};
    const int channels[3] = {r, g, b};
    for (int i = 0; i < 3; ++i) {
        if (!valid_channel(channels[i]))
            throw InvalidColor(
                std::string(names[i]) + " channel " + std::to_string(channels[i]) +
                " is out of range (0-255)");
    }
    return Color{static_cast<uint8_t>(r), static_cast<uint8_t>(g), static_cast<uint8_t>(b)};
}

std::array<uint8_t, 3> to_wire_order(const Color& c) {
    return {c.g, c.r, c.b};
}

std::vector<uint8_t> flatten(const std::vector<Color>& colors) {
    std::vector<uint8_t> out;
    out.reserve(colors.size() * 3);
    for (const auto& c : colors) {
        auto grb = to_wire_order(c);
        out.insert(out.end(), grb.begin(), grb.end());
    }
    return out;
}

// -----------------------------------------------------------------------
// Text parsing
// -----------------------------------------------------------------------

Color parse_color(const std::string& text) {
    static const std::regex re_triple(R"(^\s*(\d{1,9})\s*,\s*(\d{1,9})\s*,\s*(\d{1,9})\s*$)");
    static const std::regex re_hex(R"(^\s*#?([0-9a-fA-F]{6})\s*$)");

    std::smatch m;
    if (std::regex_match(text, m, re_triple)) {
        return make_color(std::stoi(m[1].str()),
                          std::stoi(m[2].str()),
                          std::stoi(m[3].str()));
    }
    if (std::regex_match(text, m, re_hex)) {
        unsigned long rgb = std::stoul(m[1].str(), nullptr, 16);
        return Color{static_cast<uint8_t>((rgb >> 16) & 0xff),
                     static_cast<uint8_t>((rgb >> 8) & 0xff),
                     static_cast<uint8_t>(rgb & 0xff)};
    }
    throw InvalidColor("invalid color '" + text + "' (expected R,G,B or #RRGGBB)");
}

std::string color_to_string(const Color& c) {
    return std::to_string(c.r) + "," + std::to_string(c.g) + "," + std::to_string(c.b);
}
