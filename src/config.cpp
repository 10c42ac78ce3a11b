#include "config.h"

#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string at_line(const std::string& source, int lineno) {
    return " at " + source + ":" + std::to_string(lineno);
}

// Accepts decimal or 0x-prefixed hex.
static unsigned long parse_number(const std::string& value) {
    size_t used = 0;
    unsigned long v = std::stoul(value, &used, 0);
    if (used != value.size())
        throw std::invalid_argument("trailing characters");
    return v;
}

static bool parse_bool(const std::string& value, bool& out) {
    std::string v = to_lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

// Space separated list of colors, e.g. "255,0,0 #00ff00"
static std::vector<Color> parse_color_list(const std::string& value) {
    std::vector<Color> colors;
    std::istringstream iss(value);
    std::string token;
    while (iss >> token)
        colors.push_back(parse_color(token));
    return colors;
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config(std::istream& in, const std::string& source) {
    Config cfg;
    std::string section;
    int lineno = 0;

    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        // Section header
        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        if (!std::regex_match(line, m, re_kv))
            throw std::runtime_error("Syntax error '" + line + "'" + at_line(source, lineno));

        std::string key   = to_lower(trim(m[1].str()));
        std::string value = trim(m[2].str());

        // Trailing "; comment" after a value
        size_t semi = value.find(';');
        if (semi != std::string::npos)
            value = trim(value.substr(0, semi));

        if (section == "device") {
            if (key == "vendor_id" || key == "product_id" || key == "frame_delay_ms") {
                unsigned long v = 0;
                try {
                    v = parse_number(value);
                } catch (const std::exception&) {
                    throw std::runtime_error(
                        "Invalid " + key + " '" + value + "'" + at_line(source, lineno));
                }
                if (key == "frame_delay_ms") {
                    if (v > NZXT_MAX_FRAME_DELAY_MS)
                        throw std::runtime_error(
                            "frame_delay_ms must be at most " +
                            std::to_string(NZXT_MAX_FRAME_DELAY_MS) + at_line(source, lineno));
                    cfg.device.frame_delay_ms = static_cast<unsigned int>(v);
                } else {
                    if (v > 0xffff)
                        throw std::runtime_error(
                            key + " does not fit in 16 bits" + at_line(source, lineno));
                    if (key == "vendor_id") cfg.device.vendor_id  = static_cast<uint16_t>(v);
                    else                    cfg.device.product_id = static_cast<uint16_t>(v);
                }
            }
            // Unknown device keys are silently ignored

        } else if (section == "led") {
            if (key == "mode") {
                cfg.led.mode = to_lower(value);
            } else if (key == "colors" || key == "color") {
                try {
                    cfg.led.colors = parse_color_list(value);
                } catch (const InvalidColor& e) {
                    throw std::runtime_error(e.what() + at_line(source, lineno));
                }
            } else if (key == "speed") {
                try {
                    cfg.led.options.speed = parse_speed(value);
                } catch (const InvalidParameter& e) {
                    throw std::runtime_error(e.what() + at_line(source, lineno));
                }
            } else if (key == "direction") {
                try {
                    cfg.led.options.direction = parse_direction(value);
                } catch (const InvalidParameter& e) {
                    throw std::runtime_error(e.what() + at_line(source, lineno));
                }
            } else if (key == "size") {
                try {
                    cfg.led.options.size = parse_size(value);
                } catch (const InvalidParameter& e) {
                    throw std::runtime_error(e.what() + at_line(source, lineno));
                }
            } else if (key == "moving") {
                bool b = false;
                if (!parse_bool(value, b))
                    throw std::runtime_error(
                        "Invalid moving '" + value + "'" + at_line(source, lineno));
                cfg.led.options.moving = b;
            }
        }
        // Unknown sections are silently ignored
    }

    return cfg;
}

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path);
    return parse_config(f, path);
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_config(const Config& cfg) {
    if (cfg.device.frame_delay_ms > NZXT_MAX_FRAME_DELAY_MS)
        throw std::runtime_error(
            "frame_delay_ms must be at most " + std::to_string(NZXT_MAX_FRAME_DELAY_MS) +
            " (got " + std::to_string(cfg.device.frame_delay_ms) + ")");

    if (!cfg.led.mode.empty() && !find_mode(cfg.led.mode))
        throw std::runtime_error("Unknown LED mode: " + cfg.led.mode);

    if (cfg.led.options.size) {
        int s = *cfg.led.options.size;
        if (s < NZXT_MIN_GROUP_SIZE || s > NZXT_MAX_GROUP_SIZE)
            throw std::runtime_error(
                "size must be between " + std::to_string(NZXT_MIN_GROUP_SIZE) + " and " +
                std::to_string(NZXT_MAX_GROUP_SIZE) + " (got " + std::to_string(s) + ")");
    }
}
