#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "color.h"
#include "modes.h"

// Default USB identity: NZXT Smart Device (H500i LED and fan controller)
static constexpr uint16_t NZXT_VID = 0x1e71;
static constexpr uint16_t NZXT_PID = 0x1714;

// Pause between frame 1 and frame 2; the firmware latches frame 1 first.
static constexpr unsigned int NZXT_FRAME_DELAY_MS     = 50;
static constexpr unsigned int NZXT_MAX_FRAME_DELAY_MS = 1000;

// Parsed representation of an INI configuration file.
struct Config {
    // [device] section
    struct DeviceConfig {
        uint16_t     vendor_id      = NZXT_VID;
        uint16_t     product_id     = NZXT_PID;
        unsigned int frame_delay_ms = NZXT_FRAME_DELAY_MS;
    } device;

    // [led] section. Unset fields fall back to the mode defaults; values
    // given on the command line win over anything set here.
    struct LedConfig {
        std::string        mode;    // empty means "not set"
        std::vector<Color> colors;
        ModeOptions        options;
    } led;
};

// Parse INI text. `source` names the input in error messages.
// Throws std::runtime_error on malformed values.
Config parse_config(std::istream& in, const std::string& source = "<config>");

// Parse an INI config file from disk.
// Throws std::runtime_error if the file cannot be read or has syntax errors.
Config parse_config_file(const std::string& path);

// Validate a parsed Config and throw std::runtime_error if any value is out of range.
void validate_config(const Config& cfg);
