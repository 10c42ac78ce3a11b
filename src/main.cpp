#include <algorithm>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "modes.h"
#include "protocol.h"
#include "usb.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------

// "modes (allowed flags):" table generated from the catalog.
static void print_mode_table(std::ostream& os) {
    size_t width = 23;
    for (auto& d : mode_catalog())
        width = std::max(width, std::string(d.name).size() + 4);

    os << "modes (allowed flags):\n";
    for (auto& d : mode_catalog()) {
        os << "  " << std::left << std::setw(static_cast<int>(width - 2)) << d.name
           << d.help << " (" << mode_flags_string(d) << ")\n";
    }
    os << std::right;
}

static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS] MODE [COLOR...]

Control NZXT smart device (H500i) leds on Linux.

Arguments:
  MODE                     LED mode, see the table below
  COLOR                    colors as R,G,B (e.g. 255,0,0) or #RRGGBB

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit
  --list-modes             Show the mode table and exit

  -c, --config FILE        Read device settings and LED defaults from an
                           INI file (command line values win)
  -n, --dry-run            Build and print the frames, do not touch the
                           device
  -v, --verbose            Hexdump every frame sent
  --probe                  Show USB interfaces and endpoints for the device

  --size N                 Set led row length 3-6 (for some modes)
  --moving                 Move the rows (only works for alternating)
  --backward               Play animation backwards (only works for some modes)
  --speed N                Set animation speed 0-4 (defaults to 2, only
                           works for some modes)
  --slowest, --slow, --fast, --fastest
                           Animation speed shortcuts

Examples:
  nzxt-led fixed 255,0,0
  nzxt-led breathing 255,0,0 0,255,0 0,0,255 --fast
  nzxt-led marquee '#00ffff' --size 5 --backward
  nzxt-led alternating 255,0,0 0,0,255 --size 4 --moving
  nzxt-led custom_fixed 255,0,0 0,255,0 0,0,255
  nzxt-led --config examples/nzxt-led.ini
  nzxt-led off

Note: Run as root or install the udev rule for non-root access:
  sudo cp udev/99-nzxt-smart-device.rules /etc/udev/rules.d/
  sudo udevadm control --reload-rules && sudo udevadm trigger

)";
    print_mode_table(std::cout);
}

// -----------------------------------------------------------------------
// Sending
// -----------------------------------------------------------------------

static void print_pair(const FramePair& fp, const std::string& label) {
    std::cout << "  " << label << "\n";
    std::cout << "    --> ";
    hexdump_frame(fp.frame1);
    std::cout << "    --> ";
    hexdump_frame(fp.frame2);
}

// Send every pair in order. The device accumulates animation steps across
// pairs, so a failure part way through aborts the rest.
static void send_sequence(UsbLedController& dev,
                          const FrameSequence& seq,
                          const std::string& heading,
                          unsigned int delay_ms,
                          bool verbose) {
    std::cout << "=== " << heading << " (" << seq.size() << " command"
              << (seq.size() == 1 ? "" : "s") << ") ===\n";
    for (size_t i = 0; i < seq.size(); ++i) {
        if (verbose)
            print_pair(seq[i], "cmd " + std::to_string(i + 1) + "/" + std::to_string(seq.size()));
        dev.send_frames(seq[i], delay_ms);
    }
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    enum : int {
        OPT_PROBE = 1001,
        OPT_LIST_MODES,
        OPT_SIZE,
        OPT_MOVING,
        OPT_BACKWARD,
        OPT_SPEED,
        OPT_SLOWEST,
        OPT_SLOW,
        OPT_FAST,
        OPT_FASTEST,
    };

    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",       no_argument,       nullptr, 'h'},
        {"version",    no_argument,       nullptr, 'V'},
        {"config",     required_argument, nullptr, 'c'},
        {"dry-run",    no_argument,       nullptr, 'n'},
        {"verbose",    no_argument,       nullptr, 'v'},
        {"probe",      no_argument,       nullptr, OPT_PROBE},
        {"list-modes", no_argument,       nullptr, OPT_LIST_MODES},
        {"size",       required_argument, nullptr, OPT_SIZE},
        {"moving",     no_argument,       nullptr, OPT_MOVING},
        {"backward",   no_argument,       nullptr, OPT_BACKWARD},
        {"speed",      required_argument, nullptr, OPT_SPEED},
        {"slowest",    no_argument,       nullptr, OPT_SLOWEST},
        {"slow",       no_argument,       nullptr, OPT_SLOW},
        {"fast",       no_argument,       nullptr, OPT_FAST},
        {"fastest",    no_argument,       nullptr, OPT_FASTEST},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    bool        do_probe = false;
    bool        dry_run  = false;
    bool        verbose  = false;
    std::string config_file;
    ModeOptions cli_opts;

    // --speed and its shortcuts are mutually exclusive
    auto set_speed = [&](Speed s) {
        if (cli_opts.speed) {
            std::cerr << "Error: only one of --speed, --slowest, --slow, --fast, --fastest\n";
            return false;
        }
        cli_opts.speed = s;
        return true;
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "hVc:nv", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "nzxt-led " << VERSION << "\n";
            return 0;

        case 'c':
            config_file = optarg;
            break;

        case 'n':
            dry_run = true;
            break;

        case 'v':
            verbose = true;
            break;

        case OPT_PROBE:
            do_probe = true;
            break;

        case OPT_LIST_MODES:
            print_mode_table(std::cout);
            return 0;

        case OPT_SIZE:
            try {
                cli_opts.size = parse_size(optarg);
            } catch (const InvalidParameter& e) {
                std::cerr << "Error: --size: " << e.what() << "\n";
                return 1;
            }
            break;

        case OPT_MOVING:
            cli_opts.moving = true;
            break;

        case OPT_BACKWARD:
            cli_opts.direction = Direction::Backward;
            break;

        case OPT_SPEED:
            try {
                if (!set_speed(parse_speed(optarg))) return 1;
            } catch (const InvalidParameter& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
            break;

        case OPT_SLOWEST: if (!set_speed(Speed::Slowest)) return 1; break;
        case OPT_SLOW:    if (!set_speed(Speed::Slow))    return 1; break;
        case OPT_FAST:    if (!set_speed(Speed::Fast))    return 1; break;
        case OPT_FASTEST: if (!set_speed(Speed::Fastest)) return 1; break;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    // ---- positional arguments: MODE [COLOR...] ----
    std::string mode_name;
    std::vector<std::string> color_args;
    if (optind < argc)
        mode_name = argv[optind++];
    while (optind < argc)
        color_args.push_back(argv[optind++]);

    // ---- resolve config, mode, colors and options ----
    Config cfg;
    FrameSequence seq;
    std::vector<Color> colors;
    try {
        if (!config_file.empty()) {
            cfg = parse_config_file(config_file);
            validate_config(cfg);
        }

        if (mode_name.empty())
            mode_name = cfg.led.mode;

        if (mode_name.empty() && !do_probe) {
            print_help(argv[0]);
            return 0;
        }

        if (!mode_name.empty()) {
            const ModeDescriptor* desc = find_mode(mode_name);
            if (!desc)
                throw UnknownMode("invalid mode '" + mode_name + "' (see --list-modes)");

            for (auto& arg : color_args)
                colors.push_back(parse_color(arg));
            if (colors.empty() && mode_name == cfg.led.mode)
                colors = cfg.led.colors;

            // Everything is validated here, before the device is opened.
            seq = desc->run(colors, merge_options(cfg.led.options, cli_opts, *desc));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // ---- --dry-run ----
    if (dry_run) {
        std::cout << "=== " << mode_name << " (dry run, " << seq.size() << " command"
                  << (seq.size() == 1 ? "" : "s") << ") ===\n";
        if (!colors.empty()) {
            std::cout << "  colors:";
            for (auto& c : colors)
                std::cout << " " << color_to_string(c);
            std::cout << "\n";
        }
        for (size_t i = 0; i < seq.size(); ++i)
            print_pair(seq[i], "cmd " + std::to_string(i + 1) + "/" + std::to_string(seq.size()));
        return 0;
    }

    // ---- open controller ----
    int exit_code = 0;
    try {
        UsbLedController dev;

        std::cout << "Opening NZXT smart device (" << std::hex << std::setfill('0')
                  << std::setw(4) << cfg.device.vendor_id << ":"
                  << std::setw(4) << cfg.device.product_id
                  << std::dec << std::setfill(' ') << ")...\n";
        dev.open(cfg.device.vendor_id, cfg.device.product_id);
        std::cout << "Connected.\n\n";

        // ---- --probe ----
        if (do_probe) {
            std::cout << "=== USB endpoint probe ===\n";
            dev.probe();
        }

        // ---- mode ----
        if (!seq.empty())
            send_sequence(dev, seq, mode_name, cfg.device.frame_delay_ms, verbose);

        dev.close();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    return exit_code;
}
