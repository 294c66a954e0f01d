// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "config.h"

#include <cstdio>
#include <cstring>

namespace printdeck {

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>   Config file (default: printdeck.json)\n");
    printf("  -e, --endpoint <url>  OctoPrint URL (e.g., http://octopi.local)\n");
    printf("  -k, --key <key>       OctoPrint API key\n");
    printf("  -s, --size <WxH>      Window size (default: 800x480)\n");
    printf("  --test                Use a simulated printer\n");
    printf("  -v, --verbose         Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>     Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>     Log file path (when --log-dest=file)\n");
    printf("  -h, --help            Show this help message\n");
    printf("\nEnvironment:\n");
    printf("  PRINTDECK_ENDPOINT, PRINTDECK_API_KEY, PRINTDECK_RESOLUTION (WxH)\n");
}

// Fetch the value of an option that requires one
static const char* option_value(int argc, char** argv, int& i, const char* name) {
    if (i + 1 >= argc) {
        printf("Error: %s requires an argument\n", name);
        return nullptr;
    }
    return argv[++i];
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            const char* value = option_value(argc, argv, i, "-c/--config");
            if (!value)
                return false;
            args.config_path = value;
        } else if (strcmp(arg, "-e") == 0 || strcmp(arg, "--endpoint") == 0) {
            const char* value = option_value(argc, argv, i, "-e/--endpoint");
            if (!value)
                return false;
            args.endpoint = value;
        } else if (strcmp(arg, "-k") == 0 || strcmp(arg, "--key") == 0) {
            const char* value = option_value(argc, argv, i, "-k/--key");
            if (!value)
                return false;
            args.api_key = value;
        } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--size") == 0) {
            const char* value = option_value(argc, argv, i, "-s/--size");
            if (!value)
                return false;
            if (!parse_resolution(value, args.width, args.height)) {
                printf("Unknown screen size: %s\n", value);
                printf("Expected WxH, e.g. 800x480\n");
                return false;
            }
        } else if (strcmp(arg, "--test") == 0) {
            args.test_mode = true;
        } else if (strcmp(arg, "--log-dest") == 0) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            if (strcmp(value, "auto") != 0 && strcmp(value, "journal") != 0 &&
                strcmp(value, "syslog") != 0 && strcmp(value, "file") != 0 &&
                strcmp(value, "console") != 0) {
                printf("Error: invalid --log-dest: %s\n", value);
                return false;
            }
            args.log_dest = value;
        } else if (strcmp(arg, "--log-file") == 0) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            args.help_shown = true;
            return false;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            // -v, -vv, -vvv
            args.verbosity += static_cast<int>(strlen(arg + 1));
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else {
            printf("Unknown argument: %s\n", arg);
            print_help(argv[0]);
            return false;
        }
    }

    return true;
}

} // namespace printdeck
