// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for PrintDeck
 *
 * Values given on the command line override the config file for this run
 * only; they are never saved back.
 */

#include <string>

namespace printdeck {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "printdeck.json";

    // Printer overrides (empty = use config)
    std::string endpoint;
    std::string api_key;

    // Screen size override (0 = use config)
    int width = 0;
    int height = 0;

    // Use the simulated printer instead of a real server
    bool test_mode = false;

    // Logging
    int verbosity = 0;     // -v count
    std::string log_dest;  // --log-dest, empty = use config
    std::string log_file;  // --log-file, empty = use config

    // Set when --help was printed (parse_cli_args returns false)
    bool help_shown = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace printdeck
