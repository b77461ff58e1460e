/**
 * @file cli_options.h
 * @brief Command-line parsing for ca-loadgen
 *
 * Every flag maps onto a ConfigManager key; values given on the command line
 * override the environment.
 */

#pragma once

#include <map>
#include <ostream>
#include <string>

namespace caload {
namespace common {
class ConfigManager;
}

namespace cli {

struct CliOptions {
    bool showHelp = false;
    std::map<std::string, std::string> overrides;   ///< ConfigManager key -> value
};

/**
 * @brief Parse argv with getopt_long
 * @throws common::ConfigException on unknown flags, missing values or stray arguments
 */
CliOptions parseCommandLine(int argc, char* argv[]);

/**
 * @brief Store command-line values in the configuration
 */
void applyOverrides(const CliOptions& options, common::ConfigManager& config);

void printUsage(std::ostream& out, const std::string& progname);

} // namespace cli
} // namespace caload
