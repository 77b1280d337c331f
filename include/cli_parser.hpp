/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * Turns the aclgen command line (one policy file plus rendering switches)
 * into an Options value consumed by main().
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace aclgen {

/**
 * @class CLIParser
 * @brief Command line interface parser for aclgen
 *
 * Static helpers around getopt_long. Every switch has a long and a short
 * form; the single positional argument names the YAML policy.
 */
class CLIParser {
public:
    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        std::optional<std::filesystem::path> policy_file; ///< YAML policy to render
        std::optional<std::filesystem::path> output_file; ///< Destination file, stdout when unset
        bool first_filter_only = false;  ///< Render only the first cisco filter
        bool strict_protocols = false;   ///< Fail on unknown protocol names
        bool quiet = false;              ///< Do not print render warnings
        bool help = false;               ///< Display help information
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @param argc Number of command line arguments
     * @param argv Array of command line argument strings
     * @return Parsed options structure
     * @throws std::invalid_argument if argument parsing or option validation fails
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Print usage information to stdout
     * @param program_name Name of the program executable
     */
    static void printUsage(const std::string& program_name);

private:
    /**
     * @brief Validate parsed options for logical consistency
     * @param options The options structure to validate
     * @throws std::invalid_argument if no policy file is given outside of --help
     */
    static void validateOptions(const Options& options);
};

} // namespace aclgen
