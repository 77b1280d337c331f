#include "cli_parser.hpp"
#include <iostream>
#include <stdexcept>
#include <getopt.h>

namespace aclgen {

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    // Long options and their short equivalents; only --output takes an argument
    static struct option long_options[] = {
        {"output",            required_argument, 0, 'o'},
        {"first-filter-only", no_argument,       0, 'f'},
        {"strict-protocols",  no_argument,       0, 's'},
        {"quiet",             no_argument,       0, 'q'},
        {"help",              no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // getopt_long keeps global state; optind = 0 makes glibc rescan from scratch
    optind = 0;

    int option_index = 0;
    int c;
    while ((c = getopt_long(argc, argv, "o:fsqh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'o':
                options.output_file = std::filesystem::path(optarg);
                break;
            case 'f':
                options.first_filter_only = true;
                break;
            case 's':
                options.strict_protocols = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long has already printed the offending option
                throw std::invalid_argument("Unknown option");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    // Exactly one positional argument: the policy file
    if (optind < argc) {
        if (optind + 1 == argc) {
            options.policy_file = std::filesystem::path(argv[optind]);
        } else {
            throw std::invalid_argument("Too many positional arguments");
        }
    }

    validateOptions(options);
    return options;
}

void CLIParser::validateOptions(const Options& options) {
    if (options.help) {
        return;
    }
    if (!options.policy_file.has_value()) {
        throw std::invalid_argument("No policy file specified");
    }
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] POLICY_FILE\n\n";
    std::cout << "Render a YAML filter policy as Cisco IOS access lists\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  POLICY_FILE    YAML policy document\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output FILE        Write the access lists to FILE instead of stdout\n";
    std::cout << "  -f, --first-filter-only  Render only the first cisco filter\n";
    std::cout << "  -s, --strict-protocols   Fail on protocol names missing from the protocol table\n";
    std::cout << "  -q, --quiet              Do not print warnings\n";
    std::cout << "  -h, --help               Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " policy.yaml                 Print access lists\n";
    std::cout << "  " << program_name << " -o edge.acl policy.yaml     Write access lists to edge.acl\n";
}

} // namespace aclgen
