#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include "acl_generator.hpp"
#include "cli_parser.hpp"
#include "errors.hpp"
#include "policy_parser.hpp"

int main(int argc, char* argv[]) {
    try {
        auto options = aclgen::CLIParser::parse(argc, argv);

        if (options.help) {
            aclgen::CLIParser::printUsage(argv[0]);
            return 0;
        }

        const auto& policy_path = *options.policy_file;

        // Check the path up front so a missing file is not reported as a YAML error
        if (!std::filesystem::exists(policy_path)) {
            std::cerr << "Error: Policy file does not exist: " << policy_path.string() << std::endl;
            return 1;
        }
        if (!std::filesystem::is_regular_file(policy_path)) {
            std::cerr << "Error: Path is not a regular file: " << policy_path.string() << std::endl;
            return 1;
        }

        // The access lists go to stdout, so progress is reported on stderr
        std::cerr << "Processing policy file: " << policy_path.string() << std::endl;
        aclgen::Policy policy = aclgen::PolicyParser::loadFromFile(policy_path.string());

        aclgen::GeneratorOptions generator_options;
        generator_options.first_filter_only = options.first_filter_only;
        generator_options.strict_protocols = options.strict_protocols;

        aclgen::CiscoAclGenerator generator(policy, generator_options);
        std::string document = generator.render();

        if (!options.quiet) {
            for (const auto& warning : generator.warnings()) {
                std::cerr << "WARNING (" << aclgen::warningTypeToString(warning.type) << "): ";
                if (!warning.term.empty()) {
                    std::cerr << "term '" << warning.term << "': ";
                }
                std::cerr << warning.message << std::endl;
            }
        }

        if (options.output_file) {
            std::ofstream output(*options.output_file);
            if (!output.is_open()) {
                std::cerr << "Error: Unable to open output file: " << options.output_file->string() << std::endl;
                return 1;
            }
            output << document;
            if (!output) {
                std::cerr << "Error: Failed writing output file: " << options.output_file->string() << std::endl;
                return 1;
            }
            std::cerr << "Access lists written to " << options.output_file->string() << std::endl;
        } else {
            std::cout << document;
        }
        return 0;

    } catch (const std::invalid_argument& e) {
        // Command line parsing errors
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    } catch (const aclgen::PolicyParseError& e) {
        std::cerr << "Policy error: " << e.what() << std::endl;
        return 1;
    } catch (const aclgen::AclError& e) {
        // Rendering refused the policy; nothing has been written
        std::cerr << "Rendering error: " << e.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "File system error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
