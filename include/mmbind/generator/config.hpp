/**
 * @file config.hpp
 * @brief mmbind-gen configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include <mmbind/codegen/generator_config.hpp>
#include <mmbind/utils/logger.hpp>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace mmbind {
namespace generator {

/**
 * @brief Generator configuration structure
 */
struct Config {
    std::string grammar_path;           ///< Empty or "-" reads stdin
    std::string output_path;            ///< Empty writes stdout
    std::string namespace_name = "minimega";
    std::string class_name = "Api";
    std::string daemon_version = "UNKNOWN";
    std::vector<std::string> deny;      ///< Added to the default denylist
    std::string log_level = "WARN";
    bool help = false;
    bool invalid = false;               ///< Bad command line; usage goes to stderr

    /// Settings for the tree builder and renderer
    codegen::GeneratorConfig toGeneratorConfig() const {
        codegen::GeneratorConfig gen;
        gen.namespaceName = namespace_name;
        gen.className = class_name;
        gen.daemonVersion = daemon_version;
        gen.tree.denylist.insert(deny.begin(), deny.end());
        return gen;
    }
};

/**
 * @brief Print usage information
 * @param out Stream to print to
 * @param program_name Name of the executable
 */
inline void printUsage(std::ostream& out, const char* program_name) {
    out << "mmbind-gen - Generate a C++ binding from a daemon command grammar\n\n"
        << "Usage: " << program_name << " [OPTIONS] [grammar.json]\n\n"
        << "Reads the grammar (the daemon's JSON command dump) from the file, or\n"
        << "from stdin when the file is omitted or '-'.\n\n"
        << "Options:\n"
        << "  --namespace <ns>        Namespace of the generated code (default: minimega)\n"
        << "  --class <name>          Name of the entry-point class (default: Api)\n"
        << "  --daemon-version <v>    Daemon version stamped into the header (default: UNKNOWN)\n"
        << "  --deny <command>        Do not bind this command; repeatable\n"
        << "                          (always denied: help, namespace, clear namespace)\n"
        << "  --out <file>            Write the header to a file instead of stdout\n"
        << "  --log-level <level>     Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: WARN)\n"
        << "\n  --help                  Show this help message\n\n"
        << "Example:\n"
        << "  minimega -cli | " << program_name << " --daemon-version 2.9 > minimega_api.hpp\n"
        << "  " << program_name << " --namespace mm --out api.hpp --deny \"vm launch\" grammar.json\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Grammar file (or "-" for stdin)
        if (std::strncmp(arg, "--", 2) != 0) {
            if (!config.grammar_path.empty()) {
                std::cerr << "Error: More than one grammar file given\n";
                config.invalid = true;
                return config;
            }
            config.grammar_path = arg;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.invalid = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--namespace") == 0) {
            config.namespace_name = value;
        } else if (std::strcmp(arg, "--class") == 0) {
            config.class_name = value;
        } else if (std::strcmp(arg, "--daemon-version") == 0) {
            config.daemon_version = value;
        } else if (std::strcmp(arg, "--deny") == 0) {
            config.deny.push_back(value);
        } else if (std::strcmp(arg, "--out") == 0) {
            config.output_path = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.invalid = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string
 * @return LogLevel value (defaults to WARN if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    return utils::logLevelFromString(level_str).value_or(utils::LogLevel::WARN);
}

} // namespace generator
} // namespace mmbind
