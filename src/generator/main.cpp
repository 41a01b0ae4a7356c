/**
 * @file main.cpp
 * @brief mmbind-gen entry point
 *
 * Thin executable wiring the grammar decoder, the command tree builder and
 * the binding renderer together. The generated header goes to stdout (or
 * --out); logging goes to stderr.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include <mmbind/codegen/binding_renderer.hpp>
#include <mmbind/core/command_descriptor.hpp>
#include <mmbind/core/command_tree.hpp>
#include <mmbind/generator/config.hpp>
#include <mmbind/utils/logger.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace mmbind;
using namespace mmbind::generator;

namespace {

std::vector<core::CommandDescriptor> loadGrammar(const std::string& path) {
    if (path.empty() || path == "-") {
        LOG_DEBUG("Generator", "Reading grammar from stdin");
        return core::readDescriptors(std::cin);
    }

    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("cannot open grammar file '" + path + "'");
    }
    LOG_DEBUG("Generator", "Reading grammar from {}", path);
    return core::readDescriptors(input);
}

void writeHeader(const std::string& path, const std::string& header) {
    if (path.empty()) {
        std::cout << header;
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("failed to write to stdout");
        }
        return;
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("cannot open output file '" + path + "'");
    }
    output << header;
    output.close();
    if (!output) {
        throw std::runtime_error("failed to write output file '" + path + "'");
    }
    LOG_INFO("Generator", "Wrote {} bytes to {}", header.size(), path);
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.invalid) {
        printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (config.help) {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));

    try {
        const codegen::GeneratorConfig genConfig = config.toGeneratorConfig();

        auto descriptors = loadGrammar(config.grammar_path);
        auto tree = core::CommandTree::build(descriptors, genConfig.tree);

        codegen::BindingRenderer renderer(genConfig);
        writeHeader(config.output_path, renderer.render(tree));

        LOG_INFO("Generator", "Generated {}::{} with {} commands",
                 genConfig.namespaceName, genConfig.className, tree.commandCount());
    } catch (const std::exception& e) {
        LOG_ERROR("Generator", "Generation failed: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
