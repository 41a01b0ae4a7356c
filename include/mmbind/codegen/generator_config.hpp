/**
 * @file generator_config.hpp
 * @brief Constants that shape a generated binding.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include <mmbind/core/command_tree.hpp>

#include <string>

namespace mmbind {
namespace codegen {

/// Version stamped into every generated header
constexpr const char* GENERATOR_VERSION = "2.0.0";

/**
 * @brief Generation settings, passed explicitly to the tree builder and
 *        the renderer.
 */
struct GeneratorConfig {
    std::string namespaceName = "minimega";
    std::string className = "Api";
    std::string generatorVersion = GENERATOR_VERSION;
    std::string daemonVersion = "UNKNOWN";
    core::TreeOptions tree;
};

}  // namespace codegen
}  // namespace mmbind
