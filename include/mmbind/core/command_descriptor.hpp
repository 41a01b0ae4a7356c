/**
 * @file command_descriptor.hpp
 * @brief Daemon command grammar as dumped by the daemon's "-cli" flag.
 *
 * The dump is a JSON array of handler objects:
 * @code
 * [{"help_short": "...", "help_long": "...",
 *   "patterns": ["vm info", "vm info <vm target>"],
 *   "shared_prefix": "vm info",
 *   "parsed_patterns": [[{"type": 2, "text": "vm"}, ...], ...]}]
 * @endcode
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/core/export.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace mmbind {
namespace core {

/**
 * @brief One item of a parsed pattern.
 */
struct PatternItem {
    uint32_t type = 0;                 ///< Argument bitmask (see argument_type.hpp)
    std::string key;                   ///< Variable name, e.g. "vm" in "<vm target>"
    std::string text;                  ///< Literal text or original token
    std::vector<std::string> options;  ///< Choices for choice items
};

/**
 * @brief One acceptable call shape, including the shared-prefix literals.
 */
using ArgumentPattern = std::vector<PatternItem>;

/**
 * @struct CommandDescriptor
 * @brief A daemon command handler. Immutable once decoded.
 */
struct CommandDescriptor {
    std::string sharedPrefix;
    std::string helpShort;
    std::string helpLong;
    std::vector<std::string> patterns;
    std::vector<ArgumentPattern> parsedPatterns;
};

/**
 * @brief Decode a grammar dump.
 * @throws ParseError on malformed JSON or a document of the wrong shape.
 */
MMBIND_CORE_API std::vector<CommandDescriptor> parseDescriptors(const std::string& document);

/**
 * @brief Read a whole stream and decode it with parseDescriptors().
 */
MMBIND_CORE_API std::vector<CommandDescriptor> readDescriptors(std::istream& input);

}  // namespace core
}  // namespace mmbind
