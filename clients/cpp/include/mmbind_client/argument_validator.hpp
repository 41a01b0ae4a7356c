/**
 * @file argument_validator.hpp
 * @brief Client-side check of call arguments against a command's patterns.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/argument.hpp"
#include "mmbind_client/export.hpp"

#include <mmbind/core/argument_type.hpp>

#include <string>
#include <vector>

namespace mmbind {
namespace client {

/**
 * @class ArgumentValidator
 * @brief Matches call arguments against candidate patterns.
 *
 * Candidates are tried in declaration order and the first that accepts the
 * arguments wins. Keyword arguments bind to the slot with the same key (or
 * literal text, for keyless slots); positionals fill the remaining slots
 * left to right. Optional slots may be skipped.
 */
class MMBIND_CLIENT_API ArgumentValidator {
public:
    /**
     * @brief Validate and flatten arguments into wire tokens.
     * @param command Command name, used in error messages
     * @param candidates Acceptable argument shapes
     * @param args Positional and keyword arguments of the call
     * @return Tokens to send after the command name
     * @throws core::ValidationError if no candidate accepts the arguments
     */
    static std::vector<std::string> validate(const std::string& command,
                                             const std::vector<core::CandidatePattern>& candidates,
                                             const CallArguments& args);
};

}  // namespace client
}  // namespace mmbind
