/**
 * @file command_handle.cpp
 * @brief Command invocation.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind_client/command_handle.hpp"
#include "mmbind_client/argument_validator.hpp"

namespace mmbind {
namespace client {

std::vector<std::string> CommandHandle::tokens(const CallArguments& args) const {
    return ArgumentValidator::validate(name_, *candidates_, args);
}

ResponseFrame CommandHandle::operator()(const CallArguments& args) const {
    return connection_->send(name_, tokens(args));
}

void CommandHandle::stream(const CallArguments& args) const {
    connection_->stream(name_, tokens(args));
}

}  // namespace client
}  // namespace mmbind
