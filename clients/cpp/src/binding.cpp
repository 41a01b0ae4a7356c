/**
 * @file binding.cpp
 * @brief Runtime binding lookups.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind_client/binding.hpp"

#include <stdexcept>

namespace mmbind {
namespace client {

namespace {

std::vector<std::string> identifiers(const core::CommandMap& nodes) {
    std::vector<std::string> names;
    names.reserve(nodes.size());
    for (const auto& entry : nodes) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace

// =============================================================================
// BindingNode
// =============================================================================

std::vector<std::string> BindingNode::children() const {
    const core::CommandMap* kids = node_->children();
    return kids ? identifiers(*kids) : std::vector<std::string>{};
}

BindingNode BindingNode::operator[](const std::string& identifier) const {
    const core::CommandNode* child = node_->child(identifier);
    if (!child) {
        throw std::out_of_range("'" + node_->identifier() + "' has no subcommand '" +
                                identifier + "'");
    }
    return BindingNode(*connection_, tree_, *child);
}

CommandHandle BindingNode::handle() const {
    const core::LeafCommand* command = node_->command();
    if (!command) {
        throw std::logic_error("'" + node_->identifier() + "' is a namespace, not a command");
    }
    return CommandHandle(*connection_, command->name(), command->candidates);
}

std::string BindingNode::help() const {
    const core::LeafCommand* command = node_->command();
    return command ? command->descriptor.helpShort : std::string();
}

// =============================================================================
// Binding
// =============================================================================

Binding::Binding(Connection& connection, std::shared_ptr<const core::CommandTree> tree)
    : connection_(&connection)
    , tree_(std::move(tree))
{
    if (!tree_) {
        throw std::invalid_argument("binding requires a command tree");
    }
}

BindingNode Binding::operator[](const std::string& identifier) const {
    auto it = tree_->roots().find(identifier);
    if (it == tree_->roots().end()) {
        throw std::out_of_range("no command '" + identifier + "'");
    }
    return BindingNode(*connection_, tree_, *it->second);
}

BindingNode Binding::at(const std::string& commandName) const {
    const core::CommandNode* node = tree_->find(commandName);
    if (!node) {
        throw std::out_of_range("no command '" + commandName + "'");
    }
    return BindingNode(*connection_, tree_, *node);
}

std::vector<std::string> Binding::roots() const {
    return identifiers(tree_->roots());
}

}  // namespace client
}  // namespace mmbind
