/**
 * @file binding.hpp
 * @brief Runtime binding over a compiled command tree.
 *
 * The same callable surface a generated header provides, resolved by name
 * at run time. Useful when the daemon's grammar is only known after
 * connecting:
 *
 * @code
 * auto tree = std::make_shared<core::CommandTree>(
 *     core::CommandTree::build(core::parseDescriptors(grammarJson)));
 * Binding mm(conn, tree);
 * mm["vm"]["info"]();
 * mm.at("mesh degree")("1");
 * @endcode
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/argument.hpp"
#include "mmbind_client/command_handle.hpp"
#include "mmbind_client/connection.hpp"
#include "mmbind_client/export.hpp"

#include <mmbind/core/command_tree.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mmbind {
namespace client {

/**
 * @class BindingNode
 * @brief One node of the bound tree: a namespace, a command, or both.
 */
class MMBIND_CLIENT_API BindingNode {
public:
    BindingNode(Connection& connection,
                std::shared_ptr<const core::CommandTree> tree,
                const core::CommandNode& node)
        : connection_(&connection)
        , tree_(std::move(tree))
        , node_(&node)
    {}

    const std::string& identifier() const { return node_->identifier(); }

    /// True if the node is a command and not just a namespace
    bool invocable() const { return node_->command() != nullptr; }

    /// Identifiers of the subcommands, sorted
    std::vector<std::string> children() const;

    /**
     * @brief Subcommand by identifier.
     * @throws std::out_of_range if there is no such subcommand.
     */
    BindingNode operator[](const std::string& identifier) const;

    /**
     * @brief The node's command.
     * @throws std::logic_error if the node is only a namespace.
     */
    CommandHandle handle() const;

    /// One-line help of the node's command, "" for a namespace
    std::string help() const;

    ResponseFrame operator()(const CallArguments& args) const { return handle()(args); }

    template <typename... Args,
              typename = std::enable_if_t<(std::is_constructible<Argument, Args&&>::value && ...)>>
    ResponseFrame operator()(Args&&... args) const {
        return handle()(std::forward<Args>(args)...);
    }

    void stream(const CallArguments& args) const { handle().stream(args); }

    template <typename... Args,
              typename = std::enable_if_t<(std::is_constructible<Argument, Args&&>::value && ...)>>
    void stream(Args&&... args) const {
        handle().stream(std::forward<Args>(args)...);
    }

private:
    Connection* connection_;
    std::shared_ptr<const core::CommandTree> tree_;
    const core::CommandNode* node_;
};

/**
 * @class Binding
 * @brief Entry point of the runtime binding.
 */
class MMBIND_CLIENT_API Binding {
public:
    Binding(Connection& connection, std::shared_ptr<const core::CommandTree> tree);

    /**
     * @brief Top-level command or namespace by identifier.
     * @throws std::out_of_range if there is none.
     */
    BindingNode operator[](const std::string& identifier) const;

    /**
     * @brief Node by spaced command name ("vm info").
     * @throws std::out_of_range if there is none.
     */
    BindingNode at(const std::string& commandName) const;

    /// Identifiers of the top-level nodes, sorted
    std::vector<std::string> roots() const;

    const core::CommandTree& tree() const { return *tree_; }

private:
    Connection* connection_;
    std::shared_ptr<const core::CommandTree> tree_;
};

}  // namespace client
}  // namespace mmbind
