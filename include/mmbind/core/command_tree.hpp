/**
 * @file command_tree.hpp
 * @brief Compiles the flat daemon grammar into a command hierarchy.
 *
 * Each command's shared prefix ("vm config qemu-override") is split into
 * words, each word reduced to its alphabetic characters ("qemuoverride")
 * and used as a path segment. Descriptors sharing leading words end up
 * under the same interior node:
 *
 * @code
 *   vm info, vm launch, vm kill   ->   vm { info, launch, kill }
 * @endcode
 *
 * The tree is built once per daemon grammar and is read-only afterwards.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/core/argument_type.hpp"
#include "mmbind/core/command_descriptor.hpp"
#include "mmbind/core/export.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace mmbind {
namespace core {

class CommandNode;

using CommandMap = std::map<std::string, std::unique_ptr<CommandNode>>;

/**
 * @brief An invocable command: its descriptor and the argument shapes
 *        left once the prefix literals are stripped.
 */
struct LeafCommand {
    CommandDescriptor descriptor;
    std::vector<CandidatePattern> candidates;

    /// Name sent on the wire as "Command"
    const std::string& name() const { return descriptor.sharedPrefix; }
};

/**
 * @brief A namespace of subcommands, optionally invocable itself.
 */
struct InteriorNode {
    CommandMap children;
    std::optional<LeafCommand> self;
};

/**
 * @class CommandNode
 * @brief Tagged node: either an interior namespace or a leaf command.
 */
class MMBIND_CORE_API CommandNode {
public:
    using Body = std::variant<InteriorNode, LeafCommand>;

    CommandNode(std::string identifier, Body body)
        : identifier_(std::move(identifier))
        , body_(std::move(body))
    {}

    const std::string& identifier() const { return identifier_; }

    bool isLeaf() const { return std::holds_alternative<LeafCommand>(body_); }
    bool isInterior() const { return std::holds_alternative<InteriorNode>(body_); }

    /**
     * @brief The command this node invokes, if any.
     *
     * Leaves always have one; interior nodes only when their own prefix
     * is a command.
     */
    const LeafCommand* command() const;

    /**
     * @brief Children of an interior node; nullptr for a leaf.
     */
    const CommandMap* children() const;

    const CommandNode* child(const std::string& identifier) const;

private:
    friend class CommandTree;

    /**
     * @brief Turn a leaf into an interior node that keeps it as its own
     *        command, and return the interior body.
     */
    InteriorNode& promote();

    /**
     * @brief Make this node invocable with @p leaf.
     * @throws DuplicateCommand if it already is.
     */
    void attach(LeafCommand leaf);

    std::string identifier_;
    Body body_;
};

/**
 * @brief Filtering applied before descriptors enter the tree.
 */
struct TreeOptions {
    /// Prefixes starting with this character are interface-local commands
    char internalMarker = '.';

    /// Exact shared prefixes never bound remotely
    std::set<std::string> denylist = {"help", "namespace", "clear namespace"};
};

/**
 * @class CommandTree
 * @brief Root of the compiled command hierarchy.
 *
 * Usage:
 * @code
 * auto tree = CommandTree::build(parseDescriptors(json));
 * const CommandNode* info = tree.find({"vm", "info"});
 * @endcode
 */
class MMBIND_CORE_API CommandTree {
public:
    CommandTree() = default;

    CommandTree(const CommandTree&) = delete;
    CommandTree& operator=(const CommandTree&) = delete;
    CommandTree(CommandTree&&) noexcept = default;
    CommandTree& operator=(CommandTree&&) noexcept = default;

    /**
     * @brief Compile descriptors into a tree.
     * @throws DuplicateCommand when two descriptors map to the same path.
     * @throws UnknownArgumentType for an argument bitmask outside the grammar.
     * @throws InvalidCommandName for a prefix word with no letters.
     * @throws GrammarError for a pattern shorter than its shared prefix.
     */
    static CommandTree build(const std::vector<CommandDescriptor>& descriptors,
                             const TreeOptions& options = {});

    /**
     * @brief Add one descriptor. Returns false if it was filtered out.
     */
    bool insert(const CommandDescriptor& descriptor, const TreeOptions& options = {});

    const CommandMap& roots() const { return roots_; }

    /**
     * @brief Look a node up by sanitized path segments.
     * @return nullptr if there is no such node.
     */
    const CommandNode* find(const std::vector<std::string>& path) const;

    /**
     * @brief Look a node up by a spaced command name ("vm info").
     *
     * Words are sanitized the same way the builder does.
     */
    const CommandNode* find(const std::string& commandName) const;

    /**
     * @brief Number of invocable commands in the tree.
     */
    size_t commandCount() const;

    bool empty() const { return roots_.empty(); }

    /**
     * @brief Path segments for a shared prefix ("vm qemu-override" ->
     *        {"vm", "qemuoverride"}).
     * @throws InvalidCommandName if a word has no alphabetic characters.
     */
    static std::vector<std::string> commandPath(const std::string& sharedPrefix);

    /**
     * @brief Compute the candidate argument lists of a descriptor.
     */
    static std::vector<CandidatePattern> candidatesFor(const CommandDescriptor& descriptor);

private:
    static void insertAt(CommandMap& siblings,
                         const std::vector<std::string>& path,
                         size_t depth,
                         LeafCommand leaf);

    CommandMap roots_;
};

}  // namespace core
}  // namespace mmbind
