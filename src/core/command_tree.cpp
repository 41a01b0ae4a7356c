/**
 * @file command_tree.cpp
 * @brief Command tree construction.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/core/command_tree.hpp"
#include "mmbind/core/errors.hpp"
#include "mmbind/utils/logger.hpp"
#include "mmbind/utils/string_utils.hpp"

namespace mmbind {
namespace core {

namespace {

size_t countCommands(const CommandMap& nodes) {
    size_t count = 0;
    for (const auto& [name, node] : nodes) {
        if (node->command()) {
            ++count;
        }
        if (const CommandMap* children = node->children()) {
            count += countCommands(*children);
        }
    }
    return count;
}

}  // namespace

// =============================================================================
// CommandNode
// =============================================================================

const LeafCommand* CommandNode::command() const {
    if (const auto* leaf = std::get_if<LeafCommand>(&body_)) {
        return leaf;
    }
    const auto& interior = std::get<InteriorNode>(body_);
    return interior.self ? &*interior.self : nullptr;
}

const CommandMap* CommandNode::children() const {
    if (const auto* interior = std::get_if<InteriorNode>(&body_)) {
        return &interior->children;
    }
    return nullptr;
}

const CommandNode* CommandNode::child(const std::string& identifier) const {
    const CommandMap* kids = children();
    if (!kids) {
        return nullptr;
    }
    auto it = kids->find(identifier);
    return it == kids->end() ? nullptr : it->second.get();
}

InteriorNode& CommandNode::promote() {
    if (auto* leaf = std::get_if<LeafCommand>(&body_)) {
        InteriorNode interior;
        interior.self = std::move(*leaf);
        body_ = std::move(interior);
        LOG_DEBUG("CommandTree", "'{}' is now also a namespace", identifier_);
    }
    return std::get<InteriorNode>(body_);
}

void CommandNode::attach(LeafCommand leaf) {
    if (std::holds_alternative<LeafCommand>(body_)) {
        throw DuplicateCommand(leaf.name());
    }
    auto& interior = std::get<InteriorNode>(body_);
    if (interior.self) {
        throw DuplicateCommand(leaf.name());
    }
    interior.self = std::move(leaf);
}

// =============================================================================
// Tree construction
// =============================================================================

std::vector<std::string> CommandTree::commandPath(const std::string& sharedPrefix) {
    std::vector<std::string> path;
    for (const auto& word : utils::split_words(sharedPrefix)) {
        std::string segment = utils::keep_alpha(word);
        if (segment.empty()) {
            throw InvalidCommandName(sharedPrefix, word);
        }
        path.push_back(std::move(segment));
    }
    return path;
}

std::vector<CandidatePattern> CommandTree::candidatesFor(const CommandDescriptor& descriptor) {
    // The leading items of every pattern spell out the prefix already
    // encoded by the node's position in the tree.
    const size_t prefixLength = utils::split_words(descriptor.sharedPrefix).size();

    std::vector<CandidatePattern> candidates;
    candidates.reserve(descriptor.parsedPatterns.size());

    for (const auto& pattern : descriptor.parsedPatterns) {
        if (pattern.size() < prefixLength) {
            throw GrammarError("pattern of '" + descriptor.sharedPrefix +
                               "' is shorter than its shared prefix");
        }

        CandidatePattern candidate;
        candidate.reserve(pattern.size() - prefixLength);
        for (size_t i = prefixLength; i < pattern.size(); ++i) {
            const PatternItem& item = pattern[i];
            ArgumentSlot slot;
            slot.spec = classifyArgumentSpec(item.type);
            slot.key = item.key;
            slot.text = item.text;
            slot.choices = item.options;
            candidate.push_back(std::move(slot));
        }
        candidates.push_back(std::move(candidate));
    }

    return candidates;
}

bool CommandTree::insert(const CommandDescriptor& descriptor, const TreeOptions& options) {
    const std::string& prefix = descriptor.sharedPrefix;

    if (!prefix.empty() && prefix.front() == options.internalMarker) {
        LOG_DEBUG("CommandTree", "Skipping interface-local command '{}'", prefix);
        return false;
    }
    if (options.denylist.count(prefix) > 0) {
        LOG_DEBUG("CommandTree", "Skipping denylisted command '{}'", prefix);
        return false;
    }

    std::vector<std::string> path = commandPath(prefix);
    if (path.empty()) {
        throw InvalidCommandName(prefix, prefix);
    }

    LeafCommand leaf;
    leaf.descriptor = descriptor;
    leaf.candidates = candidatesFor(descriptor);

    insertAt(roots_, path, 0, std::move(leaf));
    return true;
}

CommandTree CommandTree::build(const std::vector<CommandDescriptor>& descriptors,
                               const TreeOptions& options) {
    CommandTree tree;
    size_t skipped = 0;

    for (const auto& descriptor : descriptors) {
        if (!tree.insert(descriptor, options)) {
            ++skipped;
        }
    }

    LOG_DEBUG("CommandTree", "Built {} commands from {} descriptors ({} skipped)",
             tree.commandCount(), descriptors.size(), skipped);
    return tree;
}

const CommandNode* CommandTree::find(const std::vector<std::string>& path) const {
    if (path.empty()) {
        return nullptr;
    }

    auto it = roots_.find(path.front());
    if (it == roots_.end()) {
        return nullptr;
    }

    const CommandNode* node = it->second.get();
    for (size_t i = 1; i < path.size() && node; ++i) {
        node = node->child(path[i]);
    }
    return node;
}

const CommandNode* CommandTree::find(const std::string& commandName) const {
    std::vector<std::string> path;
    for (const auto& word : utils::split_words(commandName)) {
        path.push_back(utils::keep_alpha(word));
    }
    return find(path);
}

size_t CommandTree::commandCount() const {
    return countCommands(roots_);
}

void CommandTree::insertAt(CommandMap& siblings,
                           const std::vector<std::string>& path,
                           size_t depth,
                           LeafCommand leaf) {
    const std::string& segment = path[depth];
    const bool last = depth + 1 == path.size();

    auto it = siblings.find(segment);
    if (it != siblings.end()) {
        CommandNode& node = *it->second;
        if (last) {
            node.attach(std::move(leaf));
        } else {
            insertAt(node.promote().children, path, depth + 1, std::move(leaf));
        }
        return;
    }

    if (!last) {
        auto node = std::make_unique<CommandNode>(segment, InteriorNode{});
        CommandMap& children = std::get<InteriorNode>(node->body_).children;
        siblings.emplace(segment, std::move(node));
        insertAt(children, path, depth + 1, std::move(leaf));
        return;
    }

    siblings.emplace(segment, std::make_unique<CommandNode>(segment, std::move(leaf)));
}

}  // namespace core
}  // namespace mmbind
