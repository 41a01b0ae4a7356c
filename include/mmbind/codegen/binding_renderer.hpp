/**
 * @file binding_renderer.hpp
 * @brief Renders a command tree as a C++ binding header.
 *
 * For a tree holding "vm info" and "vm launch" the output looks like:
 *
 * @code
 * namespace minimega {
 * class Api {
 * public:
 *     class VmCommand {
 *     public:
 *         class InfoCommand : public mmbind::client::CommandHandle { ... };
 *         ...
 *         InfoCommand info;
 *         LaunchCommand launch;
 *     };
 *
 *     explicit Api(mmbind::client::Connection& connection);
 *     VmCommand vm;
 * };
 * }
 * @endcode
 *
 * so that callers write api.vm.info("summary").
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/codegen/code_writer.hpp"
#include "mmbind/codegen/export.hpp"
#include "mmbind/codegen/generator_config.hpp"

#include <mmbind/core/command_tree.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace mmbind {
namespace codegen {

/**
 * @class BindingRenderer
 * @brief Emits one class per tree node, nested as in the tree.
 *
 * Invocable nodes derive from mmbind::client::CommandHandle and carry a
 * static table of their candidate patterns; interior nodes expose their
 * children as public members.
 */
class MMBIND_CODEGEN_API BindingRenderer {
public:
    /**
     * @throws std::invalid_argument if the namespace or class name in
     *         @p config is not a valid C++ identifier.
     */
    explicit BindingRenderer(GeneratorConfig config);

    void render(const core::CommandTree& tree, std::ostream& out) const;

    std::string render(const core::CommandTree& tree) const;

    const GeneratorConfig& config() const { return config_; }

    /// "info" -> "InfoCommand"
    static std::string className(const std::string& identifier);

    /// Member name for a node; keywords and CommandHandle members get a '_'
    static std::string memberName(const std::string& identifier);

    /// C++ string literal for @p text, quotes included
    static std::string quote(const std::string& text);

    static bool isIdentifier(const std::string& name);

private:
    void renderHeader(CodeWriter& out) const;
    void renderCandidates(CodeWriter& out,
                          const core::CommandMap& nodes,
                          const std::vector<std::string>& path) const;
    void renderCandidateTable(CodeWriter& out,
                              const core::LeafCommand& command,
                              const std::string& function) const;
    void renderNode(CodeWriter& out,
                    const core::CommandNode& node,
                    const std::string& nodeClass,
                    const std::vector<std::string>& path) const;
    void renderMembers(CodeWriter& out,
                       const core::CommandMap& children,
                       const std::string& ownerClass,
                       const std::vector<std::string>& path,
                       const core::LeafCommand* command) const;

    GeneratorConfig config_;
};

}  // namespace codegen
}  // namespace mmbind
