/**
 * @file binding_renderer.cpp
 * @brief C++ binding header emission.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/codegen/binding_renderer.hpp"

#include <mmbind/utils/logger.hpp>
#include <mmbind/utils/string_utils.hpp>

#include <cctype>
#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

namespace mmbind {
namespace codegen {

namespace {

const std::set<std::string>& cppKeywords() {
    static const std::set<std::string> keywords = {
        "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
        "bool", "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t",
        "class", "compl", "concept", "const", "consteval", "constexpr", "constinit",
        "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype",
        "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
        "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
        "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
        "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
        "protected", "public", "register", "reinterpret_cast", "requires", "return",
        "short", "signed", "sizeof", "static", "static_assert", "static_cast",
        "struct", "switch", "template", "this", "thread_local", "throw", "true",
        "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
        "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
    };
    return keywords;
}

// Members of CommandHandle a child member must not hide
const std::set<std::string>& handleMembers() {
    static const std::set<std::string> members = {"name", "candidates", "stream", "tokens"};
    return members;
}

const char* kindEnumerator(core::ArgumentKind kind) {
    switch (kind) {
        case core::ArgumentKind::LITERAL:    return "ArgumentKind::LITERAL";
        case core::ArgumentKind::SUBCOMMAND: return "ArgumentKind::SUBCOMMAND";
        case core::ArgumentKind::STRING:     return "ArgumentKind::STRING";
        case core::ArgumentKind::CHOICE:     return "ArgumentKind::CHOICE";
        case core::ArgumentKind::LIST:       return "ArgumentKind::LIST";
    }
    return "ArgumentKind::STRING";
}

std::string candidatesFunction(const std::vector<std::string>& path) {
    return "candidates_" + utils::join(path, "_");
}

std::string childClassName(const std::string& identifier, const std::string& ownerClass) {
    std::string name = BindingRenderer::className(identifier);
    // A nested class may not share its enclosing class's name
    if (name == ownerClass) {
        name += '_';
    }
    return name;
}

std::string childMemberName(const std::string& identifier, const std::string& ownerClass) {
    std::string name = BindingRenderer::memberName(identifier);
    if (name == ownerClass) {
        name += '_';
    }
    return name;
}

std::string singleLine(const std::string& text) {
    std::string result = text;
    for (auto& c : result) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return result;
}

std::vector<std::string> childPath(const std::vector<std::string>& path, const std::string& id) {
    std::vector<std::string> result = path;
    result.push_back(id);
    return result;
}

}  // namespace

BindingRenderer::BindingRenderer(GeneratorConfig config)
    : config_(std::move(config))
{
    if (!isIdentifier(config_.className)) {
        throw std::invalid_argument("invalid class name '" + config_.className + "'");
    }

    std::string rest = config_.namespaceName;
    size_t pos = 0;
    do {
        pos = rest.find("::");
        if (!isIdentifier(rest.substr(0, pos))) {
            throw std::invalid_argument("invalid namespace '" + config_.namespaceName + "'");
        }
        if (pos != std::string::npos) {
            rest = rest.substr(pos + 2);
        }
    } while (pos != std::string::npos);
}

// =============================================================================
// Naming
// =============================================================================

std::string BindingRenderer::className(const std::string& identifier) {
    std::string name = identifier;
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name + "Command";
}

std::string BindingRenderer::memberName(const std::string& identifier) {
    if (cppKeywords().count(identifier) > 0 || handleMembers().count(identifier) > 0) {
        return identifier + "_";
    }
    return identifier;
}

bool BindingRenderer::isIdentifier(const std::string& name) {
    if (name.empty() || cppKeywords().count(name) > 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string BindingRenderer::quote(const std::string& text) {
    std::string result = "\"";
    for (char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\%03o",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += escaped;
                } else {
                    result += c;
                }
        }
    }
    result += '"';
    return result;
}

// =============================================================================
// Rendering
// =============================================================================

std::string BindingRenderer::render(const core::CommandTree& tree) const {
    std::ostringstream out;
    render(tree, out);
    return out.str();
}

void BindingRenderer::render(const core::CommandTree& tree, std::ostream& stream) const {
    CodeWriter out(stream);

    renderHeader(out);

    {
        auto ns = out.openNamespace(config_.namespaceName);
        out.writeBlankLine();

        out.writeLine("constexpr const char* GENERATOR_VERSION = " +
                      quote(config_.generatorVersion) + ";");
        out.writeLine("constexpr const char* DAEMON_VERSION = " +
                      quote(config_.daemonVersion) + ";");
        out.writeBlankLine();

        {
            auto detail = out.openNamespace("detail");
            out.writeBlankLine();
            out.writeLine("using mmbind::core::ArgumentKind;");
            out.writeLine("using mmbind::core::CandidatePattern;");
            out.writeBlankLine();
            renderCandidates(out, tree.roots(), {});
        }
        out.writeBlankLine();

        out.writeLine("/// Entry point: one member per top-level command or namespace.");
        {
            auto cls = out.openBlock("class " + config_.className, "};");
            out.writeAccess("public:");
            renderMembers(out, tree.roots(), config_.className, {}, nullptr);
        }
        out.writeBlankLine();
    }

    LOG_DEBUG("Renderer", "Rendered {} commands into {}::{}", tree.commandCount(),
             config_.namespaceName, config_.className);
}

void BindingRenderer::renderHeader(CodeWriter& out) const {
    out.writeLine("// Generated by mmbind-gen " + singleLine(config_.generatorVersion) +
                  ". Do not edit.");
    out.writeLine("// Daemon version: " + singleLine(config_.daemonVersion));
    out.writeBlankLine();
    out.writeLine("#pragma once");
    out.writeBlankLine();
    out.writeLine("#include <mmbind_client/command_handle.hpp>");
    out.writeLine("#include <mmbind_client/connection.hpp>");
    out.writeLine("#include <mmbind/core/argument_type.hpp>");
    out.writeBlankLine();
    out.writeLine("#include <vector>");
    out.writeBlankLine();
}

void BindingRenderer::renderCandidates(CodeWriter& out,
                                       const core::CommandMap& nodes,
                                       const std::vector<std::string>& path) const {
    for (const auto& [id, node] : nodes) {
        const std::vector<std::string> nodePath = childPath(path, id);
        if (const core::LeafCommand* command = node->command()) {
            renderCandidateTable(out, *command, candidatesFunction(nodePath));
            out.writeBlankLine();
        }
        if (const core::CommandMap* children = node->children()) {
            renderCandidates(out, *children, nodePath);
        }
    }
}

void BindingRenderer::renderCandidateTable(CodeWriter& out,
                                           const core::LeafCommand& command,
                                           const std::string& function) const {
    for (const auto& pattern : command.descriptor.patterns) {
        out.writeLine("// " + singleLine(pattern));
    }

    auto fn = out.openBlock("inline const std::vector<CandidatePattern>& " + function + "()");
    {
        auto table = out.openBlock("static const std::vector<CandidatePattern> table =", "};");
        for (const auto& candidate : command.candidates) {
            auto pattern = out.openBlock("", "},");
            for (const auto& slot : candidate) {
                std::vector<std::string> choices;
                for (const auto& choice : slot.choices) {
                    choices.push_back(quote(choice));
                }
                out.writeLine(std::string("{{") + kindEnumerator(slot.spec.kind) + ", " +
                              (slot.spec.optional ? "true" : "false") + "}, " +
                              quote(slot.key) + ", " + quote(slot.text) + ", {" +
                              utils::join(choices, ", ") + "}},");
            }
        }
    }
    out.writeLine("return table;");
}

void BindingRenderer::renderNode(CodeWriter& out,
                                 const core::CommandNode& node,
                                 const std::string& nodeClass,
                                 const std::vector<std::string>& path) const {
    const core::LeafCommand* command = node.command();

    if (command) {
        const auto& descriptor = command->descriptor;
        if (!descriptor.helpShort.empty()) {
            out.writeDocComment(descriptor.helpShort);
        }
        if (!descriptor.helpLong.empty()) {
            if (!descriptor.helpShort.empty()) {
                out.writeLine("///");
            }
            out.writeDocComment(descriptor.helpLong);
        }
    }

    std::string header = "class " + nodeClass;
    if (command) {
        header += " : public mmbind::client::CommandHandle";
    }

    auto cls = out.openBlock(header, "};");
    out.writeAccess("public:");

    static const core::CommandMap noChildren;
    const core::CommandMap* children = node.children();
    renderMembers(out, children ? *children : noChildren, nodeClass, path, command);
}

void BindingRenderer::renderMembers(CodeWriter& out,
                                    const core::CommandMap& children,
                                    const std::string& ownerClass,
                                    const std::vector<std::string>& path,
                                    const core::LeafCommand* command) const {
    for (const auto& [id, child] : children) {
        renderNode(out, *child, childClassName(id, ownerClass), childPath(path, id));
        out.writeBlankLine();
    }

    std::vector<std::string> initializers;
    if (command) {
        initializers.push_back("CommandHandle(connection, " + quote(command->name()) +
                               ", detail::" + candidatesFunction(path) + "())");
    }
    for (const auto& entry : children) {
        initializers.push_back(childMemberName(entry.first, ownerClass) + "(connection)");
    }

    if (initializers.empty()) {
        out.writeLine("explicit " + ownerClass + "(mmbind::client::Connection& /*connection*/) {}");
    } else {
        out.writeLine("explicit " + ownerClass + "(mmbind::client::Connection& connection)");
        out.indent();
        for (size_t i = 0; i < initializers.size(); ++i) {
            out.writeLine((i == 0 ? ": " : ", ") + initializers[i]);
        }
        out.unindent();
        out.writeLine("{}");
    }

    if (!children.empty()) {
        out.writeBlankLine();
    }
    for (const auto& entry : children) {
        out.writeLine(childClassName(entry.first, ownerClass) + " " +
                      childMemberName(entry.first, ownerClass) + ";");
    }
}

}  // namespace codegen
}  // namespace mmbind
