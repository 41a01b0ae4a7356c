/**
 * @file code_writer.hpp
 * @brief Indentation-aware line writer for generated C++.
 *
 * Braced blocks are RAII guards, so an early return in the renderer can
 * never leave a brace unclosed:
 *
 * @code
 * CodeWriter out(stream);
 * {
 *     auto cls = out.openBlock("class Foo", "};");
 *     out.writeLine("int x = 0;");
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/codegen/export.hpp"

#include <ostream>
#include <string>

namespace mmbind {
namespace codegen {

class CodeWriter;

/**
 * @class Block
 * @brief Closes a block opened by CodeWriter::openBlock() on destruction.
 */
class MMBIND_CODEGEN_API Block {
public:
    Block(CodeWriter* writer, std::string closer, bool indented = true);
    ~Block();

    // Non-copyable
    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    // Movable
    Block(Block&& other) noexcept;
    Block& operator=(Block&&) = delete;

private:
    CodeWriter* writer_;
    std::string closer_;
    bool indented_;
};

/**
 * @class CodeWriter
 * @brief Writes lines at the current indentation.
 */
class MMBIND_CODEGEN_API CodeWriter {
public:
    explicit CodeWriter(std::ostream& output, std::string indentString = "    ");

    // Non-copyable (output stream reference)
    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    /// Write a line with current indentation; empty lines carry no indent
    void writeLine(const std::string& line);

    void writeBlankLine();

    /**
     * @brief Write multi-line text as a doc comment ("/// ..." lines).
     */
    void writeDocComment(const std::string& text);

    /**
     * @brief Write "header {" and indent; the guard writes @p closer.
     */
    Block openBlock(const std::string& header, const std::string& closer = "}");

    /**
     * @brief Open a namespace; its contents are not indented.
     */
    Block openNamespace(const std::string& name);

    /**
     * @brief Write an access specifier ("public:") one level out.
     */
    void writeAccess(const std::string& specifier);

    void indent();
    void unindent();
    size_t indentLevel() const { return indentLevel_; }

private:
    std::ostream& output_;
    std::string indentString_;
    size_t indentLevel_ = 0;
};

}  // namespace codegen
}  // namespace mmbind
