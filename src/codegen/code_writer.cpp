/**
 * @file code_writer.cpp
 * @brief Line writer implementation.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/codegen/code_writer.hpp"

#include <sstream>

namespace mmbind {
namespace codegen {

// =============================================================================
// Block
// =============================================================================

Block::Block(CodeWriter* writer, std::string closer, bool indented)
    : writer_(writer)
    , closer_(std::move(closer))
    , indented_(indented)
{}

Block::~Block() {
    if (writer_) {
        if (indented_) {
            writer_->unindent();
        }
        writer_->writeLine(closer_);
    }
}

Block::Block(Block&& other) noexcept
    : writer_(other.writer_)
    , closer_(std::move(other.closer_))
    , indented_(other.indented_)
{
    other.writer_ = nullptr;
}

// =============================================================================
// CodeWriter
// =============================================================================

CodeWriter::CodeWriter(std::ostream& output, std::string indentString)
    : output_(output)
    , indentString_(std::move(indentString))
{}

void CodeWriter::writeLine(const std::string& line) {
    if (!line.empty()) {
        for (size_t i = 0; i < indentLevel_; ++i) {
            output_ << indentString_;
        }
        output_ << line;
    }
    output_ << '\n';
}

void CodeWriter::writeBlankLine() {
    output_ << '\n';
}

void CodeWriter::writeDocComment(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        // A trailing backslash would splice the next source line into the comment
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t' ||
                                 line.back() == '\r' || line.back() == '\\')) {
            line.pop_back();
        }
        writeLine(line.empty() ? "///" : "/// " + line);
    }
}

Block CodeWriter::openBlock(const std::string& header, const std::string& closer) {
    writeLine(header.empty() ? "{" : header + " {");
    indent();
    return Block(this, closer);
}

Block CodeWriter::openNamespace(const std::string& name) {
    writeLine("namespace " + name + " {");
    return Block(this, "}  // namespace " + name, false);
}

void CodeWriter::writeAccess(const std::string& specifier) {
    unindent();
    writeLine(specifier);
    indent();
}

void CodeWriter::indent() {
    ++indentLevel_;
}

void CodeWriter::unindent() {
    if (indentLevel_ > 0) {
        --indentLevel_;
    }
}

}  // namespace codegen
}  // namespace mmbind
