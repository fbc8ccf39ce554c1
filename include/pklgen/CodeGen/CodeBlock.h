//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Structured line/indent builder for generated Python source.
///
/// Generators describe code as ordered lines with an indent level. The indent
/// string is applied only when the block is rendered, so blocks can be nested
/// at any depth without re-indenting text.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_CODE_BLOCK_H
#define PKLGEN_CODEGEN_CODE_BLOCK_H

#include <cstdint>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace llvm
{
class raw_ostream;
}  // namespace llvm

namespace pklgen
{

/// @brief One generated line. Blank lines have empty text and never carry indentation.
struct CodeLine final
{
    std::uint32_t indent{0};
    std::string   text;
};

/// @brief Ordered list of generated lines.
class CodeBlock final
{
public:
    /// @brief Appends one line at the current indent level.
    CodeBlock& line(std::string text);

    /// @brief Appends an empty line.
    CodeBlock& blank();

    /// @brief Splits multi-line text on `\n` and appends each piece at the current level.
    CodeBlock& text(llvm::StringRef multiLineText);

    /// @brief Appends another block, shifted by the current level plus `extraIndent`.
    CodeBlock& append(const CodeBlock& other, std::uint32_t extraIndent = 0);

    CodeBlock& indent();

    /// @brief Decreases the current level; stays at zero when already there.
    CodeBlock& dedent();

    [[nodiscard]] std::uint32_t level() const
    {
        return level_;
    }

    [[nodiscard]] bool empty() const
    {
        return lines_.empty();
    }

    [[nodiscard]] const std::vector<CodeLine>& lines() const
    {
        return lines_;
    }

    /// @brief Writes every line followed by `\n`.
    /// @param[in,out] os Output stream.
    /// @param[in] indentUnit String emitted once per indent level.
    void render(llvm::raw_ostream& os, llvm::StringRef indentUnit) const;

    /// @brief Renders the block to a string.
    /// @param[in] indentUnit String emitted once per indent level.
    /// @return Rendered text; every line, including the last, ends with `\n`.
    [[nodiscard]] std::string str(llvm::StringRef indentUnit) const;

private:
    std::vector<CodeLine> lines_;
    std::uint32_t         level_{0};
};

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_CODE_BLOCK_H
