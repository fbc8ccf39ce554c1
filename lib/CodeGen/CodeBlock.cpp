//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the structured line/indent builder.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/CodeBlock.h"

#include <utility>

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"

namespace pklgen
{

CodeBlock& CodeBlock::line(std::string text)
{
    if (text.empty())
    {
        return blank();
    }
    lines_.push_back(CodeLine{level_, std::move(text)});
    return *this;
}

CodeBlock& CodeBlock::blank()
{
    lines_.push_back(CodeLine{0, std::string()});
    return *this;
}

CodeBlock& CodeBlock::text(llvm::StringRef multiLineText)
{
    llvm::SmallVector<llvm::StringRef, 8> pieces;
    multiLineText.split(pieces, '\n');
    for (const llvm::StringRef piece : pieces)
    {
        line(piece.rtrim().str());
    }
    return *this;
}

CodeBlock& CodeBlock::append(const CodeBlock& other, const std::uint32_t extraIndent)
{
    for (const CodeLine& l : other.lines_)
    {
        if (l.text.empty())
        {
            blank();
            continue;
        }
        lines_.push_back(CodeLine{level_ + extraIndent + l.indent, l.text});
    }
    return *this;
}

CodeBlock& CodeBlock::indent()
{
    ++level_;
    return *this;
}

CodeBlock& CodeBlock::dedent()
{
    if (level_ > 0)
    {
        --level_;
    }
    return *this;
}

void CodeBlock::render(llvm::raw_ostream& os, llvm::StringRef indentUnit) const
{
    for (const CodeLine& l : lines_)
    {
        if (!l.text.empty())
        {
            for (std::uint32_t i = 0; i < l.indent; ++i)
            {
                os << indentUnit;
            }
            os << l.text;
        }
        os << '\n';
    }
}

std::string CodeBlock::str(llvm::StringRef indentUnit) const
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    render(os, indentUnit);
    os.flush();
    return out;
}

}  // namespace pklgen
