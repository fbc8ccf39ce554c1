//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Python naming-policy helpers for code generation.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/NamingPolicy.h"

#include <cctype>
#include <cstddef>
#include <string>

#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

namespace pklgen
{
namespace
{

const llvm::StringSet<>& keywordSet()
{
    static const llvm::StringSet<> pyKeywords = {"False",  "None",     "True",  "and",    "as",       "assert",
                                                 "async",  "await",    "break", "class",  "continue", "def",
                                                 "del",    "elif",     "else",  "except", "finally",  "for",
                                                 "from",   "global",   "if",    "import", "in",       "is",
                                                 "lambda", "nonlocal", "not",   "or",     "pass",     "raise",
                                                 "return", "try",      "while", "with",   "yield",    "match",
                                                 "case"};
    return pyKeywords;
}

std::string normalizeSnakeCase(llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size() + 8);

    bool prevUnderscore = false;
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        const char c    = name[i];
        const char prev = (i > 0) ? name[i - 1] : '\0';
        const char next = (i + 1 < name.size()) ? name[i + 1] : '\0';
        if (!std::isalnum(static_cast<unsigned char>(c)))
        {
            if (!out.empty() && !prevUnderscore)
            {
                out.push_back('_');
                prevUnderscore = true;
            }
            continue;
        }

        if (std::isupper(static_cast<unsigned char>(c)))
        {
            const bool boundary =
                std::islower(static_cast<unsigned char>(prev)) || std::isdigit(static_cast<unsigned char>(prev)) ||
                (std::isupper(static_cast<unsigned char>(prev)) && std::islower(static_cast<unsigned char>(next)));
            if (!out.empty() && !prevUnderscore && boundary)
            {
                out.push_back('_');
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            prevUnderscore = false;
        }
        else
        {
            out.push_back(c);
            prevUnderscore = false;
        }
    }
    while (!out.empty() && out.back() == '_')
    {
        out.pop_back();
    }
    return out;
}

}  // namespace

bool pythonIsKeyword(const llvm::StringRef name)
{
    return keywordSet().contains(name);
}

std::string pythonSanitizeIdentifier(llvm::StringRef name)
{
    std::string out = name.str();
    if (out.empty())
    {
        return "_";
    }
    for (char& c : out)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
        {
            c = '_';
        }
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    if (pythonIsKeyword(out))
    {
        out += "_";
    }
    return out;
}

std::string pythonToSnakeCaseIdentifier(const llvm::StringRef name)
{
    auto out = normalizeSnakeCase(name);
    if (out.empty())
    {
        out = "_";
    }
    return pythonSanitizeIdentifier(out);
}

std::string pythonToUpperSnakeCaseIdentifier(const llvm::StringRef name)
{
    auto out = pythonToSnakeCaseIdentifier(name);
    for (char& c : out)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string pythonModuleStem(const llvm::StringRef targetNamespace, const llvm::StringRef suffix)
{
    std::string stem = pythonSanitizeIdentifier(targetNamespace);
    if (!suffix.empty())
    {
        stem += "_";
        stem += suffix.str();
    }
    return stem;
}

std::string pythonOutputFileName(const llvm::StringRef targetNamespace, const llvm::StringRef suffix)
{
    return pythonModuleStem(targetNamespace, suffix) + ".py";
}

std::string pythonQuote(llvm::StringRef text)
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    os << '"';
    for (const char c : text)
    {
        switch (c)
        {
        case '\\':
            os << "\\\\";
            break;
        case '"':
            os << "\\\"";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20U)
            {
                os << "\\x" << llvm::format_hex_no_prefix(static_cast<unsigned char>(c), 2);
            }
            else
            {
                os << c;
            }
            break;
        }
    }
    os << '"';
    os.flush();
    return out;
}

}  // namespace pklgen
