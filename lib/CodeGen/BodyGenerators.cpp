//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements per-kind Python body generators.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/BodyGenerators.h"

#include "pklgen/CodeGen/NamingPolicy.h"
#include "pklgen/CodeGen/TypeRenderer.h"

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

namespace pklgen
{
namespace
{

/// Class attribute naming the Pkl declaration a dataclass decodes.
constexpr const char* kRegisteredIdentifierField = "_registered_identifier";

llvm::Expected<GeneratedMember> startMember(const Declaration&    decl,
                                            const std::size_t     declarationIndex,
                                            const CodegenContext& ctx)
{
    const std::string key     = decl.qualifiedName();
    const Mapping*    mapping = ctx.findMapping(key);
    if (mapping == nullptr)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: no mapping for %s '%s'",
                                       decl.location.str().c_str(),
                                       declarationKindName(decl.kind).str().c_str(),
                                       key.c_str());
    }

    GeneratedMember member;
    member.targetName       = mapping->targetName;
    member.kind             = decl.kind;
    member.sourceKey        = key;
    member.declarationIndex = declarationIndex;
    return member;
}

void addImport(GeneratedMember& member, const std::string& module)
{
    const std::string line = "import " + module;
    if (std::find(member.topLevelAux.begin(), member.topLevelAux.end(), line) == member.topLevelAux.end())
    {
        member.topLevelAux.push_back(line);
    }
}

void addForeignImports(GeneratedMember& member, const TypeExpr& type, const CodegenContext& ctx)
{
    for (const std::string& ns : collectForeignNamespaces(type, ctx))
    {
        addImport(member, ctx.moduleStem(ns));
    }
}

llvm::Expected<std::string> renderDeclarationType(const TypeExprPtr&    type,
                                                  const SourceLocation& owner,
                                                  llvm::StringRef       what,
                                                  const CodegenContext& ctx)
{
    if (!type)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: %s has no type",
                                       owner.str().c_str(),
                                       what.str().c_str());
    }
    return renderPythonType(*type, ctx);
}

void emitCommentLines(CodeBlock& block, llvm::StringRef text)
{
    llvm::SmallVector<llvm::StringRef, 8> pieces;
    text.split(pieces, '\n');
    for (const llvm::StringRef piece : pieces)
    {
        const llvm::StringRef trimmed = piece.rtrim();
        block.line(trimmed.empty() ? std::string("#") : "# " + trimmed.str());
    }
}

void emitDocstring(CodeBlock& block, llvm::StringRef text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text.rtrim())
    {
        if (c == '\\')
        {
            escaped += "\\\\";
        }
        else if (c == '"')
        {
            escaped += "\\\"";
        }
        else
        {
            escaped.push_back(c);
        }
    }

    if (llvm::StringRef(escaped).contains('\n'))
    {
        block.line("\"\"\"");
        block.text(escaped);
        block.line("\"\"\"");
        return;
    }
    block.line("\"\"\"" + escaped + "\"\"\"");
}

}  // namespace

llvm::Expected<GeneratedMember> generateTypeAlias(const Declaration&    decl,
                                                  const std::size_t     declarationIndex,
                                                  const CodegenContext& ctx)
{
    auto member = startMember(decl, declarationIndex, ctx);
    if (!member)
    {
        return member.takeError();
    }

    auto rendered = renderDeclarationType(decl.aliasedType, decl.location, "typealias " + decl.name, ctx);
    if (!rendered)
    {
        return rendered.takeError();
    }

    if (decl.docComment)
    {
        emitCommentLines(member->body, *decl.docComment);
    }
    member->body.line(member->targetName + " = " + *rendered);
    addForeignImports(*member, *decl.aliasedType, ctx);
    return member;
}

llvm::Expected<GeneratedMember> generateEnum(const Declaration&    decl,
                                             const std::size_t     declarationIndex,
                                             const CodegenContext& ctx)
{
    auto member = startMember(decl, declarationIndex, ctx);
    if (!member)
    {
        return member.takeError();
    }

    CodeBlock& body = member->body;
    body.line("class " + member->targetName + "(str, Enum):");
    body.indent();
    if (decl.docComment)
    {
        emitDocstring(body, *decl.docComment);
    }
    if (decl.enumValues.empty() && !decl.docComment)
    {
        body.line("pass");
    }

    std::set<std::string> usedNames;
    for (const std::string& value : decl.enumValues)
    {
        std::string name = pythonToUpperSnakeCaseIdentifier(value);
        if (!usedNames.insert(name).second)
        {
            std::size_t suffix = 2;
            while (!usedNames.insert(name + "_" + std::to_string(suffix)).second)
            {
                ++suffix;
            }
            name += "_" + std::to_string(suffix);
        }
        body.line(name + " = " + pythonQuote(value));
    }
    body.dedent();

    member->topLevelAux.push_back("from enum import Enum");
    return member;
}

llvm::Expected<GeneratedMember> generateDataclass(const Declaration&    decl,
                                                  const std::size_t     declarationIndex,
                                                  const CodegenContext& ctx)
{
    auto member = startMember(decl, declarationIndex, ctx);
    if (!member)
    {
        return member.takeError();
    }

    std::string header = "class " + member->targetName;
    if (decl.superclass)
    {
        const Mapping* superMapping = ctx.findMapping(*decl.superclass);
        if (superMapping == nullptr)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: superclass '%s' of '%s' has no mapping",
                                           decl.location.str().c_str(),
                                           decl.superclass->c_str(),
                                           member->sourceKey.c_str());
        }
        if (ctx.isForeign(*superMapping))
        {
            const std::string stem = ctx.moduleStem(superMapping->targetNamespace);
            header += "(" + stem + "." + superMapping->targetName + ")";
            addImport(*member, stem);
        }
        else
        {
            header += "(" + superMapping->targetName + ")";
        }
        member->superclassKey = *decl.superclass;
    }

    CodeBlock& body = member->body;
    body.line("@dataclass");
    body.line(header + ":");
    body.indent();
    if (decl.docComment)
    {
        emitDocstring(body, *decl.docComment);
    }

    bool                                                    anyField = false;
    std::map<std::string, const PropertyDecl*, std::less<>> fieldOwners;
    for (const PropertyDecl& property : decl.properties)
    {
        if (property.isHidden)
        {
            continue;
        }

        const std::string fieldName = pythonSanitizeIdentifier(property.name);
        if (fieldName == kRegisteredIdentifierField)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: property '%s' of '%s' maps to reserved Python field '%s'",
                                           property.location.str().c_str(),
                                           property.name.c_str(),
                                           member->sourceKey.c_str(),
                                           fieldName.c_str());
        }
        const auto [owner, inserted] = fieldOwners.emplace(fieldName, &property);
        if (!inserted)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: property '%s' of '%s' maps to Python field '%s' already used by "
                                           "property '%s' (%s)",
                                           property.location.str().c_str(),
                                           property.name.c_str(),
                                           member->sourceKey.c_str(),
                                           fieldName.c_str(),
                                           owner->second->name.c_str(),
                                           owner->second->location.str().c_str());
        }

        auto rendered = renderDeclarationType(property.type, property.location, "property " + property.name, ctx);
        if (!rendered)
        {
            return rendered.takeError();
        }
        if (property.docComment)
        {
            emitCommentLines(body, *property.docComment);
        }
        body.line(fieldName + ": " + *rendered);
        addForeignImports(*member, *property.type, ctx);
        anyField = true;
    }
    if (anyField || decl.docComment)
    {
        body.blank();
    }
    body.line(std::string(kRegisteredIdentifierField) + " = " + pythonQuote(member->sourceKey));
    body.dedent();
    return member;
}

llvm::Expected<GeneratedMember> generateMember(const Declaration&    decl,
                                               const std::size_t     declarationIndex,
                                               const CodegenContext& ctx)
{
    switch (decl.kind)
    {
    case DeclarationKind::TypeAlias:
        return generateTypeAlias(decl, declarationIndex, ctx);
    case DeclarationKind::Enum:
        return generateEnum(decl, declarationIndex, ctx);
    case DeclarationKind::Module:
    case DeclarationKind::Class:
        break;
    }
    return generateDataclass(decl, declarationIndex, ctx);
}

}  // namespace pklgen
