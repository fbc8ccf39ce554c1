//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements namespace validation, member generation, and document assembly.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/NamespaceAssembler.h"

#include "pklgen/CodeGen/BodyGenerators.h"
#include "pklgen/CodeGen/DependencyOrderer.h"
#include "pklgen/CodeGen/NameResolver.h"
#include "pklgen/CodeGen/NamingPolicy.h"

#include <cstddef>
#include <set>
#include <utility>

namespace pklgen
{
namespace
{

llvm::Error validateModuleMappings(const ReflectedModule& module, const CodegenContext& ctx)
{
    std::size_t rootCount = 0;
    for (const Declaration& decl : module.declarations)
    {
        if (decl.kind == DeclarationKind::Module)
        {
            ++rootCount;
        }

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
        if (mapping->targetNamespace != ctx.namespaceName())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: '%s' maps to namespace '%s' but module '%s' generates namespace '%s'",
                                           decl.location.str().c_str(),
                                           key.c_str(),
                                           mapping->targetNamespace.c_str(),
                                           module.name.c_str(),
                                           ctx.namespaceName().c_str());
        }
    }

    if (rootCount != 1U)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "module '%s' must declare exactly one module class, found %zu",
                                       module.name.c_str(),
                                       rootCount);
    }
    return llvm::Error::success();
}

}  // namespace

const std::vector<std::string>& pythonPreambleLines()
{
    static const std::vector<std::string> kPreamble = {
        "from __future__ import annotations",
        "from typing import Any, Callable, Dict, List, Literal, Optional, Set, Tuple, Union",
        "from dataclasses import dataclass",
        "import re",
        "import pkl",
    };
    return kPreamble;
}

CodeBlock buildLoaderStub(llvm::StringRef moduleTypeName)
{
    CodeBlock loader;
    loader.indent();
    loader.line("@classmethod");
    loader.line("def load_pkl(cls, source):");
    loader.indent();
    loader.line("# Load the Pkl module at the given source and evaluate it into `" + moduleTypeName.str() + "`.");
    loader.line("# - Parameter source: The source of the Pkl module.");
    loader.line("config = pkl.load(source, parser=pkl.Parser(namespace = globals()))");
    loader.line("return config");
    return loader;
}

llvm::Expected<GeneratedDocument> assembleDocument(const NamespaceModuleInfo&             info,
                                                   const CodegenContext&                  ctx,
                                                   llvm::ArrayRef<const GeneratedMember*> ordered)
{
    if (ordered.empty() || !ordered.back()->isModuleRoot())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "internal error: module class of '%s' is not the last emitted member",
                                       info.moduleName.c_str());
    }

    CodeBlock document;
    for (const std::string& line : info.headerLines)
    {
        document.line(line);
    }
    for (const std::string& line : pythonPreambleLines())
    {
        document.line(line);
    }

    std::set<std::string> seenAux;
    for (const GeneratedMember* member : ordered)
    {
        for (const std::string& unit : member->topLevelAux)
        {
            if (seenAux.insert(unit).second)
            {
                document.text(unit);
            }
        }
    }

    document.blank();
    document.blank();
    for (std::size_t i = 0; i < ordered.size(); ++i)
    {
        if (i > 0)
        {
            document.blank();
        }
        document.append(ordered[i]->body);
    }

    document.blank();
    document.append(buildLoaderStub(info.moduleName + "." + info.rootTypeName));

    GeneratedDocument out;
    out.namespaceName = ctx.namespaceName();
    out.fileName      = pythonOutputFileName(ctx.namespaceName(), ctx.fileSuffix());
    out.text          = document.str(ctx.indentUnit());
    return out;
}

llvm::Expected<GeneratedDocument> generateNamespace(const ReflectedModule&          module,
                                                    const CodegenContext&           ctx,
                                                    const std::vector<std::string>& headerLines)
{
    if (auto err = validateModuleMappings(module, ctx))
    {
        return std::move(err);
    }
    if (auto err = checkNamespaceNames(ctx.mappings(), ctx.namespaceName()))
    {
        return std::move(err);
    }

    NamespaceModuleInfo info;
    info.moduleName  = module.name;
    info.headerLines = headerLines;

    std::vector<GeneratedMember> members;
    members.reserve(module.declarations.size());
    for (std::size_t i = 0; i < module.declarations.size(); ++i)
    {
        const Declaration& decl = module.declarations[i];
        if (decl.kind == DeclarationKind::Module)
        {
            info.rootTypeName = decl.name;
        }

        auto member = generateMember(decl, i, ctx);
        if (!member)
        {
            return member.takeError();
        }
        members.push_back(std::move(*member));
    }

    auto ordered = orderMembers(members);
    if (!ordered)
    {
        return ordered.takeError();
    }
    return assembleDocument(info, ctx, *ordered);
}

}  // namespace pklgen
