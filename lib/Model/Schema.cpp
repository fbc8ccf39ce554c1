//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements reflected schema helpers and the mapping lookup table.
///
//===----------------------------------------------------------------------===//

#include "pklgen/Model/Schema.h"

#include <utility>

namespace pklgen
{

llvm::StringRef declarationKindName(const DeclarationKind kind)
{
    switch (kind)
    {
    case DeclarationKind::Module:
        return "module";
    case DeclarationKind::Class:
        return "class";
    case DeclarationKind::Enum:
        return "enum";
    case DeclarationKind::TypeAlias:
        return "typealias";
    }
    return "class";
}

std::string Declaration::qualifiedName() const
{
    if (kind == DeclarationKind::Module)
    {
        return moduleName;
    }
    return moduleName + "#" + name;
}

MappingTable::MappingTable(std::vector<Mapping> mappings)
    : mappings_(std::move(mappings))
{
    for (std::size_t i = 0; i < mappings_.size(); ++i)
    {
        // First entry wins; the schema reader rejects duplicate sources.
        indexByQualifiedName_.emplace(mappings_[i].sourceQualifiedName, i);
    }
}

const Mapping* MappingTable::find(llvm::StringRef qualifiedName) const
{
    const auto it = indexByQualifiedName_.find(qualifiedName);
    if (it == indexByQualifiedName_.end())
    {
        return nullptr;
    }
    return &mappings_[it->second];
}

std::vector<Mapping> MappingTable::inNamespace(llvm::StringRef targetNamespace) const
{
    std::vector<Mapping> out;
    for (const Mapping& mapping : mappings_)
    {
        if (mapping.targetNamespace == targetNamespace)
        {
            out.push_back(mapping);
        }
    }
    return out;
}

Mapping makeDefaultMapping(const Declaration& decl, const std::string& targetNamespace)
{
    Mapping mapping;
    mapping.sourceKind          = decl.kind;
    mapping.sourceQualifiedName = decl.qualifiedName();
    mapping.sourceLocation      = decl.location;
    mapping.targetNamespace     = targetNamespace;
    mapping.targetName          = decl.kind == DeclarationKind::Module ? "ModuleClass" : decl.name;
    return mapping;
}

}  // namespace pklgen
