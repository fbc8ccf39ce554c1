//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generated-identifier uniqueness validation.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/NameResolver.h"

#include "pklgen/CodeGen/CodegenErrors.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pklgen
{

llvm::Error checkUniqueNames(llvm::ArrayRef<Mapping> mappings)
{
    std::map<std::pair<std::string, std::string>, std::vector<const Mapping*>> groups;
    for (const Mapping& mapping : mappings)
    {
        groups[{mapping.targetNamespace, mapping.targetName}].push_back(&mapping);
    }

    llvm::Error result = llvm::Error::success();
    for (const auto& [key, members] : groups)
    {
        if (members.size() < 2U)
        {
            continue;
        }

        std::vector<CollidingDeclaration> conflicts;
        conflicts.reserve(members.size());
        for (const Mapping* member : members)
        {
            conflicts.push_back(CollidingDeclaration{member->sourceKind,
                                                     member->sourceQualifiedName,
                                                     member->sourceLocation});
        }
        result = llvm::joinErrors(std::move(result),
                                  llvm::make_error<NameCollisionError>(key.first, key.second, std::move(conflicts)));
    }
    return result;
}

llvm::Error checkNamespaceNames(const MappingTable& table, llvm::StringRef targetNamespace)
{
    return checkUniqueNames(table.inNamespace(targetNamespace));
}

}  // namespace pklgen
