//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements deterministic emission ordering for generated members.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/DependencyOrderer.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <queue>
#include <string>
#include <utility>

namespace pklgen
{
namespace
{

bool byDeclarationIndex(const GeneratedMember* lhs, const GeneratedMember* rhs)
{
    return lhs->declarationIndex < rhs->declarationIndex;
}

llvm::Error cycleError(const std::vector<const GeneratedMember*>& nodes, const std::vector<std::size_t>& inDegree)
{
    std::string names;
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        if (inDegree[i] == 0U)
        {
            continue;
        }
        if (!names.empty())
        {
            names += ", ";
        }
        names += nodes[i]->sourceKey;
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "internal error: declaration dependency cycle among: %s",
                                   names.c_str());
}

}  // namespace

llvm::Expected<std::vector<const GeneratedMember*>> orderMembers(llvm::ArrayRef<GeneratedMember> members)
{
    std::vector<const GeneratedMember*> aliases;
    std::vector<const GeneratedMember*> nodes;
    for (const GeneratedMember& member : members)
    {
        (member.isTypeAlias() ? aliases : nodes).push_back(&member);
    }
    std::stable_sort(aliases.begin(), aliases.end(), byDeclarationIndex);
    std::stable_sort(nodes.begin(), nodes.end(), byDeclarationIndex);

    std::map<std::string, std::size_t, std::less<>> nodeByKey;
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        if (!nodeByKey.emplace(nodes[i]->sourceKey, i).second)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "internal error: duplicate generated member '%s'",
                                           nodes[i]->sourceKey.c_str());
        }
    }

    std::vector<std::vector<std::size_t>> successors(nodes.size());
    std::vector<std::size_t>              inDegree(nodes.size(), 0U);
    const auto                            addEdge = [&](const std::size_t from, const std::size_t to) {
        successors[from].push_back(to);
        ++inDegree[to];
    };

    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        const GeneratedMember& node = *nodes[i];
        if (node.superclassKey)
        {
            const auto it = nodeByKey.find(*node.superclassKey);
            if (it != nodeByKey.end())
            {
                addEdge(it->second, i);
            }
        }
    }
    for (std::size_t root = 0; root < nodes.size(); ++root)
    {
        if (!nodes[root]->isModuleRoot())
        {
            continue;
        }
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            if (!nodes[i]->isModuleRoot())
            {
                addEdge(i, root);
            }
        }
    }

    // Ready members keyed by position; positions follow declaration order.
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        if (inDegree[i] == 0U)
        {
            ready.push(i);
        }
    }

    std::vector<const GeneratedMember*> ordered(aliases.begin(), aliases.end());
    ordered.reserve(members.size());
    while (!ready.empty())
    {
        const std::size_t current = ready.top();
        ready.pop();
        ordered.push_back(nodes[current]);
        for (const std::size_t next : successors[current])
        {
            if (--inDegree[next] == 0U)
            {
                ready.push(next);
            }
        }
    }

    if (ordered.size() != members.size())
    {
        return cycleError(nodes, inDegree);
    }
    return ordered;
}

}  // namespace pklgen
