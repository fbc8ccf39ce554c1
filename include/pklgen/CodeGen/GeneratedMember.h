//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Output of one per-declaration body generator.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_GENERATED_MEMBER_H
#define PKLGEN_CODEGEN_GENERATED_MEMBER_H

#include "pklgen/CodeGen/CodeBlock.h"
#include "pklgen/Model/Schema.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pklgen
{

/// @brief One generated top-level declaration of a namespace.
struct GeneratedMember final
{
    /// @brief Target Python identifier.
    std::string targetName;

    /// @brief Kind of the source declaration.
    DeclarationKind kind{DeclarationKind::Class};

    /// @brief Qualified source name; unique within a run.
    std::string sourceKey;

    /// @brief Declaration body.
    CodeBlock body;

    /// @brief Top-level text emitted once per namespace (imports, shared constants).
    std::vector<std::string> topLevelAux;

    /// @brief Qualified source name of the direct superclass, if any.
    std::optional<std::string> superclassKey;

    /// @brief Position of the source declaration in reflected order.
    std::size_t declarationIndex{0};

    [[nodiscard]] bool isModuleRoot() const
    {
        return kind == DeclarationKind::Module;
    }

    [[nodiscard]] bool isTypeAlias() const
    {
        return kind == DeclarationKind::TypeAlias;
    }
};

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_GENERATED_MEMBER_H
