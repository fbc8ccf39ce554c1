//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Explicit per-namespace context shared by the code-generation components.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_CODEGEN_CONTEXT_H
#define PKLGEN_CODEGEN_CODEGEN_CONTEXT_H

#include "pklgen/CodeGen/NamingPolicy.h"
#include "pklgen/Model/Schema.h"

#include <string>
#include <utility>

#include "llvm/ADT/StringRef.h"

namespace pklgen
{

/// @brief Namespace being generated, the read-only mapping table, and formatting settings.
///
/// @details
/// The context owns no schema data; the mapping table must outlive it.
class CodegenContext final
{
public:
    CodegenContext(std::string         namespaceName,
                   const MappingTable& mappings,
                   std::string         indentUnit = "    ",
                   std::string         fileSuffix = "pkl")
        : namespaceName_(std::move(namespaceName))
        , mappings_(mappings)
        , indentUnit_(std::move(indentUnit))
        , fileSuffix_(std::move(fileSuffix))
    {
    }

    [[nodiscard]] const std::string& namespaceName() const
    {
        return namespaceName_;
    }

    [[nodiscard]] const MappingTable& mappings() const
    {
        return mappings_;
    }

    /// @brief String emitted once per indent level.
    [[nodiscard]] const std::string& indentUnit() const
    {
        return indentUnit_;
    }

    [[nodiscard]] const std::string& fileSuffix() const
    {
        return fileSuffix_;
    }

    [[nodiscard]] const Mapping* findMapping(llvm::StringRef qualifiedName) const
    {
        return mappings_.find(qualifiedName);
    }

    [[nodiscard]] bool isForeign(const Mapping& mapping) const
    {
        return mapping.targetNamespace != namespaceName_;
    }

    /// @brief Returns the importable module stem of a namespace under this context's suffix.
    [[nodiscard]] std::string moduleStem(llvm::StringRef targetNamespace) const
    {
        return pythonModuleStem(targetNamespace, fileSuffix_);
    }

private:
    std::string         namespaceName_;
    const MappingTable& mappings_;
    std::string         indentUnit_;
    std::string         fileSuffix_;
};

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_CODEGEN_CONTEXT_H
