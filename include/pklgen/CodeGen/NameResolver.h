//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Uniqueness validation for generated Python identifiers.
///
/// Identifiers are assigned upstream (rename annotations already applied);
/// this component only verifies that no two declarations share a target
/// identifier inside one namespace.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_NAME_RESOLVER_H
#define PKLGEN_CODEGEN_NAME_RESOLVER_H

#include "pklgen/Model/Schema.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace pklgen
{

/// @brief Verifies that mappings are pairwise distinct per (namespace, identifier).
///
/// @details
/// Every colliding group produces one `NameCollisionError` listing all of its
/// declarations in input order. Groups are reported in (namespace, identifier)
/// order and joined into a single error.
///
/// @param[in] mappings Mappings to check.
/// @return Success, or the joined collision errors.
llvm::Error checkUniqueNames(llvm::ArrayRef<Mapping> mappings);

/// @brief Runs `checkUniqueNames` over the mappings of one namespace.
/// @param[in] table Mapping table.
/// @param[in] targetNamespace Namespace to check.
/// @return Success, or the joined collision errors.
llvm::Error checkNamespaceNames(const MappingTable& table, llvm::StringRef targetNamespace);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_NAME_RESOLVER_H
