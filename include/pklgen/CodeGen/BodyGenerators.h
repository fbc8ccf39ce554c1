//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-kind body generators for type aliases, enums, and dataclasses.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_BODY_GENERATORS_H
#define PKLGEN_CODEGEN_BODY_GENERATORS_H

#include "pklgen/CodeGen/CodegenContext.h"
#include "pklgen/CodeGen/GeneratedMember.h"
#include "pklgen/Model/Schema.h"

#include <cstddef>

#include "llvm/Support/Error.h"

namespace pklgen
{

/// @brief Generates `Name = <type>`.
llvm::Expected<GeneratedMember> generateTypeAlias(const Declaration&    decl,
                                                  std::size_t           declarationIndex,
                                                  const CodegenContext& ctx);

/// @brief Generates a `str`-backed `Enum` subclass with one member per literal value.
llvm::Expected<GeneratedMember> generateEnum(const Declaration&    decl,
                                             std::size_t           declarationIndex,
                                             const CodegenContext& ctx);

/// @brief Generates a `@dataclass` for a class or the module class.
///
/// @details
/// Hidden properties are skipped. Every class records its qualified source
/// name in `_registered_identifier` so the runtime decoder can map evaluated
/// objects back to the generated type.
llvm::Expected<GeneratedMember> generateDataclass(const Declaration&    decl,
                                                  std::size_t           declarationIndex,
                                                  const CodegenContext& ctx);

/// @brief Dispatches to the generator of the declaration's kind.
/// @param[in] decl Declaration.
/// @param[in] declarationIndex Position of the declaration in reflected order.
/// @param[in] ctx Namespace context.
/// @return Generated member, or the first rendering error.
llvm::Expected<GeneratedMember> generateMember(const Declaration&    decl,
                                               std::size_t           declarationIndex,
                                               const CodegenContext& ctx);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_BODY_GENERATORS_H
