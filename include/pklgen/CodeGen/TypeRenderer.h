//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Projection of reflected type expressions into Python `typing` syntax.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_TYPE_RENDERER_H
#define PKLGEN_CODEGEN_TYPE_RENDERER_H

#include "pklgen/CodeGen/CodegenContext.h"
#include "pklgen/Model/TypeExpr.h"

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace pklgen
{

/// @brief Returns the Python spelling of a primitive kind.
/// @param[in] kind Primitive kind.
/// @return Python type text, e.g. `str` or `pkl.Duration`.
llvm::StringRef pythonPrimitiveSpelling(PrimitiveKind kind);

/// @brief Renders a type expression as Python type syntax.
///
/// @details
/// Declared references resolve through the context's mapping table. References
/// into another namespace are qualified with that namespace's module stem.
/// Rendering is deterministic and has no side effects.
///
/// @param[in] expr Type expression.
/// @param[in] ctx Namespace context.
/// @return Python type text, or `UnsupportedTypeError`.
llvm::Expected<std::string> renderPythonType(const TypeExpr& expr, const CodegenContext& ctx);

/// @brief Collects the foreign namespaces referenced by a type expression.
/// @param[in] expr Type expression.
/// @param[in] ctx Namespace context.
/// @return Namespace names in first-seen order, without duplicates.
std::vector<std::string> collectForeignNamespaces(const TypeExpr& expr, const CodegenContext& ctx);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_TYPE_RENDERER_H
