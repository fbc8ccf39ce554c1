//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public entry points and options for Python emission.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_PYTHON_EMITTER_H
#define PKLGEN_CODEGEN_PYTHON_EMITTER_H

#include "pklgen/CodeGen/EmitCommon.h"
#include "pklgen/CodeGen/NamespaceAssembler.h"

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace pklgen
{
class DiagnosticEngine;
struct ReflectedSchema;

/// @brief Configuration options for Python code generation.
struct PythonEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief String emitted once per indent level.
    std::string indentUnit{"    "};

    /// @brief Output file suffix; files are named `<namespace>_<suffix>.py`.
    std::string fileSuffix{"pkl"};

    /// @brief Header comment lines; when empty, @ref defaultHeaderLines is used per module.
    std::vector<std::string> headerLines;

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Returns the standard "do not edit" header for one source module.
/// @param[in] moduleName Source module name.
/// @return Header comment lines.
std::vector<std::string> defaultHeaderLines(llvm::StringRef moduleName);

/// @brief Generates one document per reflected module, in module order.
/// @param[in] schema Reflected schema and its mapping table.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Generated documents, or the first fatal error.
llvm::Expected<std::vector<GeneratedDocument>> generatePython(const ReflectedSchema&   schema,
                                                              const PythonEmitOptions& options,
                                                              DiagnosticEngine&        diagnostics);

/// @brief Generates every document and writes it under @ref PythonEmitOptions::outDir.
/// @param[in] schema Reflected schema and its mapping table.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitPython(const ReflectedSchema& schema, const PythonEmitOptions& options, DiagnosticEngine& diagnostics);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_PYTHON_EMITTER_H
