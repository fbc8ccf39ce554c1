//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Generator settings files.
///
/// A settings file is a JSON object that seeds @ref PythonEmitOptions before
/// command-line flags are applied:
///
/// @code{.json}
/// {
///   "indent": 4,
///   "fileSuffix": "pkl",
///   "outputDirectory": "gen",
///   "dryRun": false,
///   "noOverwrite": false,
///   "headerLines": ["# Generated. DO NOT EDIT."]
/// }
/// @endcode
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_GENERATOR_SETTINGS_H
#define PKLGEN_CODEGEN_GENERATOR_SETTINGS_H

#include "pklgen/CodeGen/PythonEmitter.h"

#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace pklgen
{
class DiagnosticEngine;

/// @brief Largest accepted indent width, in spaces.
inline constexpr std::int64_t kMaxIndentWidth = 16;

/// @brief Builds an indent unit of @p width spaces.
/// @param[in] width Width in spaces, 1 to @ref kMaxIndentWidth.
/// @return Indent string, or an error for out-of-range widths.
llvm::Expected<std::string> indentUnitFromWidth(std::int64_t width);

/// @brief Applies one parsed settings object to emitter options.
///
/// @details
/// Keys that are present but of the wrong type are errors. Unknown keys are
/// reported as warnings and otherwise ignored.
///
/// @param[in] settings Parsed settings document.
/// @param[in] sourceName Settings file name for messages.
/// @param[in,out] options Options to update.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or the first invalid setting.
llvm::Error applyGeneratorSettings(const llvm::json::Value& settings,
                                   llvm::StringRef          sourceName,
                                   PythonEmitOptions&       options,
                                   DiagnosticEngine&        diagnostics);

/// @brief Reads a settings file and applies it to emitter options.
/// @param[in] path Settings file path.
/// @param[in,out] options Options to update.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or an I/O, parse, or validation error.
llvm::Error loadGeneratorSettingsFile(const std::string& path, PythonEmitOptions& options, DiagnosticEngine& diagnostics);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_GENERATOR_SETTINGS_H
