//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Python naming-policy helpers for code generation.
///
/// This interface centralizes Python identifier sanitization, case projections
/// used for enum members, and the module stem derived from a namespace name.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_NAMING_POLICY_H
#define PKLGEN_CODEGEN_NAMING_POLICY_H

#include <string>

#include "llvm/ADT/StringRef.h"

namespace pklgen
{

/// @brief Returns true when an identifier is a Python keyword.
/// @param[in] name Candidate identifier.
/// @return True when the identifier is reserved.
bool pythonIsKeyword(llvm::StringRef name);

/// @brief Sanitizes one identifier for Python.
/// @param[in] name Candidate identifier.
/// @return Python-safe identifier.
std::string pythonSanitizeIdentifier(llvm::StringRef name);

/// @brief Projects text into snake_case and sanitizes it.
/// @param[in] name Source text.
/// @return Python-safe snake_case identifier.
std::string pythonToSnakeCaseIdentifier(llvm::StringRef name);

/// @brief Projects text into UPPER_SNAKE_CASE and sanitizes it.
/// @param[in] name Source text.
/// @return Python-safe UPPER_SNAKE_CASE identifier.
std::string pythonToUpperSnakeCaseIdentifier(llvm::StringRef name);

/// @brief Returns the importable Python module stem for a namespace.
/// @param[in] targetNamespace Namespace name (may contain dots or dashes).
/// @param[in] suffix Configured file suffix, e.g. `pkl`.
/// @return `<sanitized namespace>_<suffix>`.
std::string pythonModuleStem(llvm::StringRef targetNamespace, llvm::StringRef suffix);

/// @brief Returns the generated file name for a namespace.
/// @param[in] targetNamespace Namespace name.
/// @param[in] suffix Configured file suffix.
/// @return `<module stem>.py`.
std::string pythonOutputFileName(llvm::StringRef targetNamespace, llvm::StringRef suffix);

/// @brief Quotes text as a double-quoted Python string literal.
/// @param[in] text Raw text.
/// @return Literal including quotes, with `\`, `"` and control characters escaped.
std::string pythonQuote(llvm::StringRef text);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_NAMING_POLICY_H
