//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Assembly of one generated Python module per namespace.
///
/// Generation of a namespace is all-or-nothing: a name collision, an
/// unsupported type, or an ordering failure aborts the namespace and no
/// partial document is returned.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_NAMESPACE_ASSEMBLER_H
#define PKLGEN_CODEGEN_NAMESPACE_ASSEMBLER_H

#include "pklgen/CodeGen/CodeBlock.h"
#include "pklgen/CodeGen/CodegenContext.h"
#include "pklgen/CodeGen/GeneratedMember.h"
#include "pklgen/Model/Schema.h"

#include <string>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace pklgen
{

/// @brief Module-level facts the assembler needs beyond the generated members.
struct NamespaceModuleInfo final
{
    /// @brief Source module name.
    std::string moduleName;

    /// @brief Source name of the module class, e.g. `Module`.
    std::string rootTypeName;

    /// @brief Header comment lines, emitted verbatim.
    std::vector<std::string> headerLines;
};

/// @brief Final artifact for one namespace.
struct GeneratedDocument final
{
    std::string namespaceName;

    /// @brief Output file name, `<namespace stem>_<suffix>.py`.
    std::string fileName;

    /// @brief Complete document text; ends with exactly one newline.
    std::string text;
};

/// @brief Returns the fixed import lines emitted after the header.
/// @return Preamble lines.
const std::vector<std::string>& pythonPreambleLines();

/// @brief Builds the `load_pkl` class method appended after the module class.
/// @param[in] moduleTypeName `<module>.<module class>` display name.
/// @return Loader block at indent level one.
CodeBlock buildLoaderStub(llvm::StringRef moduleTypeName);

/// @brief Concatenates header, preamble, auxiliary units, ordered bodies, and the loader.
///
/// @details
/// Auxiliary units are de-duplicated with the first occurrence winning. Bodies
/// are separated by exactly one blank line. The last member must be the module
/// class, because the loader is emitted inside its body.
///
/// @param[in] info Module facts.
/// @param[in] ctx Namespace context.
/// @param[in] ordered Members in emission order.
/// @return Assembled document, or an internal error.
llvm::Expected<GeneratedDocument> assembleDocument(const NamespaceModuleInfo&             info,
                                                   const CodegenContext&                  ctx,
                                                   llvm::ArrayRef<const GeneratedMember*> ordered);

/// @brief Generates the document for one reflected module.
///
/// @details
/// Validates the module's mappings, checks identifier uniqueness, generates
/// every declaration body, orders the members, and assembles the document.
///
/// @param[in] module Reflected module.
/// @param[in] ctx Context whose namespace is the module's namespace.
/// @param[in] headerLines Header comment lines.
/// @return Document, or the first fatal error.
llvm::Expected<GeneratedDocument> generateNamespace(const ReflectedModule&          module,
                                                    const CodegenContext&           ctx,
                                                    const std::vector<std::string>& headerLines);

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_NAMESPACE_ASSEMBLER_H
