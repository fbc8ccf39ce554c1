//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the Python emission driver.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/PythonEmitter.h"

#include "pklgen/CodeGen/CodegenContext.h"
#include "pklgen/CodeGen/NamingPolicy.h"
#include "pklgen/Model/Schema.h"
#include "pklgen/Support/Diagnostics.h"

#include <filesystem>
#include <functional>
#include <map>
#include <utility>

namespace pklgen
{
namespace
{

const Declaration* findModuleClass(const ReflectedModule& module)
{
    for (const Declaration& decl : module.declarations)
    {
        if (decl.kind == DeclarationKind::Module)
        {
            return &decl;
        }
    }
    return nullptr;
}

/// Resolves the namespace a module generates into from its module-class mapping.
llvm::Expected<std::string> moduleNamespace(const ReflectedModule& module, const MappingTable& mappings)
{
    const Declaration* root = findModuleClass(module);
    if (root == nullptr)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "module '%s' has no module class",
                                       module.name.c_str());
    }
    const Mapping* mapping = mappings.find(root->qualifiedName());
    if (mapping == nullptr)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: no mapping for module '%s'",
                                       root->location.str().c_str(),
                                       module.name.c_str());
    }
    return mapping->targetNamespace;
}

void warnHiddenProperties(const ReflectedModule& module, DiagnosticEngine& diagnostics)
{
    for (const Declaration& decl : module.declarations)
    {
        for (const PropertyDecl& property : decl.properties)
        {
            if (property.isHidden)
            {
                diagnostics.warning(property.location,
                                    "hidden property '" + property.name + "' of '" + decl.qualifiedName() +
                                        "' is not emitted");
            }
        }
    }
}

}  // namespace

std::vector<std::string> defaultHeaderLines(llvm::StringRef moduleName)
{
    return {"# Code generated from Pkl module `" + moduleName.str() + "`. DO NOT EDIT."};
}

llvm::Expected<std::vector<GeneratedDocument>> generatePython(const ReflectedSchema&   schema,
                                                              const PythonEmitOptions& options,
                                                              DiagnosticEngine&        diagnostics)
{
    if (options.fileSuffix.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output file suffix must not be empty");
    }

    std::map<std::string, std::string, std::less<>> namespaceOwners;
    std::map<std::string, std::string, std::less<>> fileOwners;
    std::vector<GeneratedDocument>                  documents;
    documents.reserve(schema.modules.size());

    for (const ReflectedModule& module : schema.modules)
    {
        auto ns = moduleNamespace(module, schema.mappings);
        if (!ns)
        {
            return ns.takeError();
        }

        const auto [owner, inserted] = namespaceOwners.emplace(*ns, module.name);
        if (!inserted)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "modules '%s' and '%s' both generate namespace '%s'",
                                           owner->second.c_str(),
                                           module.name.c_str(),
                                           ns->c_str());
        }

        const std::string fileName              = pythonOutputFileName(*ns, options.fileSuffix);
        const auto        [fileOwner, fileFree] = fileOwners.emplace(fileName, module.name);
        if (!fileFree)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "modules '%s' and '%s' both generate output file '%s'",
                                           fileOwner->second.c_str(),
                                           module.name.c_str(),
                                           fileName.c_str());
        }

        warnHiddenProperties(module, diagnostics);

        const CodegenContext ctx(*ns, schema.mappings, options.indentUnit, options.fileSuffix);
        auto                 document = generateNamespace(module,
                                          ctx,
                                          options.headerLines.empty() ? defaultHeaderLines(module.name)
                                                                                      : options.headerLines);
        if (!document)
        {
            return document.takeError();
        }

        diagnostics.note(findModuleClass(module)->location,
                         "generated " + document->fileName + " from module '" + module.name + "'");
        documents.push_back(std::move(*document));
    }
    return documents;
}

llvm::Error emitPython(const ReflectedSchema& schema, const PythonEmitOptions& options, DiagnosticEngine& diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }

    auto documents = generatePython(schema, options, diagnostics);
    if (!documents)
    {
        return documents.takeError();
    }

    const std::filesystem::path outRoot(options.outDir);
    for (const GeneratedDocument& document : *documents)
    {
        if (auto err = writeGeneratedFile(outRoot / document.fileName, document.text, options.writePolicy))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

}  // namespace pklgen
