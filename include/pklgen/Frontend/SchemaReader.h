//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Decoding of the reflected-schema JSON hand-off.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_FRONTEND_SCHEMA_READER_H
#define PKLGEN_FRONTEND_SCHEMA_READER_H

#include "pklgen/Model/Schema.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace pklgen
{

/// @brief Converts one parsed reflection document into a @ref ReflectedSchema.
///
/// @details
/// Every structural error names the JSON path of the offending value, e.g.
/// `schema.json: modules[0].declarations[2].kind: unknown declaration kind 'struct'`.
/// When the document carries no `mappings` array, default mappings are derived
/// per module, honoring each declaration's optional `pythonName`.
class SchemaReader final
{
public:
    /// @brief Constructs a reader.
    /// @param[in] sourceName Name of the input used in error messages and default locations.
    explicit SchemaReader(std::string sourceName);

    /// @brief Decodes one document.
    /// @param[in] root Parsed JSON document.
    /// @return Reflected schema, or the first structural error.
    llvm::Expected<ReflectedSchema> read(const llvm::json::Value& root);

private:
    /// @brief Builds an error anchored at one JSON path.
    llvm::Error fail(llvm::StringRef path, const llvm::Twine& message) const;

    llvm::Expected<const llvm::json::Object*> requireObject(const llvm::json::Value& value, llvm::StringRef path) const;

    llvm::Expected<std::string> requireString(const llvm::json::Object& object,
                                              llvm::StringRef           key,
                                              llvm::StringRef           path) const;

    llvm::Expected<std::optional<std::string>> optionalString(const llvm::json::Object& object,
                                                              llvm::StringRef           key,
                                                              llvm::StringRef           path) const;

    /// @brief Returns the named array, or an empty array when the key is absent.
    llvm::Expected<const llvm::json::Array*> optionalArray(const llvm::json::Object& object,
                                                           llvm::StringRef           key,
                                                           llvm::StringRef           path) const;

    /// @brief Decodes an optional `location` member; the file is @p file.
    llvm::Expected<SourceLocation> readLocation(const llvm::json::Object& object,
                                                llvm::StringRef           file,
                                                llvm::StringRef           path) const;

    llvm::Expected<ReflectedModule> readModule(const llvm::json::Value& value, const std::string& path);

    llvm::Expected<Declaration> readDeclaration(const llvm::json::Value& value,
                                                const ReflectedModule&   module,
                                                const std::string&       path);

    llvm::Expected<PropertyDecl> readProperty(const llvm::json::Value& value,
                                              llvm::StringRef          file,
                                              const std::string&       path);

    llvm::Expected<TypeExprPtr> readType(const llvm::json::Value& value,
                                         llvm::StringRef          file,
                                         const std::string&       path,
                                         std::size_t              depth);

    llvm::Expected<std::vector<TypeExprPtr>> readTypeList(const llvm::json::Object& object,
                                                          llvm::StringRef           key,
                                                          llvm::StringRef           file,
                                                          const std::string&        path,
                                                          std::size_t               depth);

    llvm::Expected<Mapping> readMapping(const llvm::json::Value& value, const std::string& path);

    /// @brief Input name used in error messages.
    std::string sourceName_;

    /// @brief Mappings derived from module namespaces and `pythonName` renames.
    std::vector<Mapping> derivedMappings_;
};

/// @brief Parses and decodes reflection JSON text.
/// @param[in] text JSON document text.
/// @param[in] sourceName Input name used in error messages.
/// @return Reflected schema, or a parse or structural error.
llvm::Expected<ReflectedSchema> readSchemaJson(llvm::StringRef text, llvm::StringRef sourceName);

/// @brief Reads and decodes a reflection JSON file.
/// @param[in] path File path.
/// @return Reflected schema, or an I/O, parse, or structural error.
llvm::Expected<ReflectedSchema> readSchemaFile(const std::string& path);

}  // namespace pklgen

#endif  // PKLGEN_FRONTEND_SCHEMA_READER_H
