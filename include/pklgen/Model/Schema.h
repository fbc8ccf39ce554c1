//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Reflected schema model consumed by the Python code generator.
///
/// The reflection facility that inspects Pkl modules is external. It hands
/// over a module tree of declarations together with a pre-resolved mapping
/// table that binds every declaration to a target namespace and identifier.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_MODEL_SCHEMA_H
#define PKLGEN_MODEL_SCHEMA_H

#include "pklgen/Model/TypeExpr.h"
#include "pklgen/Support/SourceLocation.h"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace pklgen
{

/// @brief Kind of a reflected declaration.
enum class DeclarationKind
{
    /// @brief The class that represents the module itself.
    Module,

    /// @brief A class declared inside the module.
    Class,

    /// @brief An enumeration of string literal values.
    Enum,

    /// @brief A type alias.
    TypeAlias,
};

/// @brief Returns the lowercase source-kind label (`module`, `class`, `enum`, `typealias`).
/// @param[in] kind Declaration kind.
/// @return Display label.
llvm::StringRef declarationKindName(DeclarationKind kind);

/// @brief One property of a reflected class.
struct PropertyDecl final
{
    /// @brief Source property name.
    std::string name;

    /// @brief Declared property type.
    TypeExprPtr type;

    /// @brief Optional doc comment text.
    std::optional<std::string> docComment;

    /// @brief Hidden properties are not part of the rendered output.
    bool isHidden{false};

    /// @brief Source location of the property declaration.
    SourceLocation location;
};

/// @brief One reflected declaration.
struct Declaration final
{
    DeclarationKind kind{DeclarationKind::Class};

    /// @brief Simple source name.
    std::string name;

    /// @brief Name of the enclosing module.
    std::string moduleName;

    SourceLocation location;

    std::optional<std::string> docComment;

    /// @brief Qualified source name of the direct superclass (classes only).
    std::optional<std::string> superclass;

    /// @brief Class properties in declaration order.
    std::vector<PropertyDecl> properties;

    /// @brief Enum literal values in declaration order.
    std::vector<std::string> enumValues;

    /// @brief Aliased type (type aliases only).
    TypeExprPtr aliasedType;

    /// @brief Returns `<module>` for the module class and `<module>#<name>` otherwise.
    /// @return Qualified source name.
    [[nodiscard]] std::string qualifiedName() const;
};

/// @brief Binding of one source declaration to a target namespace and identifier.
struct Mapping final
{
    DeclarationKind sourceKind{DeclarationKind::Class};

    std::string sourceQualifiedName;

    SourceLocation sourceLocation;

    /// @brief Target namespace; one generated document per namespace.
    std::string targetNamespace;

    /// @brief Target Python identifier.
    std::string targetName;
};

/// @brief Read-only mapping lookup table.
class MappingTable final
{
public:
    MappingTable() = default;
    explicit MappingTable(std::vector<Mapping> mappings);

    /// @brief Looks up a mapping by qualified source name.
    /// @param[in] qualifiedName Qualified source name.
    /// @return Mapping, or null when unknown.
    [[nodiscard]] const Mapping* find(llvm::StringRef qualifiedName) const;

    /// @brief Returns the mappings of one namespace in insertion order.
    /// @param[in] targetNamespace Namespace name.
    /// @return Mapping list.
    [[nodiscard]] std::vector<Mapping> inNamespace(llvm::StringRef targetNamespace) const;

    /// @brief Returns every mapping in insertion order.
    [[nodiscard]] const std::vector<Mapping>& all() const
    {
        return mappings_;
    }

private:
    std::vector<Mapping>                            mappings_;
    std::map<std::string, std::size_t, std::less<>> indexByQualifiedName_;
};

/// @brief Builds the mapping a declaration would get when no rename annotation applies.
/// @param[in] decl Declaration.
/// @param[in] targetNamespace Namespace the declaration is generated into.
/// @return Mapping whose target name is the source name (`ModuleClass` for the module class).
Mapping makeDefaultMapping(const Declaration& decl, const std::string& targetNamespace);

/// @brief One reflected Pkl module.
struct ReflectedModule final
{
    std::string name;

    /// @brief Module URI.
    std::string uri;

    /// @brief Declarations in reflected (declaration) order.
    std::vector<Declaration> declarations;
};

/// @brief Reflected module tree plus its mapping table.
struct ReflectedSchema final
{
    /// @brief Modules in generation order; the first entry is the root module.
    std::vector<ReflectedModule> modules;

    MappingTable mappings;
};

}  // namespace pklgen

#endif  // PKLGEN_MODEL_SCHEMA_H
