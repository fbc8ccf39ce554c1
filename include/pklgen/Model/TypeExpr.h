//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-neutral type expressions attached to reflected Pkl declarations.
///
/// A type expression is an immutable tree. Child nodes are shared, so copies
/// are cheap and never mutate the original tree.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_MODEL_TYPE_EXPR_H
#define PKLGEN_MODEL_TYPE_EXPR_H

#include "pklgen/Support/SourceLocation.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace pklgen
{

/// @brief Built-in Pkl types with a direct Python spelling.
enum class PrimitiveKind
{
    String,
    Int,
    Float,
    Number,
    Boolean,
    Any,
    Null,
    Dynamic,
    Duration,
    DataSize,
    Regex,

    /// @brief `List`/`Listing` collection constructor (used as a generic base).
    List,

    /// @brief `Set` collection constructor.
    Set,

    /// @brief `Map`/`Mapping` collection constructor.
    Map,

    /// @brief `Pair` constructor.
    Pair,
};

/// @brief Returns the Pkl spelling of a primitive kind.
/// @param[in] kind Primitive kind.
/// @return Pkl type name.
llvm::StringRef primitiveKindName(PrimitiveKind kind);

/// @brief Parses the Pkl spelling of a primitive kind.
/// @param[in] name Pkl type name (`Listing` and `Mapping` are accepted aliases).
/// @return Primitive kind, or nullopt when the name is not a primitive.
std::optional<PrimitiveKind> parsePrimitiveKind(llvm::StringRef name);

struct TypeExpr;

/// @brief Shared immutable type expression handle.
using TypeExprPtr = std::shared_ptr<const TypeExpr>;

/// @brief One node of a type expression tree.
struct TypeExpr final
{
    struct Primitive
    {
        PrimitiveKind kind;
    };

    struct Nullable
    {
        TypeExprPtr inner;
    };

    struct Union
    {
        std::vector<TypeExprPtr> members;
    };

    /// @brief Reference to another declaration by qualified source name.
    struct Declared
    {
        std::string qualifiedName;
    };

    struct StringLiteral
    {
        std::string value;
    };

    struct Generic
    {
        TypeExprPtr              base;
        std::vector<TypeExprPtr> arguments;
    };

    struct Function
    {
        std::vector<TypeExprPtr> parameters;
        TypeExprPtr              result;
    };

    /// @brief A reflected type shape that has no Python projection.
    struct Unsupported
    {
        std::string display;
    };

    using Node = std::variant<Primitive, Nullable, Union, Declared, StringLiteral, Generic, Function, Unsupported>;

    /// @brief Location of the source construct that produced this node.
    SourceLocation location;

    /// @brief Active variant.
    Node node;

    /// @brief Renders the Pkl-side display form used in diagnostics.
    /// @return Display string, e.g. `List<Animal>?`.
    [[nodiscard]] std::string str() const;
};

TypeExprPtr makePrimitiveType(PrimitiveKind kind, SourceLocation location = {});
TypeExprPtr makeNullableType(TypeExprPtr inner, SourceLocation location = {});
TypeExprPtr makeUnionType(std::vector<TypeExprPtr> members, SourceLocation location = {});
TypeExprPtr makeDeclaredType(std::string qualifiedName, SourceLocation location = {});
TypeExprPtr makeStringLiteralType(std::string value, SourceLocation location = {});
TypeExprPtr makeGenericType(TypeExprPtr base, std::vector<TypeExprPtr> arguments, SourceLocation location = {});
TypeExprPtr makeFunctionType(std::vector<TypeExprPtr> parameters, TypeExprPtr result, SourceLocation location = {});
TypeExprPtr makeUnsupportedType(std::string display, SourceLocation location = {});

}  // namespace pklgen

#endif  // PKLGEN_MODEL_TYPE_EXPR_H
