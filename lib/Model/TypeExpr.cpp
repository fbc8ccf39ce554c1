//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements type-expression construction and Pkl-side display rendering.
///
//===----------------------------------------------------------------------===//

#include "pklgen/Model/TypeExpr.h"

#include <sstream>
#include <type_traits>
#include <utility>

#include "llvm/ADT/StringSwitch.h"

namespace pklgen
{
namespace
{

template <typename T>
inline constexpr bool kAlwaysFalse = false;

TypeExprPtr makeType(TypeExpr::Node node, SourceLocation location)
{
    auto expr      = std::make_shared<TypeExpr>();
    expr->location = std::move(location);
    expr->node     = std::move(node);
    return expr;
}

void printList(std::ostringstream& out, const std::vector<TypeExprPtr>& items, llvm::StringRef separator)
{
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            out << separator.str();
        }
        out << (items[i] ? items[i]->str() : "<null>");
    }
}

}  // namespace

llvm::StringRef primitiveKindName(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::String:
        return "String";
    case PrimitiveKind::Int:
        return "Int";
    case PrimitiveKind::Float:
        return "Float";
    case PrimitiveKind::Number:
        return "Number";
    case PrimitiveKind::Boolean:
        return "Boolean";
    case PrimitiveKind::Any:
        return "Any";
    case PrimitiveKind::Null:
        return "Null";
    case PrimitiveKind::Dynamic:
        return "Dynamic";
    case PrimitiveKind::Duration:
        return "Duration";
    case PrimitiveKind::DataSize:
        return "DataSize";
    case PrimitiveKind::Regex:
        return "Regex";
    case PrimitiveKind::List:
        return "List";
    case PrimitiveKind::Set:
        return "Set";
    case PrimitiveKind::Map:
        return "Map";
    case PrimitiveKind::Pair:
        return "Pair";
    }
    return "Any";
}

std::optional<PrimitiveKind> parsePrimitiveKind(llvm::StringRef name)
{
    using Result = std::optional<PrimitiveKind>;
    return llvm::StringSwitch<Result>(name)
        .Case("String", PrimitiveKind::String)
        .Cases("Int", "Int8", "Int16", "Int32", PrimitiveKind::Int)
        .Cases("UInt", "UInt8", "UInt16", "UInt32", PrimitiveKind::Int)
        .Case("Float", PrimitiveKind::Float)
        .Case("Number", PrimitiveKind::Number)
        .Case("Boolean", PrimitiveKind::Boolean)
        .Case("Any", PrimitiveKind::Any)
        .Case("Null", PrimitiveKind::Null)
        .Case("Dynamic", PrimitiveKind::Dynamic)
        .Case("Duration", PrimitiveKind::Duration)
        .Case("DataSize", PrimitiveKind::DataSize)
        .Case("Regex", PrimitiveKind::Regex)
        .Cases("List", "Listing", PrimitiveKind::List)
        .Case("Set", PrimitiveKind::Set)
        .Cases("Map", "Mapping", PrimitiveKind::Map)
        .Case("Pair", PrimitiveKind::Pair)
        .Default(std::nullopt);
}

std::string TypeExpr::str() const
{
    std::ostringstream out;
    std::visit(
        [&](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Primitive>)
            {
                out << primitiveKindName(n.kind).str();
            }
            else if constexpr (std::is_same_v<T, Nullable>)
            {
                out << (n.inner ? n.inner->str() : "<null>") << '?';
            }
            else if constexpr (std::is_same_v<T, Union>)
            {
                printList(out, n.members, "|");
            }
            else if constexpr (std::is_same_v<T, Declared>)
            {
                out << n.qualifiedName;
            }
            else if constexpr (std::is_same_v<T, StringLiteral>)
            {
                out << '"' << n.value << '"';
            }
            else if constexpr (std::is_same_v<T, Generic>)
            {
                out << (n.base ? n.base->str() : "<null>") << '<';
                printList(out, n.arguments, ", ");
                out << '>';
            }
            else if constexpr (std::is_same_v<T, Function>)
            {
                out << '(';
                printList(out, n.parameters, ", ");
                out << ") -> " << (n.result ? n.result->str() : "<null>");
            }
            else if constexpr (std::is_same_v<T, Unsupported>)
            {
                out << n.display;
            }
            else
            {
                static_assert(kAlwaysFalse<T>, "unhandled type expression variant");
            }
        },
        node);
    return out.str();
}

TypeExprPtr makePrimitiveType(const PrimitiveKind kind, SourceLocation location)
{
    return makeType(TypeExpr::Primitive{kind}, std::move(location));
}

TypeExprPtr makeNullableType(TypeExprPtr inner, SourceLocation location)
{
    return makeType(TypeExpr::Nullable{std::move(inner)}, std::move(location));
}

TypeExprPtr makeUnionType(std::vector<TypeExprPtr> members, SourceLocation location)
{
    return makeType(TypeExpr::Union{std::move(members)}, std::move(location));
}

TypeExprPtr makeDeclaredType(std::string qualifiedName, SourceLocation location)
{
    return makeType(TypeExpr::Declared{std::move(qualifiedName)}, std::move(location));
}

TypeExprPtr makeStringLiteralType(std::string value, SourceLocation location)
{
    return makeType(TypeExpr::StringLiteral{std::move(value)}, std::move(location));
}

TypeExprPtr makeGenericType(TypeExprPtr base, std::vector<TypeExprPtr> arguments, SourceLocation location)
{
    return makeType(TypeExpr::Generic{std::move(base), std::move(arguments)}, std::move(location));
}

TypeExprPtr makeFunctionType(std::vector<TypeExprPtr> parameters, TypeExprPtr result, SourceLocation location)
{
    return makeType(TypeExpr::Function{std::move(parameters), std::move(result)}, std::move(location));
}

TypeExprPtr makeUnsupportedType(std::string display, SourceLocation location)
{
    return makeType(TypeExpr::Unsupported{std::move(display)}, std::move(location));
}

}  // namespace pklgen
