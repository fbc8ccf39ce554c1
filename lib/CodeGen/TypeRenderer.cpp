//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the Python type renderer.
///
/// Every type-expression variant is matched explicitly; a variant without a
/// Python projection yields `UnsupportedTypeError` instead of partial text.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/TypeRenderer.h"

#include "pklgen/CodeGen/CodegenErrors.h"
#include "pklgen/CodeGen/NamingPolicy.h"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace pklgen
{
namespace
{

template <typename T>
inline constexpr bool kAlwaysFalse = false;

llvm::Error malformedType(const TypeExpr& owner, llvm::StringRef what)
{
    return llvm::make_error<UnsupportedTypeError>(owner.str(), owner.location, what.str());
}

llvm::Expected<std::string> renderChild(const TypeExprPtr& child, const TypeExpr& owner, const CodegenContext& ctx)
{
    if (!child)
    {
        return malformedType(owner, "missing nested type");
    }
    return renderPythonType(*child, ctx);
}

llvm::Expected<std::string> renderJoined(const std::vector<TypeExprPtr>& items,
                                         const TypeExpr&                 owner,
                                         const CodegenContext&           ctx)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        auto rendered = renderChild(items[i], owner, ctx);
        if (!rendered)
        {
            return rendered.takeError();
        }
        if (i > 0)
        {
            out += ", ";
        }
        out += *rendered;
    }
    return out;
}

llvm::Expected<std::string> renderDeclared(const TypeExpr::Declared& node,
                                           const TypeExpr&           owner,
                                           const CodegenContext&     ctx)
{
    const Mapping* mapping = ctx.findMapping(node.qualifiedName);
    if (mapping == nullptr)
    {
        return malformedType(owner, "no mapping for declaration '" + node.qualifiedName + "'");
    }
    if (ctx.isForeign(*mapping))
    {
        return ctx.moduleStem(mapping->targetNamespace) + "." + mapping->targetName;
    }
    return mapping->targetName;
}

void collectInto(const TypeExpr& expr, const CodegenContext& ctx, std::vector<std::string>& out);

void collectChild(const TypeExprPtr& child, const CodegenContext& ctx, std::vector<std::string>& out)
{
    if (child)
    {
        collectInto(*child, ctx, out);
    }
}

void collectInto(const TypeExpr& expr, const CodegenContext& ctx, std::vector<std::string>& out)
{
    std::visit(
        [&](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, TypeExpr::Nullable>)
            {
                collectChild(n.inner, ctx, out);
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Union>)
            {
                for (const auto& member : n.members)
                {
                    collectChild(member, ctx, out);
                }
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Declared>)
            {
                const Mapping* mapping = ctx.findMapping(n.qualifiedName);
                if (mapping != nullptr && ctx.isForeign(*mapping) &&
                    std::find(out.begin(), out.end(), mapping->targetNamespace) == out.end())
                {
                    out.push_back(mapping->targetNamespace);
                }
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Generic>)
            {
                collectChild(n.base, ctx, out);
                for (const auto& argument : n.arguments)
                {
                    collectChild(argument, ctx, out);
                }
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Function>)
            {
                for (const auto& parameter : n.parameters)
                {
                    collectChild(parameter, ctx, out);
                }
                collectChild(n.result, ctx, out);
            }
        },
        expr.node);
}

}  // namespace

llvm::StringRef pythonPrimitiveSpelling(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::String:
        return "str";
    case PrimitiveKind::Int:
        return "int";
    case PrimitiveKind::Float:
    case PrimitiveKind::Number:
        return "float";
    case PrimitiveKind::Boolean:
        return "bool";
    case PrimitiveKind::Any:
    case PrimitiveKind::Dynamic:
        return "Any";
    case PrimitiveKind::Null:
        return "None";
    case PrimitiveKind::Duration:
        return "pkl.Duration";
    case PrimitiveKind::DataSize:
        return "pkl.DataSize";
    case PrimitiveKind::Regex:
        return "re.Pattern";
    case PrimitiveKind::List:
        return "List";
    case PrimitiveKind::Set:
        return "Set";
    case PrimitiveKind::Map:
        return "Dict";
    case PrimitiveKind::Pair:
        return "Tuple";
    }
    return "Any";
}

llvm::Expected<std::string> renderPythonType(const TypeExpr& expr, const CodegenContext& ctx)
{
    return std::visit(
        [&](const auto& n) -> llvm::Expected<std::string> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, TypeExpr::Primitive>)
            {
                return pythonPrimitiveSpelling(n.kind).str();
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Nullable>)
            {
                auto inner = renderChild(n.inner, expr, ctx);
                if (!inner)
                {
                    return inner.takeError();
                }
                return "Optional[" + *inner + "]";
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Union>)
            {
                if (n.members.empty())
                {
                    return malformedType(expr, "empty union");
                }
                auto members = renderJoined(n.members, expr, ctx);
                if (!members)
                {
                    return members.takeError();
                }
                return "Union[" + *members + "]";
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Declared>)
            {
                return renderDeclared(n, expr, ctx);
            }
            else if constexpr (std::is_same_v<T, TypeExpr::StringLiteral>)
            {
                return "Literal[" + pythonQuote(n.value) + "]";
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Generic>)
            {
                auto base = renderChild(n.base, expr, ctx);
                if (!base)
                {
                    return base.takeError();
                }
                if (n.arguments.empty())
                {
                    return *base;
                }
                auto arguments = renderJoined(n.arguments, expr, ctx);
                if (!arguments)
                {
                    return arguments.takeError();
                }
                return *base + "[" + *arguments + "]";
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Function>)
            {
                auto parameters = renderJoined(n.parameters, expr, ctx);
                if (!parameters)
                {
                    return parameters.takeError();
                }
                auto result = renderChild(n.result, expr, ctx);
                if (!result)
                {
                    return result.takeError();
                }
                return "Callable[[" + *parameters + "], " + *result + "]";
            }
            else if constexpr (std::is_same_v<T, TypeExpr::Unsupported>)
            {
                return llvm::make_error<UnsupportedTypeError>(n.display, expr.location);
            }
            else
            {
                static_assert(kAlwaysFalse<T>, "unhandled type expression variant");
            }
        },
        expr.node);
}

std::vector<std::string> collectForeignNamespaces(const TypeExpr& expr, const CodegenContext& ctx)
{
    std::vector<std::string> out;
    collectInto(expr, ctx, out);
    return out;
}

}  // namespace pklgen
