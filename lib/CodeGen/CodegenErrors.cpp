//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements typed code-generation errors and their rendered messages.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/CodegenErrors.h"

#include <utility>

#include "llvm/Support/raw_ostream.h"

namespace pklgen
{
namespace
{

std::string simpleName(llvm::StringRef qualifiedName)
{
    const auto hash = qualifiedName.rfind('#');
    if (hash == llvm::StringRef::npos)
    {
        return qualifiedName.str();
    }
    return qualifiedName.substr(hash + 1).str();
}

}  // namespace

char NameCollisionError::ID   = 0;
char UnsupportedTypeError::ID = 0;

NameCollisionError::NameCollisionError(std::string                       targetNamespace,
                                       std::string                       targetName,
                                       std::vector<CollidingDeclaration> conflicts)
    : targetNamespace_(std::move(targetNamespace))
    , targetName_(std::move(targetName))
    , conflicts_(std::move(conflicts))
{
}

std::string NameCollisionError::remediationExample() const
{
    const std::string renamed    = targetName_ + "2";
    const std::string annotation = "@python.Name { value = \"" + renamed + "\" }\n";
    if (conflicts_.empty())
    {
        return annotation;
    }

    const CollidingDeclaration& first = conflicts_.front();
    switch (first.kind)
    {
    case DeclarationKind::Module:
        return annotation + "module " + first.qualifiedName;
    case DeclarationKind::TypeAlias:
        return annotation + "typealias " + simpleName(first.qualifiedName) + " = ...";
    case DeclarationKind::Class:
    case DeclarationKind::Enum:
        break;
    }
    return annotation + "class " + simpleName(first.qualifiedName);
}

void NameCollisionError::log(llvm::raw_ostream& os) const
{
    os << "Conflict: multiple Pkl declarations compute to Python name `" << targetName_ << "` in namespace `"
       << targetNamespace_ << "`.\n\n"
       << "To resolve this conflict, add a `@python.Name` annotation to any of the following declarations:\n\n";
    for (const CollidingDeclaration& conflict : conflicts_)
    {
        os << "* [" << declarationKindName(conflict.kind) << "] `" << conflict.qualifiedName << "` ("
           << conflict.location.str() << ")\n";
    }
    os << "\nFor example:\n\n```\n" << remediationExample() << "\n```";
}

std::error_code NameCollisionError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

UnsupportedTypeError::UnsupportedTypeError(std::string display, SourceLocation location, std::string reason)
    : display_(std::move(display))
    , location_(std::move(location))
    , reason_(std::move(reason))
{
}

void UnsupportedTypeError::log(llvm::raw_ostream& os) const
{
    os << location_.str() << ": unsupported type `" << display_ << "`";
    if (!reason_.empty())
    {
        os << ": " << reason_;
    }
}

std::error_code UnsupportedTypeError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

}  // namespace pklgen
