//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed fatal errors raised while generating one Python namespace.
///
/// Both errors abort generation of the whole namespace; callers recover the
/// payload with `llvm::handleErrors` / `llvm::handleAllErrors`.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_CODEGEN_CODEGEN_ERRORS_H
#define PKLGEN_CODEGEN_CODEGEN_ERRORS_H

#include "pklgen/Model/Schema.h"
#include "pklgen/Support/SourceLocation.h"

#include <string>
#include <system_error>
#include <vector>

#include "llvm/Support/Error.h"

namespace pklgen
{

/// @brief One declaration participating in a name collision.
struct CollidingDeclaration final
{
    DeclarationKind kind{DeclarationKind::Class};
    std::string     qualifiedName;
    SourceLocation  location;
};

/// @brief Two or more declarations resolve to the same identifier in one namespace.
class NameCollisionError final : public llvm::ErrorInfo<NameCollisionError>
{
public:
    static char ID;

    NameCollisionError(std::string targetNamespace, std::string targetName, std::vector<CollidingDeclaration> conflicts);

    [[nodiscard]] const std::string& targetNamespace() const
    {
        return targetNamespace_;
    }

    [[nodiscard]] const std::string& targetName() const
    {
        return targetName_;
    }

    /// @brief Conflicting declarations in mapping-table order.
    [[nodiscard]] const std::vector<CollidingDeclaration>& conflicts() const
    {
        return conflicts_;
    }

    /// @brief Renders a Pkl snippet showing how a rename annotation resolves the conflict.
    /// @return Multi-line Pkl example.
    [[nodiscard]] std::string remediationExample() const;

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::string                       targetNamespace_;
    std::string                       targetName_;
    std::vector<CollidingDeclaration> conflicts_;
};

/// @brief A type expression has no Python projection.
class UnsupportedTypeError final : public llvm::ErrorInfo<UnsupportedTypeError>
{
public:
    static char ID;

    UnsupportedTypeError(std::string display, SourceLocation location, std::string reason = {});

    /// @brief Pkl display form of the offending type.
    [[nodiscard]] const std::string& display() const
    {
        return display_;
    }

    [[nodiscard]] const SourceLocation& location() const
    {
        return location_;
    }

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::string    display_;
    SourceLocation location_;
    std::string    reason_;
};

}  // namespace pklgen

#endif  // PKLGEN_CODEGEN_CODEGEN_ERRORS_H
