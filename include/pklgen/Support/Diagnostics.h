//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used by schema decoding and code generation.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_SUPPORT_DIAGNOSTICS_H
#define PKLGEN_SUPPORT_DIAGNOSTICS_H

#include "pklgen/Support/SourceLocation.h"

#include <cstddef>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace llvm
{
class raw_ostream;
}  // namespace llvm

namespace pklgen
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Returns the lowercase display label for a level.
/// @param[in] level Severity level.
/// @return `note`, `warning`, or `error`.
llvm::StringRef diagnosticLevelName(DiagnosticLevel level);

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics emitted across decoding and generation.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string message);

    void note(const SourceLocation& location, std::string message);
    void warning(const SourceLocation& location, std::string message);
    void error(const SourceLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts diagnostics recorded at one level.
    /// @param[in] level Severity level.
    /// @return Number of matching diagnostics.
    [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

    /// @brief Prints every diagnostic as `<location>: <level>: <message>`.
    /// @param[in,out] os Output stream.
    void print(llvm::raw_ostream& os) const;

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace pklgen

#endif  // PKLGEN_SUPPORT_DIAGNOSTICS_H
