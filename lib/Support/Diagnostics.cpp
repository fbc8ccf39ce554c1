//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records source-aware notes, warnings, and errors
/// produced while decoding reflected schemas and generating Python modules.
///
//===----------------------------------------------------------------------===//

#include "pklgen/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

#include "llvm/Support/raw_ostream.h"

namespace pklgen
{

llvm::StringRef diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(DiagnosticLevel level, const SourceLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    return count(DiagnosticLevel::Error) != 0U;
}

std::size_t DiagnosticEngine::count(const DiagnosticLevel level) const
{
    return static_cast<std::size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(), [level](const Diagnostic& d) {
        return d.level == level;
    }));
}

void DiagnosticEngine::print(llvm::raw_ostream& os) const
{
    for (const Diagnostic& d : diagnostics_)
    {
        os << d.location.str() << ": " << diagnosticLevelName(d.level) << ": " << d.message << "\n";
    }
}

}  // namespace pklgen
