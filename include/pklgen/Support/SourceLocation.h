//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives shared by reflected input, diagnostics, and code generation.
///
//===----------------------------------------------------------------------===//
#ifndef PKLGEN_SUPPORT_SOURCE_LOCATION_H
#define PKLGEN_SUPPORT_SOURCE_LOCATION_H

#include <cstdint>
#include <string>

namespace pklgen
{

/// @brief Identifies a concrete position in a Pkl source module.
struct SourceLocation
{
    /// @brief Module URI or path.
    std::string file;

    /// @brief 1-based source line.
    std::uint32_t line{1};

    /// @brief 1-based source column.
    std::uint32_t column{1};

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

}  // namespace pklgen

#endif  // PKLGEN_SUPPORT_SOURCE_LOCATION_H
