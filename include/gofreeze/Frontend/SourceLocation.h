//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_FRONTEND_SOURCE_LOCATION_H
#define GOFREEZE_FRONTEND_SOURCE_LOCATION_H

#include <cstdint>
#include <string>

namespace gofreeze
{

/// @file
/// @brief Input location attached to diagnostics.

/// @brief Identifies an input file and, when known, a position or value path inside it.
struct SourceLocation
{
    /// @brief Path to the input file or directory.
    std::string file;

    /// @brief 1-based line; 0 when the location names a whole file.
    std::uint32_t line{0};

    /// @brief 1-based column; 0 when unknown.
    std::uint32_t column{0};

    /// @brief Path of a value inside a JSON document (`root.value.Files[0]`); empty when not applicable.
    std::string valuePath;

    /// @brief Formats this location as `file[:line[:column]][ (valuePath)]`.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

}  // namespace gofreeze

#endif  // GOFREEZE_FRONTEND_SOURCE_LOCATION_H
