//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_FRONTEND_DISCOVERY_H
#define GOFREEZE_FRONTEND_DISCOVERY_H

#include <filesystem>
#include <string>
#include <vector>

#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace gofreeze
{

/// @file
/// @brief Directory walking for value documents.

/// @brief Default file-name suffix of value documents.
inline constexpr const char* kDefaultDocumentSuffix = ".gofreeze.json";

/// @brief One visited directory.
struct UnitDirectory final
{
    /// @brief Directory path as reached from the walk root.
    std::filesystem::path directory;

    /// @brief Path relative to the walk root with `/` separators; `.` for the root itself.
    std::string relativePath;

    /// @brief Value documents found directly in the directory, sorted by name.
    std::vector<std::filesystem::path> documents;
};

/// @brief Walks a directory tree depth-first.
///
/// @details Each directory is visited before its subdirectories, and
/// subdirectories are visited in name order. Directories without documents are
/// visited too. The walk stops at the first error, from the filesystem or
/// returned by @p visit.
///
/// @param[in] root Walk root.
/// @param[in] documentSuffix File-name suffix identifying value documents.
/// @param[in] visit Callback invoked once per directory.
/// @return Success or the first error.
llvm::Error walkUnitDirectories(const std::filesystem::path&                          root,
                                llvm::StringRef                                       documentSuffix,
                                llvm::function_ref<llvm::Error(const UnitDirectory&)> visit);

}  // namespace gofreeze

#endif  // GOFREEZE_FRONTEND_DISCOVERY_H
