//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the depth-first directory walk used to locate value documents.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Frontend/Discovery.h"

#include <algorithm>
#include <system_error>
#include <utility>

namespace gofreeze
{
namespace
{

llvm::Error walkImpl(const std::filesystem::path&                          root,
                     const std::filesystem::path&                          directory,
                     const llvm::StringRef                                 documentSuffix,
                     llvm::function_ref<llvm::Error(const UnitDirectory&)> visit)
{
    std::error_code                    ec;
    std::vector<std::filesystem::path> subdirectories;
    UnitDirectory                      unit;
    unit.directory = directory;

    std::filesystem::directory_iterator it(directory, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to read directory %s", directory.string().c_str());
    }
    for (const std::filesystem::directory_entry& entry : it)
    {
        if (entry.is_directory(ec))
        {
            subdirectories.push_back(entry.path());
            continue;
        }
        const std::string fileName = entry.path().filename().string();
        if (entry.is_regular_file(ec) && llvm::StringRef(fileName).take_back(documentSuffix.size()) == documentSuffix)
        {
            unit.documents.push_back(entry.path());
        }
    }
    std::sort(subdirectories.begin(), subdirectories.end());
    std::sort(unit.documents.begin(), unit.documents.end());

    const auto relative = directory.lexically_relative(root);
    unit.relativePath   = relative.empty() ? "." : relative.generic_string();

    if (auto err = visit(unit))
    {
        return err;
    }
    for (const std::filesystem::path& subdirectory : subdirectories)
    {
        if (auto err = walkImpl(root, subdirectory, documentSuffix, visit))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Error walkUnitDirectories(const std::filesystem::path&                          root,
                                const llvm::StringRef                                 documentSuffix,
                                llvm::function_ref<llvm::Error(const UnitDirectory&)> visit)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "root directory does not exist: %s",
                                       root.string().c_str());
    }
    return walkImpl(root, root, documentSuffix, visit);
}

}  // namespace gofreeze
