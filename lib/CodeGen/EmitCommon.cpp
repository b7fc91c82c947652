//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generated-file writing under an output policy.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/EmitCommon.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <system_error>

namespace gofreeze
{

namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    struct Bit final
    {
        std::uint32_t mask;
        Perm          perm;
    };
    static constexpr Bit kBits[] = {
        {0400U, Perm::owner_read},
        {0200U, Perm::owner_write},
        {0100U, Perm::owner_exec},
        {0040U, Perm::group_read},
        {0020U, Perm::group_write},
        {0010U, Perm::group_exec},
        {0004U, Perm::others_read},
        {0002U, Perm::others_write},
        {0001U, Perm::others_exec},
    };

    Perm out = Perm::none;
    for (const Bit& bit : kBits)
    {
        if ((mode & bit.mask) != 0U)
        {
            out |= bit.perm;
        }
    }
    return out;
}

}  // namespace

std::string absoluteNormalizedPath(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

llvm::Error writeGeneratedFile(const std::filesystem::path& path,
                               const llvm::StringRef        content,
                               const EmitWritePolicy&       policy)
{
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absoluteNormalizedPath(path));
    }

    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to stat output path %s", path.string().c_str());
    }
    if (exists)
    {
        if (policy.noOverwrite)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "refusing to overwrite existing output file: %s",
                                           path.string().c_str());
        }
        // A previous run may have left the file read-only.
        const bool removed = std::filesystem::remove(path, ec);
        if (ec || !removed)
        {
            return llvm::createStringError(ec ? ec : llvm::inconvertibleErrorCode(),
                                           "failed to remove existing output file %s",
                                           path.string().c_str());
        }
    }

    llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to open %s", path.string().c_str());
    }
    os << content;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return llvm::createStringError(writeError, "failed to write %s", path.string().c_str());
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }

    return llvm::Error::success();
}

}  // namespace gofreeze
