//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "gofreeze/CodeGen/EmitCommon.h"

#include "llvm/Support/Error.h"

namespace
{

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("gofreeze-emit-tests-" + std::to_string(now));
}

std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool runWithTempDir(const std::filesystem::path& root)
{
    using gofreeze::EmitWritePolicy;
    using gofreeze::writeGeneratedFile;

    std::vector<std::string> recorded;
    EmitWritePolicy          dryRun;
    dryRun.dryRun          = true;
    dryRun.recordedOutputs = &recorded;

    const std::filesystem::path target = root / "nested" / "freeze_gen.go";
    if (auto err = writeGeneratedFile(target, "package nested\n", dryRun))
    {
        std::cerr << "dry run write failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (std::filesystem::exists(target) || recorded.size() != 1 ||
        recorded.front() != gofreeze::absoluteNormalizedPath(target))
    {
        std::cerr << "dry run should record without writing\n";
        return false;
    }

    EmitWritePolicy write;
    if (auto err = writeGeneratedFile(target, "package nested\n", write))
    {
        std::cerr << "write failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (readTextFile(target) != "package nested\n")
    {
        std::cerr << "written content mismatch\n";
        return false;
    }
    const auto perms = std::filesystem::status(target).permissions();
    if ((perms & std::filesystem::perms::owner_write) == std::filesystem::perms::none ||
        (perms & std::filesystem::perms::others_write) != std::filesystem::perms::none)
    {
        std::cerr << "default file mode mismatch\n";
        return false;
    }

    // Read-only output from an earlier run is replaced.
    EmitWritePolicy readOnly;
    readOnly.fileMode = 0444U;
    if (auto err = writeGeneratedFile(target, "package first\n", readOnly))
    {
        std::cerr << "read-only write failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (auto err = writeGeneratedFile(target, "package second\n", write))
    {
        std::cerr << "overwrite failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (readTextFile(target) != "package second\n")
    {
        std::cerr << "overwritten content mismatch\n";
        return false;
    }

    EmitWritePolicy keep;
    keep.noOverwrite = true;
    if (auto err = writeGeneratedFile(target, "package third\n", keep))
    {
        const std::string message = llvm::toString(std::move(err));
        if (message.find("refusing to overwrite") == std::string::npos)
        {
            std::cerr << "no-overwrite message mismatch: " << message << "\n";
            return false;
        }
    }
    else
    {
        std::cerr << "expected no-overwrite failure\n";
        return false;
    }
    if (readTextFile(target) != "package second\n")
    {
        std::cerr << "no-overwrite should leave the file untouched\n";
        return false;
    }

    if (gofreeze::absoluteNormalizedPath("/tmp/a/../b/./c.go") != "/tmp/b/c.go")
    {
        std::cerr << "path normalization mismatch\n";
        return false;
    }
    return true;
}

}  // namespace

bool runEmitCommonTests()
{
    const std::filesystem::path root = makeUniqueTempDir();
    const bool                  ok   = runWithTempDir(root);
    std::error_code             ec;
    std::filesystem::remove_all(root, ec);
    return ok;
}
