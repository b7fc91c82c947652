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
#include <string>
#include <system_error>
#include <vector>

#include "gofreeze/Frontend/Discovery.h"

#include "llvm/Support/Error.h"

namespace
{

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("gofreeze-discovery-tests-" + std::to_string(now));
}

void touch(const std::filesystem::path& path)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << "{}";
}

bool runWithTempDir(const std::filesystem::path& root)
{
    touch(root / "root.gofreeze.json");
    touch(root / "notes.json");
    touch(root / "zeta" / "z.gofreeze.json");
    touch(root / "alpha" / "b.gofreeze.json");
    touch(root / "alpha" / "a.gofreeze.json");
    touch(root / "alpha" / "inner" / "x.txt");
    std::filesystem::create_directories(root / "empty");

    std::vector<std::string> order;
    std::vector<std::size_t> counts;
    auto visit = [&](const gofreeze::UnitDirectory& unit) -> llvm::Error {
        order.push_back(unit.relativePath);
        counts.push_back(unit.documents.size());
        if (unit.relativePath == "alpha" && unit.documents.front().filename() != "a.gofreeze.json")
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "documents not sorted");
        }
        return llvm::Error::success();
    };
    auto err = gofreeze::walkUnitDirectories(root, gofreeze::kDefaultDocumentSuffix, visit);
    if (err)
    {
        std::cerr << "walk failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    const std::vector<std::string> expectedOrder  = {".", "alpha", "alpha/inner", "empty", "zeta"};
    const std::vector<std::size_t> expectedCounts = {1, 2, 0, 0, 1};
    if (order != expectedOrder || counts != expectedCounts)
    {
        std::cerr << "walk order mismatch:";
        for (const std::string& entry : order)
        {
            std::cerr << " " << entry;
        }
        std::cerr << "\n";
        return false;
    }

    // A visitor error stops the walk.
    std::size_t visited = 0;
    auto        stop    = gofreeze::walkUnitDirectories(root, ".gofreeze.json", [&](const gofreeze::UnitDirectory&) {
        ++visited;
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "stop");
    });
    if (!stop || visited != 1)
    {
        llvm::consumeError(std::move(stop));
        std::cerr << "visitor error should stop the walk\n";
        return false;
    }
    llvm::consumeError(std::move(stop));

    auto missing = gofreeze::walkUnitDirectories(root / "does-not-exist",
                                                 ".gofreeze.json",
                                                 [](const gofreeze::UnitDirectory&) -> llvm::Error {
                                                     return llvm::Error::success();
                                                 });
    if (!missing)
    {
        std::cerr << "expected missing root failure\n";
        return false;
    }
    llvm::consumeError(std::move(missing));
    return true;
}

}  // namespace

bool runDiscoveryTests()
{
    const std::filesystem::path root = makeUniqueTempDir();
    const bool                  ok   = runWithTempDir(root);
    std::error_code             ec;
    std::filesystem::remove_all(root, ec);
    return ok;
}
