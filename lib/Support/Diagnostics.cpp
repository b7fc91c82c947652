//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace gofreeze
{

void DiagnosticEngine::report(const DiagnosticLevel level, const SourceLocation& location, std::string message)
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

void DiagnosticEngine::error(const SourceLocation& location, llvm::Error err)
{
    llvm::handleAllErrors(std::move(err), [&](const llvm::ErrorInfoBase& info) {
        report(DiagnosticLevel::Error, location, info.message());
    });
}

bool DiagnosticEngine::hasErrors() const
{
    return count(DiagnosticLevel::Error) > 0;
}

std::size_t DiagnosticEngine::count(const DiagnosticLevel level) const
{
    return static_cast<std::size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(), [level](const Diagnostic& d) {
            return d.level == level;
        }));
}

}  // namespace gofreeze
