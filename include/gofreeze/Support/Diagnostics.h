//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_SUPPORT_DIAGNOSTICS_H
#define GOFREEZE_SUPPORT_DIAGNOSTICS_H

#include "gofreeze/Frontend/SourceLocation.h"

#include <cstddef>
#include <string>
#include <vector>

#include "llvm/Support/Error.h"

namespace gofreeze
{

/// @file
/// @brief Diagnostic collection interfaces.

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

/// @brief Single diagnostic record.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics emitted during a run.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string message);

    void note(const SourceLocation& location, std::string message);
    void warning(const SourceLocation& location, std::string message);
    void error(const SourceLocation& location, std::string message);

    /// @brief Consumes an error and records its message as an error diagnostic.
    /// @param[in] location Location associated with the failure.
    /// @param[in] err Error to consume; may hold several payloads.
    void error(const SourceLocation& location, llvm::Error err);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts diagnostics of one level.
    [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace gofreeze

#endif  // GOFREEZE_SUPPORT_DIAGNOSTICS_H
