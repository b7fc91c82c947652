//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Unit generation: one frozen Go file per value-document directory plus the
/// aggregate import file.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_DRIVER_GENERATE_H
#define GOFREEZE_DRIVER_GENERATE_H

#include <cstddef>
#include <string>
#include <vector>

#include "gofreeze/CodeGen/ValueEncoder.h"
#include "gofreeze/Driver/GenerateConfig.h"
#include "gofreeze/Frontend/ValueDocument.h"
#include "gofreeze/Support/Diagnostics.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace gofreeze
{

/// @brief Outcome of a successful `generate` run.
struct GenerateResult final
{
    /// @brief Absolute paths of written (or, in dry-run mode, planned) files.
    std::vector<std::string> outputFiles;

    /// @brief Import paths of generated units other than the root package.
    std::vector<std::string> unitImportPaths;

    /// @brief Number of directories visited.
    std::size_t directoriesVisited{0};

    /// @brief Number of units encoded.
    std::size_t unitsGenerated{0};
};

/// @brief Derives encoder options from a configuration.
EncodeOptions encodeOptionsFor(const GenerateConfig& config);

/// @brief Writes a unit's relative path into the top-level record.
///
/// @details The top-level value may be the record itself or a pointer to it.
/// Nothing is changed, and false is returned, when there is no such record or
/// it has no string field named @p fieldName.
///
/// @param[in,out] document Loaded document.
/// @param[in] fieldName Field to assign.
/// @param[in] relativePath Value to assign.
/// @return True when the field was assigned.
bool assignUnitPath(ValueDocument& document, llvm::StringRef fieldName, llvm::StringRef relativePath);

/// @brief Encodes a document's root value as one Go expression.
/// @param[in] document Loaded document.
/// @param[in] options Encoder options.
/// @return Rendered expression text; qualified names use the guessed package aliases.
llvm::Expected<std::string> renderDocumentExpression(const ValueDocument& document, const EncodeOptions& options);

/// @brief Runs the generator over the configured root directory.
///
/// @details Units are processed in walk order and each file is written as soon
/// as its unit encodes; the first failure stops the run before the failing
/// unit's file is written. The import file is written last.
///
/// @param[in] config Validated configuration.
/// @param[in,out] diagnostics Sink for non-fatal findings.
/// @param[in] log Optional progress stream used when @ref GenerateConfig::verbose is set.
/// @return Run result or the first error.
llvm::Expected<GenerateResult> runGenerate(const GenerateConfig& config,
                                           DiagnosticEngine&     diagnostics,
                                           llvm::raw_ostream*    log = nullptr);

}  // namespace gofreeze

#endif  // GOFREEZE_DRIVER_GENERATE_H
