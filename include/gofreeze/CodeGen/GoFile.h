//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go source-file assembly for frozen units and the aggregate import file.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_CODEGEN_GO_FILE_H
#define GOFREEZE_CODEGEN_GO_FILE_H

#include <string>
#include <vector>

#include "gofreeze/CodeGen/GoCode.h"

#include "llvm/Support/Error.h"

namespace gofreeze
{

/// @brief Header comment written at the top of every generated file.
inline constexpr const char* kDefaultHeaderComment =
    "// DO NOT EDIT: This file is autogenerated via the gofreeze generate command.";

/// @brief Layout of one frozen-unit Go file.
struct GoUnitFileSpec final
{
    /// @brief Header comment line(s), each starting with `//`.
    std::string headerComment{kDefaultHeaderComment};

    /// @brief Name in the package clause.
    std::string packageName;

    /// @brief Import path of the file's own package; its names render unqualified.
    std::string packagePath;

    /// @brief Registration function as `<import path>.<Name>`; empty omits the `init` stub.
    std::string registerFunc;

    /// @brief Name of the frozen variable.
    std::string variable{"pkgAST"};
};

/// @brief Renders a frozen-unit file.
///
/// @details The file holds, in order: header comment, package clause,
/// imports, `func init() { <registerFunc>(<variable>) }` and
/// `var <variable> = <value>`.
///
/// @param[in] spec File layout.
/// @param[in] value Encoded value.
/// @return Go source text, or an error for an invalid package, variable or registration name.
llvm::Expected<std::string> renderUnitFile(const GoUnitFileSpec& spec, const GoExpr& value);

/// @brief Renders the aggregate file that blank-imports every generated package.
/// @param[in] headerComment Header comment line(s).
/// @param[in] packageName Name in the package clause.
/// @param[in] importPaths Import paths, emitted sorted.
/// @return Go source text.
std::string renderImportFile(const std::string&              headerComment,
                             const std::string&              packageName,
                             const std::vector<std::string>& importPaths);

/// @brief Renders an import declaration; one import is unparenthesized, several are grouped.
/// @param[in] imports Imports in emission order.
/// @return Declaration text ending with a newline, or an empty string.
std::string renderImportDecl(const std::vector<GoImport>& imports);

}  // namespace gofreeze

#endif  // GOFREEZE_CODEGEN_GO_FILE_H
