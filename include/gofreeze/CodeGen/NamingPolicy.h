//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go identifier naming policy.
///
/// Keyword and predeclared-identifier tables plus identifier sanitation used
/// when choosing package aliases, package clauses and variable names.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_CODEGEN_NAMING_POLICY_H
#define GOFREEZE_CODEGEN_NAMING_POLICY_H

#include <string>

#include "llvm/ADT/StringRef.h"

namespace gofreeze
{

/// @brief Returns true when an identifier is a Go keyword.
/// @param[in] name Candidate identifier.
/// @return True for the 25 Go keywords.
bool goIsKeyword(llvm::StringRef name);

/// @brief Returns true when an identifier must not be used as a file-local name.
/// @param[in] name Candidate identifier.
/// @return True for keywords and predeclared identifiers (`nil`, `int`, `len`, ...).
bool goIsReservedIdentifier(llvm::StringRef name);

/// @brief Returns true when text is a syntactically valid, non-keyword Go identifier.
/// @param[in] name Candidate identifier.
/// @return Validity; only ASCII letters, digits and underscores are accepted.
bool goIsValidIdentifier(llvm::StringRef name);

/// @brief Sanitizes text into a Go identifier.
/// @param[in] name Candidate identifier.
/// @return Identifier with invalid characters replaced by `_`, a leading digit
///         prefixed with `_`, and a trailing `_` appended to keywords.
std::string goSanitizeIdentifier(llvm::StringRef name);

}  // namespace gofreeze

#endif  // GOFREEZE_CODEGEN_NAMING_POLICY_H
