//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Type descriptor to Go type expression resolution.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_CODEGEN_TYPE_EXPRESSION_H
#define GOFREEZE_CODEGEN_TYPE_EXPRESSION_H

#include "gofreeze/CodeGen/GoCode.h"
#include "gofreeze/Model/TypeDescriptor.h"

namespace gofreeze
{

/// @brief Options controlling type expression spelling.
struct TypeExpressionOptions final
{
    /// @brief Renders arrays as `[N]T` instead of `[]T`.
    bool sizedArrays{false};
};

/// @brief Resolves the Go type expression of a type descriptor.
///
/// @details Maps become `map[K]V`, pointers `*T`, arrays and slices `[]T`
/// (or `[N]T` for arrays with @ref TypeExpressionOptions::sizedArrays).
/// Every other type renders as its qualified name; builtin types carry no
/// package path and render bare. The kind is examined before the name, so a
/// named slice type still renders structurally.
///
/// @param[in] type Type descriptor.
/// @param[in] options Spelling options.
/// @return Type expression.
GoExpr resolveTypeExpression(const TypeDescriptor& type, const TypeExpressionOptions& options = {});

}  // namespace gofreeze

#endif  // GOFREEZE_CODEGEN_TYPE_EXPRESSION_H
