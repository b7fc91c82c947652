//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements type descriptor to Go type expression resolution.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/TypeExpression.h"

namespace gofreeze
{
namespace
{

GoExpr resolveChild(const TypeRef& child, const TypeExpressionOptions& options)
{
    if (!child)
    {
        return GoExpr::identifier("any");
    }
    return resolveTypeExpression(*child, options);
}

}  // namespace

GoExpr resolveTypeExpression(const TypeDescriptor& type, const TypeExpressionOptions& options)
{
    switch (type.kind)
    {
    case TypeKind::Map:
        return GoExpr::mapType(resolveChild(type.key, options), resolveChild(type.elem, options));
    case TypeKind::Pointer:
        return GoExpr::pointerType(resolveChild(type.elem, options));
    case TypeKind::Array:
        if (options.sizedArrays)
        {
            return GoExpr::arrayType(type.length, resolveChild(type.elem, options));
        }
        return GoExpr::sliceType(resolveChild(type.elem, options));
    case TypeKind::Slice:
        return GoExpr::sliceType(resolveChild(type.elem, options));
    default:
        break;
    }

    if (type.isNamed())
    {
        return GoExpr::qualified(type.packagePath, type.name);
    }
    // Unnamed scalars, interfaces and structs fall back to their Go spelling.
    return GoExpr::identifier(type.str());
}

}  // namespace gofreeze
