//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements type descriptor construction and naming helpers.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Model/TypeDescriptor.h"

#include <array>
#include <cstddef>
#include <utility>

namespace gofreeze
{
namespace
{

struct BuiltinScalar final
{
    TypeKind        kind;
    llvm::StringRef name;
};

constexpr std::array<BuiltinScalar, 17> kBuiltinScalars{{
    {TypeKind::Bool, "bool"},
    {TypeKind::Int, "int"},
    {TypeKind::Int8, "int8"},
    {TypeKind::Int16, "int16"},
    {TypeKind::Int32, "int32"},
    {TypeKind::Int64, "int64"},
    {TypeKind::Uint, "uint"},
    {TypeKind::Uint8, "uint8"},
    {TypeKind::Uint16, "uint16"},
    {TypeKind::Uint32, "uint32"},
    {TypeKind::Uint64, "uint64"},
    {TypeKind::Uintptr, "uintptr"},
    {TypeKind::Float32, "float32"},
    {TypeKind::Float64, "float64"},
    {TypeKind::Complex64, "complex64"},
    {TypeKind::Complex128, "complex128"},
    {TypeKind::String, "string"},
}};

TypeRef makeType(TypeDescriptor descriptor)
{
    return std::make_shared<const TypeDescriptor>(std::move(descriptor));
}

bool sameTypeRef(const TypeRef& lhs, const TypeRef& rhs)
{
    if (lhs == rhs)
    {
        return true;
    }
    if (!lhs || !rhs)
    {
        return false;
    }
    return sameType(*lhs, *rhs);
}

}  // namespace

std::string TypeDescriptor::str() const
{
    if (isNamed())
    {
        return packagePath.empty() ? name : packagePath + "." + name;
    }
    switch (kind)
    {
    case TypeKind::Array:
        return "[" + std::to_string(length) + "]" + (elem ? elem->str() : "?");
    case TypeKind::Slice:
        return "[]" + (elem ? elem->str() : "?");
    case TypeKind::Map:
        return "map[" + (key ? key->str() : "?") + "]" + (elem ? elem->str() : "?");
    case TypeKind::Pointer:
        return "*" + (elem ? elem->str() : "?");
    case TypeKind::Interface:
        return "interface{}";
    case TypeKind::Struct:
        return "struct{...}";
    default:
        return typeKindName(kind).str();
    }
}

llvm::StringRef typeKindName(const TypeKind kind)
{
    for (const BuiltinScalar& scalar : kBuiltinScalars)
    {
        if (scalar.kind == kind)
        {
            return scalar.name;
        }
    }
    switch (kind)
    {
    case TypeKind::Array:
        return "array";
    case TypeKind::Slice:
        return "slice";
    case TypeKind::Map:
        return "map";
    case TypeKind::Pointer:
        return "ptr";
    case TypeKind::Interface:
        return "interface";
    case TypeKind::Struct:
        return "struct";
    case TypeKind::Func:
        return "func";
    case TypeKind::Chan:
        return "chan";
    case TypeKind::UnsafePointer:
        return "unsafe.Pointer";
    default:
        return "invalid";
    }
}

std::optional<TypeKind> builtinScalarKind(const llvm::StringRef name)
{
    for (const BuiltinScalar& scalar : kBuiltinScalars)
    {
        if (scalar.name == name)
        {
            return scalar.kind;
        }
    }
    // Go aliases.
    if (name == "byte")
    {
        return TypeKind::Uint8;
    }
    if (name == "rune")
    {
        return TypeKind::Int32;
    }
    return std::nullopt;
}

bool isScalarKind(const TypeKind kind)
{
    for (const BuiltinScalar& scalar : kBuiltinScalars)
    {
        if (scalar.kind == kind)
        {
            return true;
        }
    }
    return false;
}

TypeRef builtinType(const TypeKind kind)
{
    static const std::array<TypeRef, kBuiltinScalars.size()> cache = [] {
        std::array<TypeRef, kBuiltinScalars.size()> out;
        for (std::size_t i = 0; i < kBuiltinScalars.size(); ++i)
        {
            TypeDescriptor descriptor;
            descriptor.kind = kBuiltinScalars[i].kind;
            descriptor.name = kBuiltinScalars[i].name.str();
            out[i]          = makeType(std::move(descriptor));
        }
        return out;
    }();

    for (std::size_t i = 0; i < kBuiltinScalars.size(); ++i)
    {
        if (kBuiltinScalars[i].kind == kind)
        {
            return cache[i];
        }
    }
    TypeDescriptor descriptor;
    descriptor.kind = kind;
    return makeType(std::move(descriptor));
}

TypeRef namedType(const TypeKind kind, std::string packagePath, std::string name)
{
    TypeDescriptor descriptor;
    descriptor.kind        = kind;
    descriptor.packagePath = std::move(packagePath);
    descriptor.name        = std::move(name);
    return makeType(std::move(descriptor));
}

TypeRef structType(std::string packagePath, std::string name)
{
    return namedType(TypeKind::Struct, std::move(packagePath), std::move(name));
}

TypeRef interfaceType(std::string packagePath, std::string name)
{
    return namedType(TypeKind::Interface, std::move(packagePath), std::move(name));
}

TypeRef sliceOf(TypeRef elem)
{
    TypeDescriptor descriptor;
    descriptor.kind = TypeKind::Slice;
    descriptor.elem = std::move(elem);
    return makeType(std::move(descriptor));
}

TypeRef arrayOf(const std::uint64_t length, TypeRef elem)
{
    TypeDescriptor descriptor;
    descriptor.kind   = TypeKind::Array;
    descriptor.length = length;
    descriptor.elem   = std::move(elem);
    return makeType(std::move(descriptor));
}

TypeRef mapOf(TypeRef key, TypeRef elem)
{
    TypeDescriptor descriptor;
    descriptor.kind = TypeKind::Map;
    descriptor.key  = std::move(key);
    descriptor.elem = std::move(elem);
    return makeType(std::move(descriptor));
}

TypeRef pointerTo(TypeRef elem)
{
    TypeDescriptor descriptor;
    descriptor.kind = TypeKind::Pointer;
    descriptor.elem = std::move(elem);
    return makeType(std::move(descriptor));
}

TypeRef opaqueType(const TypeKind kind, std::string spelling)
{
    TypeDescriptor descriptor;
    descriptor.kind = kind;
    descriptor.name = std::move(spelling);
    return makeType(std::move(descriptor));
}

bool sameType(const TypeDescriptor& lhs, const TypeDescriptor& rhs)
{
    return lhs.kind == rhs.kind && lhs.packagePath == rhs.packagePath && lhs.name == rhs.name &&
           lhs.length == rhs.length && sameTypeRef(lhs.elem, rhs.elem) && sameTypeRef(lhs.key, rhs.key);
}

}  // namespace gofreeze
