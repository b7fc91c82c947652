//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Structural type descriptors for values frozen into Go source.
///
/// A descriptor names the shape of a Go type independently of any value:
/// its kind, its element types for composites, and its package-qualified
/// name for named types.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_MODEL_TYPE_DESCRIPTOR_H
#define GOFREEZE_MODEL_TYPE_DESCRIPTOR_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace gofreeze
{

/// @brief Kind tag of a Go type.
enum class TypeKind
{
    Bool,
    Int,
    Int8,
    Int16,
    Int32,
    Int64,
    Uint,
    Uint8,
    Uint16,
    Uint32,
    Uint64,
    Uintptr,
    Float32,
    Float64,
    Complex64,
    Complex128,
    String,
    Array,
    Slice,
    Map,
    Pointer,
    Interface,
    Struct,

    /// @brief Function reference. Has no encoding rule.
    Func,

    /// @brief Channel. Has no encoding rule.
    Chan,

    /// @brief `unsafe.Pointer`. Has no encoding rule.
    UnsafePointer,
};

struct TypeDescriptor;

/// @brief Shared immutable handle to a type descriptor.
using TypeRef = std::shared_ptr<const TypeDescriptor>;

/// @brief Immutable structural description of one Go type.
struct TypeDescriptor final
{
    /// @brief Kind tag.
    TypeKind kind{TypeKind::Bool};

    /// @brief Import path of the declaring package; empty for builtin and unnamed types.
    std::string packagePath;

    /// @brief Local type name; empty for unnamed composite types.
    std::string name;

    /// @brief Element type for arrays, slices and maps; pointee for pointers.
    TypeRef elem;

    /// @brief Key type for maps.
    TypeRef key;

    /// @brief Element count for arrays.
    std::uint64_t length{0};

    /// @brief Indicates whether the type carries a declared name.
    [[nodiscard]] bool isNamed() const
    {
        return !name.empty();
    }

    /// @brief Returns `packagePath.name` for named types, or the Go spelling otherwise.
    /// @return Human-readable type text used in diagnostics.
    [[nodiscard]] std::string str() const;
};

/// @brief Returns the lower-case Go spelling of a kind (`int8`, `slice`, `unsafe.Pointer`).
/// @param[in] kind Kind tag.
/// @return Kind name.
llvm::StringRef typeKindName(TypeKind kind);

/// @brief Parses a builtin scalar type name (`bool`, `int32`, `string`, ...).
/// @param[in] name Candidate builtin name.
/// @return Scalar kind, or `std::nullopt` when `name` is not a builtin scalar.
std::optional<TypeKind> builtinScalarKind(llvm::StringRef name);

/// @brief Indicates whether a kind is one of the scalar kinds.
/// @param[in] kind Kind tag.
/// @return True for bool, integer, float, complex and string kinds.
bool isScalarKind(TypeKind kind);

/// @brief Returns the shared descriptor of a builtin scalar type.
/// @param[in] kind Scalar kind.
/// @return Descriptor with an empty package path and the builtin name.
TypeRef builtinType(TypeKind kind);

/// @brief Creates a named type (`ast.OperatorKind`, `ast.Package`, `ast.Node`).
/// @param[in] kind Underlying kind (scalar, struct or interface).
/// @param[in] packagePath Import path of the declaring package.
/// @param[in] name Local type name.
/// @return New descriptor.
TypeRef namedType(TypeKind kind, std::string packagePath, std::string name);

/// @brief Creates a struct type descriptor.
TypeRef structType(std::string packagePath, std::string name);

/// @brief Creates an interface type descriptor.
TypeRef interfaceType(std::string packagePath, std::string name);

/// @brief Creates an unnamed slice type `[]elem`.
TypeRef sliceOf(TypeRef elem);

/// @brief Creates an unnamed array type `[length]elem`.
TypeRef arrayOf(std::uint64_t length, TypeRef elem);

/// @brief Creates an unnamed map type `map[key]elem`.
TypeRef mapOf(TypeRef key, TypeRef elem);

/// @brief Creates an unnamed pointer type `*elem`.
TypeRef pointerTo(TypeRef elem);

/// @brief Creates a type of a kind that has no encoding rule (func, chan, unsafe pointer).
/// @param[in] kind One of `Func`, `Chan` or `UnsafePointer`.
/// @param[in] spelling Optional Go spelling such as `func(int) bool`.
/// @return New descriptor.
TypeRef opaqueType(TypeKind kind, std::string spelling = "");

/// @brief Structural equality of two descriptors.
/// @param[in] lhs Left operand.
/// @param[in] rhs Right operand.
/// @return True when kind, names, length and element types all match.
bool sameType(const TypeDescriptor& lhs, const TypeDescriptor& rhs);

}  // namespace gofreeze

#endif  // GOFREEZE_MODEL_TYPE_DESCRIPTOR_H
