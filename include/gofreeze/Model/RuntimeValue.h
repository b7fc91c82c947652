//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime value model for values frozen into Go source.
///
/// A runtime value pairs a type descriptor with a closed payload variant that
/// has one alternative per value shape. Composite payloads refer to their
/// children through shared pointers so that sub-values can be shared.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_MODEL_RUNTIME_VALUE_H
#define GOFREEZE_MODEL_RUNTIME_VALUE_H

#include "gofreeze/Model/RecordSchema.h"
#include "gofreeze/Model/TypeDescriptor.h"

#include "llvm/Support/Error.h"

#include <complex>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace gofreeze
{

struct RuntimeValue;

/// @brief Shared handle to a runtime value.
using ValueRef = std::shared_ptr<RuntimeValue>;

/// @brief Platform-width signed integer (`int`).
struct GoInt final
{
    std::int64_t value{0};
};

/// @brief Platform-width unsigned integer (`uint`).
struct GoUint final
{
    std::uint64_t value{0};
};

/// @brief Pointer-sized unsigned integer (`uintptr`).
struct GoUintptr final
{
    std::uint64_t value{0};
};

/// @brief Scalar payload; one alternative per Go scalar kind.
using ScalarValue = std::variant<bool,
                                 GoInt,
                                 std::int8_t,
                                 std::int16_t,
                                 std::int32_t,
                                 std::int64_t,
                                 GoUint,
                                 std::uint8_t,
                                 std::uint16_t,
                                 std::uint32_t,
                                 std::uint64_t,
                                 GoUintptr,
                                 float,
                                 double,
                                 std::complex<float>,
                                 std::complex<double>,
                                 std::string>;

/// @brief Fixed-length array payload.
struct ArrayValue final
{
    std::vector<ValueRef> elements;
};

/// @brief Slice payload. A nil slice is distinct from an empty one.
struct SliceValue final
{
    bool                  isNil{false};
    std::vector<ValueRef> elements;
};

/// @brief One map entry.
struct MapEntry final
{
    ValueRef key;
    ValueRef value;
};

/// @brief Map payload; entries keep the order in which they were encountered.
struct MapValue final
{
    bool                  isNil{false};
    std::vector<MapEntry> entries;
};

/// @brief Pointer payload; a null pointee is the nil pointer.
struct PointerValue final
{
    ValueRef pointee;
};

/// @brief Interface payload; the held value carries its own dynamic type.
struct InterfaceValue final
{
    ValueRef held;
};

/// @brief One struct field instance.
struct FieldValue final
{
    std::string     name;
    FieldVisibility visibility{FieldVisibility::Exported};

    /// @brief Field value; null when the field could not be read.
    ValueRef value;
};

/// @brief Struct payload with fields in declaration order.
struct StructValue final
{
    std::vector<FieldValue> fields;
};

/// @brief Value of a kind with no encoding rule (function reference, channel, unsafe pointer).
struct OpaqueValue final
{
    /// @brief Free-form description of the referenced entity, such as a symbol name.
    std::string description;
};

/// @brief Typed runtime value.
struct RuntimeValue final
{
    using Payload = std::variant<ScalarValue,
                                 ArrayValue,
                                 SliceValue,
                                 MapValue,
                                 PointerValue,
                                 InterfaceValue,
                                 StructValue,
                                 OpaqueValue>;

    /// @brief Dynamic type of this value.
    TypeRef type;

    /// @brief Value payload.
    Payload data;

    /// @brief Returns a pointer to a struct field value by name.
    /// @param[in] name Field name.
    /// @return Field instance, or null when this is not a struct or the field is absent.
    [[nodiscard]] FieldValue* findField(llvm::StringRef name);
};

/// @brief Creates a scalar value of the given type.
/// @param[in] type Scalar type (builtin or named).
/// @param[in] scalar Payload whose alternative matches the type's kind.
/// @return New value.
ValueRef makeScalar(TypeRef type, ScalarValue scalar);

/// @brief Creates a builtin-typed scalar (`bool`, `int8`, `string`, ...), deducing the type from the payload.
/// @param[in] scalar Payload.
/// @return New value.
ValueRef makeScalar(ScalarValue scalar);

ValueRef makeArray(TypeRef type, std::vector<ValueRef> elements);
ValueRef makeSlice(TypeRef type, std::vector<ValueRef> elements);

/// @brief Creates a nil slice of the given slice type.
ValueRef makeNilSlice(TypeRef type);

ValueRef makeMap(TypeRef type, std::vector<MapEntry> entries);

/// @brief Creates a nil map of the given map type.
ValueRef makeNilMap(TypeRef type);

/// @brief Creates a pointer value; a null pointee yields the nil pointer.
ValueRef makePointer(TypeRef type, ValueRef pointee);

/// @brief Creates an interface value; a null held value yields the nil interface.
ValueRef makeInterface(TypeRef type, ValueRef held);

ValueRef makeStruct(TypeRef type, std::vector<FieldValue> fields);

/// @brief Creates a struct value from its schema, with field visibility taken from the schema.
/// @param[in] schema Record schema.
/// @param[in] values One value per schema field, in schema order.
/// @return New value, or an error when the value count differs from the field count.
llvm::Expected<ValueRef> makeRecord(const RecordSchema& schema, std::vector<ValueRef> values);

ValueRef makeOpaque(TypeRef type, std::string description);

/// @brief Returns the scalar kind matching a payload alternative.
/// @param[in] scalar Scalar payload.
/// @return Scalar kind.
TypeKind scalarKind(const ScalarValue& scalar);

/// @brief Builds the Go zero value of a type.
///
/// @details Pointers, slices, maps and interfaces are nil, arrays hold zero
/// elements, structs hold the zero value of every schema field.
///
/// @param[in] type Type to build.
/// @param[in] registry Registry providing struct layouts.
/// @return Zero value, or an error for struct types without a layout or with a
///         layout that contains itself by value.
llvm::Expected<ValueRef> makeZeroValue(const TypeRef& type, const TypeRegistry& registry);

}  // namespace gofreeze

#endif  // GOFREEZE_MODEL_RUNTIME_VALUE_H
