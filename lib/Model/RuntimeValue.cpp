//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements runtime value construction and zero-value synthesis.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Model/RuntimeValue.h"

#include <set>
#include <type_traits>
#include <utility>

namespace gofreeze
{
namespace
{

ValueRef makeValue(TypeRef type, RuntimeValue::Payload payload)
{
    auto value  = std::make_shared<RuntimeValue>();
    value->type = std::move(type);
    value->data = std::move(payload);
    return value;
}

ScalarValue zeroScalar(const TypeKind kind)
{
    switch (kind)
    {
    case TypeKind::Bool:
        return false;
    case TypeKind::Int:
        return GoInt{};
    case TypeKind::Int8:
        return std::int8_t{0};
    case TypeKind::Int16:
        return std::int16_t{0};
    case TypeKind::Int32:
        return std::int32_t{0};
    case TypeKind::Int64:
        return std::int64_t{0};
    case TypeKind::Uint:
        return GoUint{};
    case TypeKind::Uint8:
        return std::uint8_t{0};
    case TypeKind::Uint16:
        return std::uint16_t{0};
    case TypeKind::Uint32:
        return std::uint32_t{0};
    case TypeKind::Uint64:
        return std::uint64_t{0};
    case TypeKind::Uintptr:
        return GoUintptr{};
    case TypeKind::Float32:
        return 0.0F;
    case TypeKind::Float64:
        return 0.0;
    case TypeKind::Complex64:
        return std::complex<float>{};
    case TypeKind::Complex128:
        return std::complex<double>{};
    default:
        return std::string();
    }
}

llvm::Expected<ValueRef> zeroValueImpl(const TypeRef&         type,
                                       const TypeRegistry&    registry,
                                       std::set<std::string>& inProgress)
{
    if (isScalarKind(type->kind))
    {
        return makeScalar(type, zeroScalar(type->kind));
    }

    switch (type->kind)
    {
    case TypeKind::Array: {
        std::vector<ValueRef> elements;
        elements.reserve(static_cast<std::size_t>(type->length));
        for (std::uint64_t i = 0; i < type->length; ++i)
        {
            auto element = zeroValueImpl(type->elem, registry, inProgress);
            if (!element)
            {
                return element.takeError();
            }
            elements.push_back(std::move(*element));
        }
        return makeArray(type, std::move(elements));
    }
    case TypeKind::Slice:
        return makeNilSlice(type);
    case TypeKind::Map:
        return makeNilMap(type);
    case TypeKind::Pointer:
        return makePointer(type, nullptr);
    case TypeKind::Interface:
        return makeInterface(type, nullptr);
    case TypeKind::Struct: {
        const RecordSchema* schema = registry.findRecord(*type);
        if (schema == nullptr)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "no record layout for struct type %s",
                                           type->str().c_str());
        }
        const std::string key = type->str();
        if (!inProgress.insert(key).second)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "struct type %s contains itself by value",
                                           key.c_str());
        }
        std::vector<ValueRef> values;
        values.reserve(schema->fields.size());
        for (const FieldDescriptor& field : schema->fields)
        {
            auto value = zeroValueImpl(field.type, registry, inProgress);
            if (!value)
            {
                return value.takeError();
            }
            values.push_back(std::move(*value));
        }
        inProgress.erase(key);
        return makeRecord(*schema, std::move(values));
    }
    default:
        return makeOpaque(type, "nil");
    }
}

}  // namespace

FieldValue* RuntimeValue::findField(const llvm::StringRef name)
{
    auto* record = std::get_if<StructValue>(&data);
    if (record == nullptr)
    {
        return nullptr;
    }
    for (FieldValue& field : record->fields)
    {
        if (field.name == name)
        {
            return &field;
        }
    }
    return nullptr;
}

ValueRef makeScalar(TypeRef type, ScalarValue scalar)
{
    return makeValue(std::move(type), std::move(scalar));
}

ValueRef makeScalar(ScalarValue scalar)
{
    const TypeKind kind = scalarKind(scalar);
    return makeValue(builtinType(kind), std::move(scalar));
}

ValueRef makeArray(TypeRef type, std::vector<ValueRef> elements)
{
    return makeValue(std::move(type), ArrayValue{std::move(elements)});
}

ValueRef makeSlice(TypeRef type, std::vector<ValueRef> elements)
{
    return makeValue(std::move(type), SliceValue{false, std::move(elements)});
}

ValueRef makeNilSlice(TypeRef type)
{
    return makeValue(std::move(type), SliceValue{true, {}});
}

ValueRef makeMap(TypeRef type, std::vector<MapEntry> entries)
{
    return makeValue(std::move(type), MapValue{false, std::move(entries)});
}

ValueRef makeNilMap(TypeRef type)
{
    return makeValue(std::move(type), MapValue{true, {}});
}

ValueRef makePointer(TypeRef type, ValueRef pointee)
{
    return makeValue(std::move(type), PointerValue{std::move(pointee)});
}

ValueRef makeInterface(TypeRef type, ValueRef held)
{
    return makeValue(std::move(type), InterfaceValue{std::move(held)});
}

ValueRef makeStruct(TypeRef type, std::vector<FieldValue> fields)
{
    return makeValue(std::move(type), StructValue{std::move(fields)});
}

llvm::Expected<ValueRef> makeRecord(const RecordSchema& schema, std::vector<ValueRef> values)
{
    if (values.size() != schema.fields.size())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "record %s expects %zu field values, got %zu",
                                       schema.type->str().c_str(),
                                       schema.fields.size(),
                                       values.size());
    }
    std::vector<FieldValue> fields;
    fields.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        fields.push_back(FieldValue{schema.fields[i].name, schema.fields[i].visibility, std::move(values[i])});
    }
    return makeStruct(schema.type, std::move(fields));
}

ValueRef makeOpaque(TypeRef type, std::string description)
{
    return makeValue(std::move(type), OpaqueValue{std::move(description)});
}

TypeKind scalarKind(const ScalarValue& scalar)
{
    return std::visit(
        [](const auto& v) -> TypeKind {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
            {
                return TypeKind::Bool;
            }
            else if constexpr (std::is_same_v<T, GoInt>)
            {
                return TypeKind::Int;
            }
            else if constexpr (std::is_same_v<T, std::int8_t>)
            {
                return TypeKind::Int8;
            }
            else if constexpr (std::is_same_v<T, std::int16_t>)
            {
                return TypeKind::Int16;
            }
            else if constexpr (std::is_same_v<T, std::int32_t>)
            {
                return TypeKind::Int32;
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return TypeKind::Int64;
            }
            else if constexpr (std::is_same_v<T, GoUint>)
            {
                return TypeKind::Uint;
            }
            else if constexpr (std::is_same_v<T, std::uint8_t>)
            {
                return TypeKind::Uint8;
            }
            else if constexpr (std::is_same_v<T, std::uint16_t>)
            {
                return TypeKind::Uint16;
            }
            else if constexpr (std::is_same_v<T, std::uint32_t>)
            {
                return TypeKind::Uint32;
            }
            else if constexpr (std::is_same_v<T, std::uint64_t>)
            {
                return TypeKind::Uint64;
            }
            else if constexpr (std::is_same_v<T, GoUintptr>)
            {
                return TypeKind::Uintptr;
            }
            else if constexpr (std::is_same_v<T, float>)
            {
                return TypeKind::Float32;
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return TypeKind::Float64;
            }
            else if constexpr (std::is_same_v<T, std::complex<float>>)
            {
                return TypeKind::Complex64;
            }
            else if constexpr (std::is_same_v<T, std::complex<double>>)
            {
                return TypeKind::Complex128;
            }
            else
            {
                static_assert(std::is_same_v<T, std::string>, "unhandled scalar alternative");
                return TypeKind::String;
            }
        },
        scalar);
}

llvm::Expected<ValueRef> makeZeroValue(const TypeRef& type, const TypeRegistry& registry)
{
    std::set<std::string> inProgress;
    return zeroValueImpl(type, registry, inProgress);
}

}  // namespace gofreeze
