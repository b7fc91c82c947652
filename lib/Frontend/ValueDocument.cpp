//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON value-document loading.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Frontend/ValueDocument.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

#include "llvm/Support/raw_ostream.h"

namespace gofreeze
{
namespace
{

llvm::Error loadError(const llvm::StringRef path, const std::string& message)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "%s: %s", path.str().c_str(), message.c_str());
}

std::string fieldPath(const llvm::StringRef path, const llvm::StringRef field)
{
    return path.str() + "." + field.str();
}

std::string indexPath(const llvm::StringRef path, const std::size_t index)
{
    return path.str() + "[" + std::to_string(index) + "]";
}

std::string keyPath(const llvm::StringRef path, const llvm::StringRef key)
{
    return path.str() + "[\"" + key.str() + "\"]";
}

std::string describeJson(const llvm::json::Value& value)
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    os << value;
    return os.str();
}

std::vector<std::string> sortedKeys(const llvm::json::Object& object)
{
    std::vector<std::string> keys;
    keys.reserve(object.size());
    for (const auto& entry : object)
    {
        keys.push_back(llvm::StringRef(entry.first).str());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::optional<std::int64_t> jsonSigned(const llvm::json::Value& value)
{
    if (auto integer = value.getAsInteger())
    {
        return *integer;
    }
    if (auto text = value.getAsString())
    {
        std::int64_t parsed = 0;
        if (!text->getAsInteger(0, parsed))
        {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> jsonUnsigned(const llvm::json::Value& value)
{
    if (auto integer = value.getAsUINT64())
    {
        return *integer;
    }
    if (auto text = value.getAsString())
    {
        std::uint64_t parsed = 0;
        if (!text->getAsInteger(0, parsed))
        {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<double> jsonFloat(const llvm::json::Value& value)
{
    if (auto number = value.getAsNumber())
    {
        return *number;
    }
    if (auto text = value.getAsString())
    {
        if (*text == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (*text == "+Inf" || *text == "Inf")
        {
            return std::numeric_limits<double>::infinity();
        }
        if (*text == "-Inf")
        {
            return -std::numeric_limits<double>::infinity();
        }
        // The JSON number -0 parses as the integer 0 and loses its sign.
        if (*text == "-0")
        {
            return -0.0;
        }
    }
    return std::nullopt;
}

template <typename Int>
llvm::Expected<ScalarValue> signedScalar(const llvm::json::Value& json, const TypeKind kind, const llvm::StringRef path)
{
    const auto value = jsonSigned(json);
    if (!value || *value < std::numeric_limits<Int>::min() || *value > std::numeric_limits<Int>::max())
    {
        return loadError(path, "expected " + typeKindName(kind).str() + " value, got " + describeJson(json));
    }
    return ScalarValue(std::in_place_type<Int>, static_cast<Int>(*value));
}

template <typename UInt>
llvm::Expected<ScalarValue> unsignedScalar(const llvm::json::Value& json, const TypeKind kind, const llvm::StringRef path)
{
    const auto value = jsonUnsigned(json);
    if (!value || *value > std::numeric_limits<UInt>::max())
    {
        return loadError(path, "expected " + typeKindName(kind).str() + " value, got " + describeJson(json));
    }
    return ScalarValue(std::in_place_type<UInt>, static_cast<UInt>(*value));
}

llvm::Expected<std::pair<double, double>> complexParts(const llvm::json::Value& json, const llvm::StringRef path)
{
    const auto* parts = json.getAsArray();
    if (parts == nullptr || parts->size() != 2)
    {
        return loadError(path, "expected complex value as [real, imag], got " + describeJson(json));
    }
    const auto re = jsonFloat((*parts)[0]);
    const auto im = jsonFloat((*parts)[1]);
    if (!re || !im)
    {
        return loadError(path, "complex parts must be numbers, got " + describeJson(json));
    }
    return std::make_pair(*re, *im);
}

llvm::Expected<ScalarValue> parseScalar(const llvm::json::Value& json, const TypeKind kind, const llvm::StringRef path)
{
    switch (kind)
    {
    case TypeKind::Bool:
        if (auto flag = json.getAsBoolean())
        {
            return ScalarValue(*flag);
        }
        return loadError(path, "expected bool value, got " + describeJson(json));
    case TypeKind::Int: {
        const auto value = jsonSigned(json);
        if (!value)
        {
            return loadError(path, "expected int value, got " + describeJson(json));
        }
        return ScalarValue(GoInt{*value});
    }
    case TypeKind::Int8:
        return signedScalar<std::int8_t>(json, kind, path);
    case TypeKind::Int16:
        return signedScalar<std::int16_t>(json, kind, path);
    case TypeKind::Int32:
        return signedScalar<std::int32_t>(json, kind, path);
    case TypeKind::Int64:
        return signedScalar<std::int64_t>(json, kind, path);
    case TypeKind::Uint:
    case TypeKind::Uintptr: {
        const auto value = jsonUnsigned(json);
        if (!value)
        {
            return loadError(path, "expected " + typeKindName(kind).str() + " value, got " + describeJson(json));
        }
        if (kind == TypeKind::Uint)
        {
            return ScalarValue(GoUint{*value});
        }
        return ScalarValue(GoUintptr{*value});
    }
    case TypeKind::Uint8:
        return unsignedScalar<std::uint8_t>(json, kind, path);
    case TypeKind::Uint16:
        return unsignedScalar<std::uint16_t>(json, kind, path);
    case TypeKind::Uint32:
        return unsignedScalar<std::uint32_t>(json, kind, path);
    case TypeKind::Uint64:
        return unsignedScalar<std::uint64_t>(json, kind, path);
    case TypeKind::Float32:
    case TypeKind::Float64: {
        const auto value = jsonFloat(json);
        if (!value)
        {
            return loadError(path, "expected " + typeKindName(kind).str() + " value, got " + describeJson(json));
        }
        if (kind == TypeKind::Float32)
        {
            return ScalarValue(static_cast<float>(*value));
        }
        return ScalarValue(*value);
    }
    case TypeKind::Complex64: {
        auto parts = complexParts(json, path);
        if (!parts)
        {
            return parts.takeError();
        }
        return ScalarValue(
            std::complex<float>(static_cast<float>(parts->first), static_cast<float>(parts->second)));
    }
    case TypeKind::Complex128: {
        auto parts = complexParts(json, path);
        if (!parts)
        {
            return parts.takeError();
        }
        return ScalarValue(std::complex<double>(parts->first, parts->second));
    }
    case TypeKind::String:
        if (auto text = json.getAsString())
        {
            return ScalarValue(text->str());
        }
        return loadError(path, "expected string value, got " + describeJson(json));
    default:
        return loadError(path, typeKindName(kind).str() + " is not a scalar kind");
    }
}

llvm::Error parseElements(const llvm::json::Value& json,
                          const TypeRef&           type,
                          const TypeRegistry&      registry,
                          const llvm::StringRef    path,
                          std::vector<ValueRef>&   out)
{
    const auto* items = json.getAsArray();
    if (items == nullptr)
    {
        return loadError(path, "expected array for " + type->str() + ", got " + describeJson(json));
    }
    out.reserve(items->size());
    for (std::size_t i = 0; i < items->size(); ++i)
    {
        auto element = parseTypedValue((*items)[i], type->elem, registry, indexPath(path, i));
        if (!element)
        {
            return element.takeError();
        }
        out.push_back(std::move(*element));
    }
    return llvm::Error::success();
}

llvm::Expected<ValueRef> parseMap(const llvm::json::Value& json,
                                  const TypeRef&           type,
                                  const TypeRegistry&      registry,
                                  const llvm::StringRef    path)
{
    if (json.getAsNull())
    {
        return makeNilMap(type);
    }
    const auto* pairs = json.getAsArray();
    if (pairs == nullptr)
    {
        return loadError(path, "expected map as an array of [key, value] pairs, got " + describeJson(json));
    }

    std::vector<MapEntry>                 entries;
    std::vector<const llvm::json::Value*> seenKeys;
    entries.reserve(pairs->size());
    for (std::size_t i = 0; i < pairs->size(); ++i)
    {
        const std::string itemPath = indexPath(path, i);
        const auto*       pair     = (*pairs)[i].getAsArray();
        if (pair == nullptr || pair->size() != 2)
        {
            return loadError(itemPath, "expected [key, value] pair, got " + describeJson((*pairs)[i]));
        }
        const llvm::json::Value& keyJson = (*pair)[0];
        for (const llvm::json::Value* seen : seenKeys)
        {
            if (*seen == keyJson)
            {
                return loadError(itemPath, "duplicate map key " + describeJson(keyJson));
            }
        }
        seenKeys.push_back(&keyJson);

        auto key = parseTypedValue(keyJson, type->key, registry, indexPath(itemPath, 0));
        if (!key)
        {
            return key.takeError();
        }
        auto value = parseTypedValue((*pair)[1], type->elem, registry, indexPath(itemPath, 1));
        if (!value)
        {
            return value.takeError();
        }
        entries.push_back(MapEntry{std::move(*key), std::move(*value)});
    }
    return makeMap(type, std::move(entries));
}

llvm::Expected<ValueRef> parseRecord(const llvm::json::Value& json,
                                     const TypeRef&           type,
                                     const TypeRegistry&      registry,
                                     const llvm::StringRef    path)
{
    const RecordSchema* schema = registry.findRecord(*type);
    if (schema == nullptr)
    {
        return loadError(path, "no layout declared for struct type " + type->str());
    }
    const auto* object = json.getAsObject();
    if (object == nullptr)
    {
        return loadError(path, "expected object for " + type->str() + ", got " + describeJson(json));
    }
    for (const std::string& key : sortedKeys(*object))
    {
        if (schema->indexOf(key) == schema->fields.size())
        {
            return loadError(path, "unknown field '" + key + "' for " + type->str());
        }
    }

    std::vector<ValueRef> values;
    values.reserve(schema->fields.size());
    for (const FieldDescriptor& field : schema->fields)
    {
        llvm::Expected<ValueRef> value = [&]() -> llvm::Expected<ValueRef> {
            if (const llvm::json::Value* fieldJson = object->get(field.name))
            {
                return parseTypedValue(*fieldJson, field.type, registry, fieldPath(path, field.name));
            }
            return makeZeroValue(field.type, registry);
        }();
        if (!value)
        {
            return value.takeError();
        }
        values.push_back(std::move(*value));
    }
    return makeRecord(*schema, std::move(values));
}

llvm::Expected<ValueRef> parseInterface(const llvm::json::Value& json,
                                        const TypeRef&           type,
                                        const TypeRegistry&      registry,
                                        const llvm::StringRef    path)
{
    if (json.getAsNull())
    {
        return makeInterface(type, nullptr);
    }
    const auto* object = json.getAsObject();
    const auto* heldType = object == nullptr ? nullptr : object->get("type");
    if (heldType == nullptr)
    {
        return loadError(path,
                         "expected interface value as {\"type\": ..., \"value\": ...}, got " + describeJson(json));
    }
    auto concrete = parseTypeRef(*heldType, registry, fieldPath(path, "type"));
    if (!concrete)
    {
        return concrete.takeError();
    }
    if ((*concrete)->kind == TypeKind::Interface)
    {
        return loadError(path, "interface value must hold a concrete type, got " + (*concrete)->str());
    }
    const llvm::json::Value* heldJson = object->get("value");
    const llvm::json::Value  nullJson(nullptr);
    auto held = parseTypedValue(heldJson == nullptr ? nullJson : *heldJson, *concrete, registry, fieldPath(path, "value"));
    if (!held)
    {
        return held.takeError();
    }
    return makeInterface(type, std::move(*held));
}

llvm::Expected<TypeRef> parseInlineType(const llvm::json::Object& object,
                                        const TypeRegistry&       registry,
                                        const llvm::StringRef     path)
{
    const auto kind = object.getString("kind");
    if (!kind)
    {
        return loadError(path, "missing required string field: kind");
    }

    auto child = [&](const llvm::StringRef key) -> llvm::Expected<TypeRef> {
        const llvm::json::Value* ref = object.get(key);
        if (ref == nullptr)
        {
            return loadError(path, kind->str() + " type requires '" + key.str() + "'");
        }
        return parseTypeRef(*ref, registry, fieldPath(path, key));
    };

    if (*kind == "slice" || *kind == "pointer")
    {
        auto elem = child("elem");
        if (!elem)
        {
            return elem.takeError();
        }
        return *kind == "slice" ? sliceOf(std::move(*elem)) : pointerTo(std::move(*elem));
    }
    if (*kind == "array")
    {
        const auto length = object.getInteger("length");
        if (!length || *length < 0)
        {
            return loadError(path, "array type requires a non-negative integer 'length'");
        }
        auto elem = child("elem");
        if (!elem)
        {
            return elem.takeError();
        }
        return arrayOf(static_cast<std::uint64_t>(*length), std::move(*elem));
    }
    if (*kind == "map")
    {
        auto key = child("key");
        if (!key)
        {
            return key.takeError();
        }
        const TypeKind keyKind = (*key)->kind;
        if (keyKind == TypeKind::Slice || keyKind == TypeKind::Map || keyKind == TypeKind::Func)
        {
            return loadError(path, "invalid map key type " + (*key)->str());
        }
        auto elem = child("elem");
        if (!elem)
        {
            return elem.takeError();
        }
        return mapOf(std::move(*key), std::move(*elem));
    }
    if (*kind == "interface")
    {
        return interfaceType("", "");
    }
    if (*kind == "func")
    {
        const auto signature = object.getString("signature");
        return opaqueType(TypeKind::Func, signature ? signature->str() : "func()");
    }
    if (*kind == "chan")
    {
        const auto spelling = object.getString("spelling");
        return opaqueType(TypeKind::Chan, spelling ? spelling->str() : "chan any");
    }
    if (*kind == "unsafe.Pointer")
    {
        return opaqueType(TypeKind::UnsafePointer, "unsafe.Pointer");
    }
    if (auto scalar = builtinScalarKind(*kind))
    {
        return builtinType(*scalar);
    }
    return loadError(path, "unknown type kind '" + kind->str() + "'");
}

llvm::Error declareNamedTypes(const llvm::json::Object&       types,
                              const std::vector<std::string>& keys,
                              TypeRegistry&                   registry)
{
    for (const std::string& key : keys)
    {
        const std::string path  = keyPath("types", key);
        const auto*       entry = types.getObject(key);

        std::optional<llvm::StringRef> kind;
        if (entry != nullptr)
        {
            if (auto text = entry->getString("kind"))
            {
                kind = *text;
            }
        }
        if (!kind)
        {
            return loadError(path, "named type requires an object with a string 'kind'");
        }
        auto [packagePath, name] = TypeRegistry::splitQualifiedName(key);

        TypeRef type;
        if (*kind == "struct")
        {
            type = structType(std::move(packagePath), std::move(name));
        }
        else if (*kind == "interface")
        {
            type = interfaceType(std::move(packagePath), std::move(name));
        }
        else if (auto scalar = builtinScalarKind(*kind))
        {
            type = namedType(*scalar, std::move(packagePath), std::move(name));
        }
        else
        {
            return loadError(path, "named types must be struct, interface or scalar, got '" + kind->str() + "'");
        }
        if (auto err = registry.declare(std::move(type)))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

llvm::Error defineRecords(const llvm::json::Object&       types,
                          const std::vector<std::string>& keys,
                          TypeRegistry&                   registry)
{
    for (const std::string& key : keys)
    {
        const TypeRef type = registry.find(key);
        if (!type || type->kind != TypeKind::Struct)
        {
            continue;
        }
        const std::string path   = keyPath("types", key);
        const auto*       fields = types.getObject(key)->getArray("fields");

        RecordSchema schema;
        schema.type = type;
        if (fields != nullptr)
        {
            for (std::size_t i = 0; i < fields->size(); ++i)
            {
                const std::string fieldEntryPath = indexPath(fieldPath(path, "fields"), i);
                const auto*       field          = (*fields)[i].getAsObject();
                const auto*       ref            = field == nullptr ? nullptr : field->get("type");

                std::optional<llvm::StringRef> name;
                if (field != nullptr)
                {
                    if (auto text = field->getString("name"))
                    {
                        name = *text;
                    }
                }
                if (!name || name->empty() || ref == nullptr)
                {
                    return loadError(fieldEntryPath, "field requires a non-empty 'name' and a 'type'");
                }
                auto fieldType = parseTypeRef(*ref, registry, fieldPath(fieldEntryPath, "type"));
                if (!fieldType)
                {
                    return fieldType.takeError();
                }
                FieldVisibility visibility = visibilityFromName(*name);
                if (const auto exported = field->getBoolean("exported"))
                {
                    visibility = *exported ? FieldVisibility::Exported : FieldVisibility::Unexported;
                }
                schema.fields.push_back(FieldDescriptor{name->str(), visibility, std::move(*fieldType)});
            }
        }
        if (auto err = registry.defineRecord(std::move(schema)))
        {
            return loadError(path, llvm::toString(std::move(err)));
        }
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<TypeRef> parseTypeRef(const llvm::json::Value& ref, const TypeRegistry& registry, const llvm::StringRef path)
{
    if (const auto* object = ref.getAsObject())
    {
        return parseInlineType(*object, registry, path);
    }
    const auto name = ref.getAsString();
    if (!name)
    {
        return loadError(path, "expected type reference, got " + describeJson(ref));
    }
    if (auto scalar = builtinScalarKind(*name))
    {
        return builtinType(*scalar);
    }
    if (*name == "any" || *name == "interface{}")
    {
        return interfaceType("", "");
    }
    if (*name == "unsafe.Pointer")
    {
        return opaqueType(TypeKind::UnsafePointer, "unsafe.Pointer");
    }
    if (TypeRef named = registry.find(*name))
    {
        return named;
    }
    return loadError(path, "unknown type '" + name->str() + "'");
}

llvm::Expected<ValueRef> parseTypedValue(const llvm::json::Value& json,
                                         const TypeRef&           type,
                                         const TypeRegistry&      registry,
                                         const llvm::StringRef    path)
{
    if (isScalarKind(type->kind))
    {
        auto scalar = parseScalar(json, type->kind, path);
        if (!scalar)
        {
            return scalar.takeError();
        }
        return makeScalar(type, std::move(*scalar));
    }

    switch (type->kind)
    {
    case TypeKind::Array: {
        std::vector<ValueRef> elements;
        if (auto err = parseElements(json, type, registry, path, elements))
        {
            return std::move(err);
        }
        if (elements.size() != type->length)
        {
            return loadError(path,
                             "expected " + std::to_string(type->length) + " elements for " + type->str() + ", got " +
                                 std::to_string(elements.size()));
        }
        return makeArray(type, std::move(elements));
    }
    case TypeKind::Slice: {
        if (json.getAsNull())
        {
            return makeNilSlice(type);
        }
        std::vector<ValueRef> elements;
        if (auto err = parseElements(json, type, registry, path, elements))
        {
            return std::move(err);
        }
        return makeSlice(type, std::move(elements));
    }
    case TypeKind::Map:
        return parseMap(json, type, registry, path);
    case TypeKind::Pointer: {
        if (json.getAsNull())
        {
            return makePointer(type, nullptr);
        }
        auto pointee = parseTypedValue(json, type->elem, registry, path);
        if (!pointee)
        {
            return pointee.takeError();
        }
        return makePointer(type, std::move(*pointee));
    }
    case TypeKind::Interface:
        return parseInterface(json, type, registry, path);
    case TypeKind::Struct:
        return parseRecord(json, type, registry, path);
    default:
        return makeOpaque(type, describeJson(json));
    }
}

llvm::Expected<ValueDocument> parseValueDocument(const llvm::StringRef text, const llvm::StringRef sourceName)
{
    auto parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return loadError(sourceName, "invalid JSON: " + llvm::toString(parsed.takeError()));
    }
    const auto* top = parsed->getAsObject();
    if (top == nullptr)
    {
        return loadError(sourceName, "value document must be a JSON object");
    }

    auto withSource = [&](llvm::Error err) {
        return loadError(sourceName, llvm::toString(std::move(err)));
    };

    ValueDocument document;
    const auto    package = top->getString("package");
    if (!package)
    {
        return loadError(sourceName, "missing required string field: package");
    }
    document.packageName = package->str();

    if (const auto* types = top->getObject("types"))
    {
        const std::vector<std::string> keys = sortedKeys(*types);
        if (auto err = declareNamedTypes(*types, keys, document.registry))
        {
            return withSource(std::move(err));
        }
        if (auto err = defineRecords(*types, keys, document.registry))
        {
            return withSource(std::move(err));
        }
    }

    const auto* root    = top->getObject("root");
    const auto* rootRef = root == nullptr ? nullptr : root->get("type");
    if (rootRef == nullptr)
    {
        return loadError(sourceName, "missing required object field: root with a 'type'");
    }
    auto rootType = parseTypeRef(*rootRef, document.registry, "root.type");
    if (!rootType)
    {
        return withSource(rootType.takeError());
    }

    llvm::Expected<ValueRef> rootValue = [&]() -> llvm::Expected<ValueRef> {
        if (const llvm::json::Value* value = root->get("value"))
        {
            return parseTypedValue(*value, *rootType, document.registry, "root.value");
        }
        return makeZeroValue(*rootType, document.registry);
    }();
    if (!rootValue)
    {
        return withSource(rootValue.takeError());
    }
    document.root = std::move(*rootValue);
    return std::move(document);
}

llvm::Expected<ValueDocument> loadValueDocument(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to read value document %s",
                                       path.string().c_str());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return parseValueDocument(text.str(), path.string());
}

}  // namespace gofreeze
