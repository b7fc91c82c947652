//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements record schemas and the named-type registry.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/Model/RecordSchema.h"

#include <set>

namespace gofreeze
{

FieldVisibility visibilityFromName(const llvm::StringRef name)
{
    if (!name.empty() && name.front() >= 'A' && name.front() <= 'Z')
    {
        return FieldVisibility::Exported;
    }
    return FieldVisibility::Unexported;
}

std::size_t RecordSchema::indexOf(const llvm::StringRef name) const
{
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (fields[i].name == name)
        {
            return i;
        }
    }
    return fields.size();
}

std::pair<std::string, std::string> TypeRegistry::splitQualifiedName(const llvm::StringRef qualifiedName)
{
    // The local name follows the last dot after the last slash, so dotted
    // host names such as `example.com/ast.Node` split correctly.
    const std::size_t slash = qualifiedName.rfind('/');
    const std::size_t from  = slash == llvm::StringRef::npos ? 0 : slash;
    const std::size_t dot   = qualifiedName.find('.', from);
    if (dot == llvm::StringRef::npos)
    {
        return {std::string(), qualifiedName.str()};
    }
    const std::size_t lastDot = qualifiedName.rfind('.');
    return {qualifiedName.substr(0, lastDot).str(), qualifiedName.substr(lastDot + 1).str()};
}

llvm::Error TypeRegistry::declare(TypeRef type)
{
    if (!type || !type->isNamed())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "only named types can be declared");
    }
    const std::string key = type->str();
    if (!types_.emplace(key, std::move(type)).second)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "duplicate type declaration: %s",
                                       key.c_str());
    }
    return llvm::Error::success();
}

llvm::Error TypeRegistry::defineRecord(RecordSchema schema)
{
    if (!schema.type || schema.type->kind != TypeKind::Struct)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "record schema requires a struct type");
    }
    const std::string key = schema.type->str();
    if (types_.find(key) == types_.end())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "record schema for undeclared type: %s",
                                       key.c_str());
    }

    std::set<std::string> seen;
    for (const FieldDescriptor& field : schema.fields)
    {
        if (!field.type)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "field %s.%s has no type",
                                           key.c_str(),
                                           field.name.c_str());
        }
        if (!seen.insert(field.name).second)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "duplicate field %s in %s",
                                           field.name.c_str(),
                                           key.c_str());
        }
    }

    records_.insert_or_assign(key, std::move(schema));
    return llvm::Error::success();
}

TypeRef TypeRegistry::find(const llvm::StringRef qualifiedName) const
{
    const auto it = types_.find(qualifiedName);
    return it == types_.end() ? nullptr : it->second;
}

const RecordSchema* TypeRegistry::findRecord(const TypeDescriptor& type) const
{
    const auto it = records_.find(type.str());
    return it == records_.end() ? nullptr : &it->second;
}

}  // namespace gofreeze
