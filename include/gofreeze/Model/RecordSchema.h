//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Explicit record schemas and the registry of named types.
///
/// Struct layouts are declared once per record type instead of being read
/// through a reflection facility. The registry also resolves named-type keys
/// of the form `<package path>.<Name>` to shared descriptors.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_MODEL_RECORD_SCHEMA_H
#define GOFREEZE_MODEL_RECORD_SCHEMA_H

#include "gofreeze/Model/TypeDescriptor.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gofreeze
{

/// @brief Whether a struct field participates in encoding.
enum class FieldVisibility
{
    /// @brief Field is accessible from other packages and is encoded.
    Exported,

    /// @brief Field is package-private and is always omitted.
    Unexported,
};

/// @brief Applies the Go export rule to a field name.
/// @param[in] name Field name.
/// @return `Exported` when the name starts with an upper-case ASCII letter.
FieldVisibility visibilityFromName(llvm::StringRef name);

/// @brief One declared struct field.
struct FieldDescriptor final
{
    /// @brief Field name as written in the declaring struct.
    std::string name;

    /// @brief Participation in encoding.
    FieldVisibility visibility{FieldVisibility::Exported};

    /// @brief Field type.
    TypeRef type;
};

/// @brief Declared field layout of one struct type.
struct RecordSchema final
{
    /// @brief The struct type described by this schema.
    TypeRef type;

    /// @brief Fields in declaration order.
    std::vector<FieldDescriptor> fields;

    /// @brief Returns the index of a field by name.
    /// @param[in] name Field name.
    /// @return Field index, or `fields.size()` when absent.
    [[nodiscard]] std::size_t indexOf(llvm::StringRef name) const;
};

/// @brief Owns named type descriptors and record schemas keyed by qualified name.
class TypeRegistry final
{
public:
    /// @brief Splits `<package path>.<Name>` into its package path and local name.
    /// @param[in] qualifiedName Qualified type key.
    /// @return Pair of package path (possibly empty) and local name.
    static std::pair<std::string, std::string> splitQualifiedName(llvm::StringRef qualifiedName);

    /// @brief Declares a named type. Declaring the same key twice is an error.
    /// @param[in] type Named descriptor.
    /// @return Success or a duplicate-declaration error.
    llvm::Error declare(TypeRef type);

    /// @brief Attaches the field layout to an already declared struct type.
    /// @param[in] schema Record schema whose `type` was declared before.
    /// @return Success or an error when the type is unknown, not a struct, or a field name repeats.
    llvm::Error defineRecord(RecordSchema schema);

    /// @brief Looks up a declared named type.
    /// @param[in] qualifiedName Qualified type key.
    /// @return Descriptor, or null when undeclared.
    [[nodiscard]] TypeRef find(llvm::StringRef qualifiedName) const;

    /// @brief Looks up the record schema of a struct type.
    /// @param[in] type Struct descriptor.
    /// @return Schema, or null when no layout is registered.
    [[nodiscard]] const RecordSchema* findRecord(const TypeDescriptor& type) const;

    /// @brief Number of declared named types.
    [[nodiscard]] std::size_t size() const
    {
        return types_.size();
    }

private:
    std::map<std::string, TypeRef, std::less<>>      types_;
    std::map<std::string, RecordSchema, std::less<>> records_;
};

}  // namespace gofreeze

#endif  // GOFREEZE_MODEL_RECORD_SCHEMA_H
