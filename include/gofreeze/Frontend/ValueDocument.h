//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON value-document loading.
///
/// A value document carries the output package name, a table of named types
/// with their struct layouts, and one typed root value:
///
/// @code{.json}
/// {
///   "package": "universe",
///   "types": {
///     "example.com/ast.Package": {"kind": "struct", "fields": [{"name": "Path", "type": "string"}]},
///     "example.com/ast.Node": {"kind": "interface"}
///   },
///   "root": {"type": {"kind": "pointer", "elem": "example.com/ast.Package"}, "value": {"Path": "x"}}
/// }
/// @endcode
///
/// Floats are JSON numbers or the strings `"NaN"`, `"+Inf"`, `"-Inf"` and
/// `"-0"`. A bare JSON `-0` reads as an integer and loads as +0; write
/// `-0.0` or `"-0"` to keep the sign.
///
/// Load errors name the JSON path of the offending value (`root.value.Files[0]`).
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_FRONTEND_VALUE_DOCUMENT_H
#define GOFREEZE_FRONTEND_VALUE_DOCUMENT_H

#include <filesystem>
#include <string>

#include "gofreeze/Model/RecordSchema.h"
#include "gofreeze/Model/RuntimeValue.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace gofreeze
{

/// @brief Loaded value document.
struct ValueDocument final
{
    /// @brief Name for the package clause of the generated file.
    std::string packageName;

    /// @brief Named types and struct layouts declared by the document.
    TypeRegistry registry;

    /// @brief Typed root value.
    ValueRef root;
};

/// @brief Parses a type reference against a registry.
///
/// @details A reference is a builtin name (`int8`, `byte`, `any`,
/// `unsafe.Pointer`), a declared named-type key, or an inline object with a
/// `kind` of `slice`, `array` (with `length`), `map` (with `key`), `pointer`,
/// `interface`, `func` or `chan`; composite kinds take their element in `elem`.
///
/// @param[in] ref JSON type reference.
/// @param[in] registry Declared named types.
/// @param[in] path JSON path of @p ref, used in error messages.
/// @return Type descriptor or a descriptive error.
llvm::Expected<TypeRef> parseTypeRef(const llvm::json::Value& ref, const TypeRegistry& registry, llvm::StringRef path);

/// @brief Parses a JSON value of a known type into a runtime value.
/// @param[in] json JSON value.
/// @param[in] type Expected type.
/// @param[in] registry Registry providing struct layouts and named types.
/// @param[in] path JSON path of @p json, used in error messages.
/// @return Runtime value or a descriptive error.
llvm::Expected<ValueRef> parseTypedValue(const llvm::json::Value& json,
                                         const TypeRef&           type,
                                         const TypeRegistry&      registry,
                                         llvm::StringRef          path);

/// @brief Parses a complete value document.
/// @param[in] text Document text.
/// @param[in] sourceName Name used as the prefix of error messages.
/// @return Loaded document or a descriptive error.
llvm::Expected<ValueDocument> parseValueDocument(llvm::StringRef text, llvm::StringRef sourceName = "<memory>");

/// @brief Reads and parses a value document from disk.
/// @param[in] path Document path.
/// @return Loaded document or a descriptive error.
llvm::Expected<ValueDocument> loadValueDocument(const std::filesystem::path& path);

}  // namespace gofreeze

#endif  // GOFREEZE_FRONTEND_VALUE_DOCUMENT_H
