//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "gofreeze/Model/RecordSchema.h"
#include "gofreeze/Model/TypeDescriptor.h"

#include "llvm/Support/Error.h"

bool runTypeDescriptorTests()
{
    using namespace gofreeze;

    const TypeRef node    = interfaceType("example.com/lang/ast", "Node");
    const TypeRef file    = structType("example.com/lang/ast", "File");
    const TypeRef files   = sliceOf(pointerTo(file));
    const TypeRef lookup  = mapOf(builtinType(TypeKind::String), sliceOf(node));
    const TypeRef matrix  = arrayOf(3, builtinType(TypeKind::Float32));
    const TypeRef handler = opaqueType(TypeKind::Func, "func(int) bool");

    if (files->str() != "[]*example.com/lang/ast.File")
    {
        std::cerr << "slice-of-pointer type text mismatch: " << files->str() << "\n";
        return false;
    }
    if (lookup->str() != "map[string][]example.com/lang/ast.Node")
    {
        std::cerr << "map type text mismatch: " << lookup->str() << "\n";
        return false;
    }
    if (matrix->str() != "[3]float32" || handler->str() != "func(int) bool")
    {
        std::cerr << "array or func type text mismatch\n";
        return false;
    }
    if (interfaceType("", "")->str() != "interface{}" || interfaceType("", "")->isNamed())
    {
        std::cerr << "empty interface should be unnamed\n";
        return false;
    }

    if (builtinScalarKind("byte") != TypeKind::Uint8 || builtinScalarKind("rune") != TypeKind::Int32 ||
        builtinScalarKind("complex128") != TypeKind::Complex128 || builtinScalarKind("any").has_value())
    {
        std::cerr << "builtin scalar name lookup mismatch\n";
        return false;
    }
    if (!isScalarKind(TypeKind::Uintptr) || isScalarKind(TypeKind::Pointer) || isScalarKind(TypeKind::Chan))
    {
        std::cerr << "scalar kind classification mismatch\n";
        return false;
    }
    if (typeKindName(TypeKind::UnsafePointer) != "unsafe.Pointer" || typeKindName(TypeKind::Pointer) != "ptr")
    {
        std::cerr << "kind name mismatch\n";
        return false;
    }
    if (builtinType(TypeKind::Int64) != builtinType(TypeKind::Int64))
    {
        std::cerr << "builtin descriptors should be shared\n";
        return false;
    }

    if (!sameType(*sliceOf(pointerTo(file)), *files) || sameType(*sliceOf(file), *files) ||
        sameType(*arrayOf(2, builtinType(TypeKind::Float32)), *matrix))
    {
        std::cerr << "structural type equality mismatch\n";
        return false;
    }

    const auto [pkg, name] = TypeRegistry::splitQualifiedName("github.com/x/go-lang/ast.Package");
    if (pkg != "github.com/x/go-lang/ast" || name != "Package")
    {
        std::cerr << "qualified name split mismatch: " << pkg << " / " << name << "\n";
        return false;
    }
    const auto [bare, local] = TypeRegistry::splitQualifiedName("Local");
    if (!bare.empty() || local != "Local")
    {
        std::cerr << "unqualified name split mismatch\n";
        return false;
    }

    TypeRegistry registry;
    if (auto err = registry.declare(file))
    {
        std::cerr << "unexpected declare failure: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (auto err = registry.declare(structType("example.com/lang/ast", "File")))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        std::cerr << "expected duplicate declaration to fail\n";
        return false;
    }
    if (auto err = registry.declare(sliceOf(file)))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        std::cerr << "expected unnamed type declaration to fail\n";
        return false;
    }

    RecordSchema schema;
    schema.type = file;
    schema.fields.push_back({"Name", visibilityFromName("Name"), builtinType(TypeKind::String)});
    schema.fields.push_back({"Body", visibilityFromName("Body"), sliceOf(node)});
    schema.fields.push_back({"loc", visibilityFromName("loc"), builtinType(TypeKind::Int)});
    if (schema.fields[2].visibility != FieldVisibility::Unexported || schema.indexOf("Body") != 1 ||
        schema.indexOf("Missing") != schema.fields.size())
    {
        std::cerr << "record schema field lookup mismatch\n";
        return false;
    }

    RecordSchema duplicated = schema;
    duplicated.fields.push_back({"Name", FieldVisibility::Exported, builtinType(TypeKind::String)});
    if (auto err = registry.defineRecord(duplicated))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        std::cerr << "expected duplicate field to fail\n";
        return false;
    }
    if (auto err = registry.defineRecord(schema))
    {
        std::cerr << "unexpected defineRecord failure: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }

    RecordSchema undeclared;
    undeclared.type = structType("example.com/lang/ast", "Block");
    if (auto err = registry.defineRecord(undeclared))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        std::cerr << "expected undeclared record to fail\n";
        return false;
    }

    if (registry.find("example.com/lang/ast.File") != file || registry.find("example.com/lang/ast.Block"))
    {
        std::cerr << "registry lookup mismatch\n";
        return false;
    }
    const RecordSchema* found = registry.findRecord(*file);
    if (found == nullptr || found->fields.size() != 3 || registry.size() != 1)
    {
        std::cerr << "registered record lookup mismatch\n";
        return false;
    }

    return true;
}
