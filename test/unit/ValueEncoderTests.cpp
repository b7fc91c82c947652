//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "gofreeze/CodeGen/GoCode.h"
#include "gofreeze/CodeGen/ValueEncoder.h"
#include "gofreeze/Model/RuntimeValue.h"

#include "llvm/Support/Error.h"

using namespace gofreeze;

namespace
{

constexpr const char* kAst = "example.com/lang/ast";

ValueRef str(const std::string& text)
{
    return makeScalar(ScalarValue(text));
}

ValueRef i8(const std::int8_t value)
{
    return makeScalar(ScalarValue(std::in_place_type<std::int8_t>, value));
}

FieldValue exported(std::string name, ValueRef value)
{
    return FieldValue{std::move(name), FieldVisibility::Exported, std::move(value)};
}

/// Encodes and renders a value; prints the failure and returns false on error.
bool encodeAndRender(const RuntimeValue& value, std::string& out, const EncodeOptions& options = {})
{
    auto encoded = encodeValue(value, options);
    if (!encoded)
    {
        std::cerr << "unexpected encode failure: " << llvm::toString(encoded.takeError()) << "\n";
        return false;
    }
    GoImportSet imports;
    out = renderGoExpr(*encoded, imports);
    return true;
}

/// Expects an encode failure with the given code and path.
bool expectEncodeError(const RuntimeValue&   value,
                       const EncodeErrorCode code,
                       const std::string&    path,
                       const std::string&    what,
                       std::string*          messageOut = nullptr)
{
    auto encoded = encodeValue(value);
    if (encoded)
    {
        std::cerr << what << ": expected encode failure\n";
        return false;
    }
    bool matched = false;
    llvm::handleAllErrors(encoded.takeError(), [&](const EncodeError& err) {
        matched = err.code() == code && err.path() == path;
        if (!matched)
        {
            std::cerr << what << ": got " << encodeErrorCodeName(err.code()).str() << " at '" << err.path()
                      << "'\n";
        }
        if (messageOut != nullptr)
        {
            *messageOut = err.detail();
        }
    });
    return matched;
}

}  // namespace

bool runValueEncoderTests()
{
    const TypeRef packageType  = structType(kAst, "Package");
    const TypeRef fileType     = structType(kAst, "File");
    const TypeRef statement    = interfaceType(kAst, "Statement");
    const TypeRef expression   = interfaceType(kAst, "Expression");
    const TypeRef exprStmt     = structType(kAst, "ExpressionStatement");
    const TypeRef binaryExpr   = structType(kAst, "BinaryExpression");
    const TypeRef integerLit   = structType(kAst, "IntegerLiteral");
    const TypeRef operatorKind = namedType(TypeKind::Int, kAst, "OperatorKind");
    const TypeRef flagType     = namedType(TypeKind::Uint8, kAst, "Flag");
    const TypeRef filesType    = sliceOf(pointerTo(fileType));
    const TypeRef metaType     = mapOf(builtinType(TypeKind::String), builtinType(TypeKind::Int8));

    // Nil and empty slices stay distinct.
    {
        const ValueRef pkg = makePointer(pointerTo(packageType),
                                         makeStruct(packageType,
                                                    {exported("Package", str("main")),
                                                     exported("Path", str("")),
                                                     exported("Files", makeNilSlice(filesType))}));
        std::string rendered;
        if (!encodeAndRender(*pkg, rendered))
        {
            return false;
        }
        const std::string expected = "&ast.Package{\n"
                                     "\tPackage: \"main\",\n"
                                     "\tPath: \"\",\n"
                                     "\tFiles: nil,\n"
                                     "}";
        if (rendered != expected)
        {
            std::cerr << "nil slice field mismatch:\n" << rendered << "\n";
            return false;
        }

        if (!encodeAndRender(*makeSlice(filesType, {}), rendered) || rendered != "[]*ast.File{}")
        {
            std::cerr << "empty slice mismatch: " << rendered << "\n";
            return false;
        }
    }

    // Unexported and unreadable fields are omitted; interfaces unwrap to the held value.
    {
        const ValueRef literal = makePointer(pointerTo(integerLit),
                                             makeStruct(integerLit,
                                                        {exported("Value",
                                                                  makeScalar(ScalarValue(std::int64_t{42}))),
                                                         FieldValue{"loc", FieldVisibility::Unexported, i8(1)}}));
        const ValueRef stmt    = makePointer(pointerTo(exprStmt),
                                          makeStruct(exprStmt,
                                                     {exported("Expression", makeInterface(expression, literal)),
                                                      exported("Comments", nullptr)}));
        const ValueRef file    = makeStruct(fileType,
                                         {exported("Name", str("a.flux")),
                                          exported("Body",
                                                   makeSlice(sliceOf(statement), {makeInterface(statement, stmt)})),
                                          FieldValue{"hash", FieldVisibility::Unexported, str("ignored")}});
        std::string rendered;
        if (!encodeAndRender(*file, rendered))
        {
            return false;
        }
        const std::string expected = "ast.File{\n"
                                     "\tName: \"a.flux\",\n"
                                     "\tBody: []ast.Statement{\n"
                                     "\t\t&ast.ExpressionStatement{\n"
                                     "\t\t\tExpression: &ast.IntegerLiteral{\n"
                                     "\t\t\t\tValue: int64(42),\n"
                                     "\t\t\t},\n"
                                     "\t\t},\n"
                                     "\t},\n"
                                     "}";
        if (rendered != expected)
        {
            std::cerr << "field omission or interface unwrap mismatch:\n" << rendered << "\n";
            return false;
        }

        // The same sub-value may appear twice without being a cycle.
        const ValueRef shared = makeSlice(sliceOf(statement),
                                          {makeInterface(statement, stmt), makeInterface(statement, stmt)});
        if (!encodeAndRender(*shared, rendered))
        {
            std::cerr << "shared sub-value should encode\n";
            return false;
        }
    }

    // Named scalars convert to their declared type.
    {
        const ValueRef binary = makeStruct(binaryExpr,
                                           {exported("Operator", makeScalar(operatorKind, ScalarValue(GoInt{3}))),
                                            exported("Flags",
                                                     makeScalar(flagType,
                                                                ScalarValue(std::in_place_type<std::uint8_t>, 1))),
                                            exported("Left", makeInterface(expression, nullptr))});
        std::string rendered;
        if (!encodeAndRender(*binary, rendered))
        {
            return false;
        }
        const std::string expected = "ast.BinaryExpression{\n"
                                     "\tOperator: ast.OperatorKind(3),\n"
                                     "\tFlags: ast.Flag(0x1),\n"
                                     "\tLeft: nil,\n"
                                     "}";
        if (rendered != expected)
        {
            std::cerr << "named scalar conversion mismatch:\n" << rendered << "\n";
            return false;
        }
    }

    // Maps: nil, empty, singleton, encountered order and sorted order.
    {
        std::string rendered;
        if (!encodeAndRender(*makeNilMap(metaType), rendered) || rendered != "nil")
        {
            std::cerr << "nil map mismatch\n";
            return false;
        }
        if (!encodeAndRender(*makeMap(metaType, {}), rendered) || rendered != "map[string]int8{}")
        {
            std::cerr << "empty map mismatch: " << rendered << "\n";
            return false;
        }
        if (!encodeAndRender(*makeMap(metaType, {MapEntry{str("x"), i8(1)}}), rendered) ||
            rendered != "map[string]int8{\n\t\"x\": int8(1),\n}")
        {
            std::cerr << "singleton map mismatch: " << rendered << "\n";
            return false;
        }

        const ValueRef unordered = makeMap(metaType,
                                           {MapEntry{str("zeta"), i8(3)},
                                            MapEntry{str("alpha"), i8(1)},
                                            MapEntry{str("mid"), i8(2)}});
        if (!encodeAndRender(*unordered, rendered) ||
            rendered != "map[string]int8{\n\t\"zeta\": int8(3),\n\t\"alpha\": int8(1),\n\t\"mid\": int8(2),\n}")
        {
            std::cerr << "map should keep encountered order: " << rendered << "\n";
            return false;
        }
        EncodeOptions sorted;
        sorted.sortMapEntries = true;
        if (!encodeAndRender(*unordered, rendered, sorted) ||
            rendered != "map[string]int8{\n\t\"alpha\": int8(1),\n\t\"mid\": int8(2),\n\t\"zeta\": int8(3),\n}")
        {
            std::cerr << "sorted map mismatch: " << rendered << "\n";
            return false;
        }
        std::string again;
        if (!encodeAndRender(*unordered, again, sorted) || again != rendered)
        {
            std::cerr << "sorted map output should be deterministic\n";
            return false;
        }
    }

    // Arrays honor the sized spelling option.
    {
        const ValueRef pair = makeArray(arrayOf(2, builtinType(TypeKind::Int8)), {i8(1), i8(2)});
        std::string    rendered;
        if (!encodeAndRender(*pair, rendered) || rendered != "[]int8{\n\tint8(1),\n\tint8(2),\n}")
        {
            std::cerr << "array literal mismatch: " << rendered << "\n";
            return false;
        }
        EncodeOptions sized;
        sized.sizedArrays = true;
        if (!encodeAndRender(*pair, rendered, sized) || rendered != "[2]int8{\n\tint8(1),\n\tint8(2),\n}")
        {
            std::cerr << "sized array literal mismatch: " << rendered << "\n";
            return false;
        }
    }

    // Unsupported kinds fail with the path of the offending value.
    {
        const TypeRef  handler  = opaqueType(TypeKind::Func, "func()");
        const ValueRef callback = makeStruct(structType(kAst, "Builtin"),
                                             {exported("Name", str("now")),
                                              exported("Callback", makeOpaque(handler, "time.Now"))});
        if (!expectEncodeError(*callback, EncodeErrorCode::UnsupportedKind, ".Callback", "func field"))
        {
            return false;
        }

        const ValueRef channels = makeSlice(sliceOf(interfaceType("", "")),
                                            {makeInterface(interfaceType("", ""), str("ok")),
                                             makeInterface(interfaceType("", ""),
                                                           makeOpaque(opaqueType(TypeKind::Chan, "chan int"), ""))});
        if (!expectEncodeError(*channels, EncodeErrorCode::UnsupportedKind, "[1]", "chan in interface"))
        {
            return false;
        }

        const ValueRef keyed = makeMap(mapOf(builtinType(TypeKind::String), opaqueType(TypeKind::UnsafePointer)),
                                       {MapEntry{str("p"), makeOpaque(opaqueType(TypeKind::UnsafePointer), "0x0")}});
        if (!expectEncodeError(*keyed, EncodeErrorCode::UnsupportedKind, "[\"p\"]", "unsafe pointer map value"))
        {
            return false;
        }
    }

    // Pointers to values that are not composite literals go through an addressable slice element.
    {
        struct BoxedCase
        {
            ValueRef    value;
            const char* expected;
        };
        const TypeRef   filePointer = pointerTo(fileType);
        const BoxedCase cases[]     = {
            {makePointer(pointerTo(builtinType(TypeKind::String)), str("x")), "&[]string{\n\t\"x\",\n}[0]"},
            {makePointer(pointerTo(builtinType(TypeKind::Int8)), i8(-5)), "&[]int8{\n\tint8(-5),\n}[0]"},
            {makePointer(pointerTo(flagType), makeScalar(flagType, ScalarValue(std::in_place_type<std::uint8_t>, 2))),
             "&[]ast.Flag{\n\tast.Flag(0x2),\n}[0]"},
            {makePointer(pointerTo(filePointer), makePointer(filePointer, nullptr)), "&[]*ast.File{\n\tnil,\n}[0]"},
            {makePointer(pointerTo(filePointer),
                         makePointer(filePointer, makeStruct(fileType, {exported("Name", str("a"))}))),
             "&[]*ast.File{\n\t&ast.File{\n\t\tName: \"a\",\n\t},\n}[0]"},
        };
        for (const BoxedCase& boxed : cases)
        {
            std::string rendered;
            if (!encodeAndRender(*boxed.value, rendered))
            {
                return false;
            }
            if (rendered != boxed.expected)
            {
                std::cerr << "boxed pointer mismatch:\n" << rendered << "\n";
                return false;
            }
        }
    }

    // Payload and descriptor disagreement.
    {
        const ValueRef wrongWidth = makeScalar(builtinType(TypeKind::Int8), ScalarValue(std::int16_t{5}));
        if (!expectEncodeError(*wrongWidth, EncodeErrorCode::TypeMismatch, "", "scalar width mismatch"))
        {
            return false;
        }
        const ValueRef shortArray = makeArray(arrayOf(3, builtinType(TypeKind::Int8)), {i8(1)});
        if (!expectEncodeError(*shortArray, EncodeErrorCode::TypeMismatch, "", "array length mismatch"))
        {
            return false;
        }
        const ValueRef missing = makeSlice(sliceOf(builtinType(TypeKind::Int8)), {i8(1), nullptr});
        if (!expectEncodeError(*missing, EncodeErrorCode::TypeMismatch, "[1]", "missing element"))
        {
            return false;
        }
    }

    // Self-reference through a pointer is rejected.
    {
        const TypeRef  listType = structType(kAst, "List");
        const ValueRef node     = makeStruct(listType, {exported("Next", nullptr)});
        const ValueRef head     = makePointer(pointerTo(listType), node);
        node->findField("Next")->value = head;

        std::string message;
        const bool  ok = expectEncodeError(*head, EncodeErrorCode::CyclicValue, ".Next", "cycle", &message);
        node->findField("Next")->value.reset();
        if (!ok)
        {
            return false;
        }
        if (message.find("refers back to itself") == std::string::npos)
        {
            std::cerr << "cycle message mismatch: " << message << "\n";
            return false;
        }
    }

    // Error text carries the path.
    {
        auto encoded = encodeValue(*makeSlice(sliceOf(builtinType(TypeKind::Int8)), {i8(1), nullptr}));
        if (encoded)
        {
            std::cerr << "expected missing element failure\n";
            return false;
        }
        const std::string text = llvm::toString(encoded.takeError());
        if (text != "missing element value at [1]")
        {
            std::cerr << "encode error text mismatch: " << text << "\n";
            return false;
        }
    }

    return true;
}
