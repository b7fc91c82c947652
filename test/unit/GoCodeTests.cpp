//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "gofreeze/CodeGen/GoCode.h"

bool runGoCodeTests()
{
    using gofreeze::GoExpr;
    using gofreeze::GoImport;
    using gofreeze::GoImportSet;
    using gofreeze::GoKeyedElement;
    using gofreeze::guessPackageAlias;
    using gofreeze::renderGoExpr;

    if (guessPackageAlias("github.com/influxdata/flux/ast") != "ast" || guessPackageAlias("gopkg.in/yaml.v2") != "yaml" ||
        guessPackageAlias("github.com/x/go-difflib") != "difflib" ||
        guessPackageAlias("example.com/api/v1-beta") != "v1beta" || guessPackageAlias("example.com/3d") != "pkg3d")
    {
        std::cerr << "package alias guess mismatch\n";
        return false;
    }

    {
        GoImportSet imports("example.com/lang/stdlib/universe");
        if (!imports.qualifier("").empty() || !imports.qualifier("example.com/lang/stdlib/universe").empty())
        {
            std::cerr << "builtin and current-package names should stay bare\n";
            return false;
        }
        if (imports.qualifier("example.com/lang/ast") != "ast" || imports.qualifier("example.com/lang/ast") != "ast")
        {
            std::cerr << "repeated qualifier should reuse the alias\n";
            return false;
        }
        if (imports.qualifier("example.com/other/ast") != "ast1")
        {
            std::cerr << "colliding package names should receive a numbered alias\n";
            return false;
        }
        if (imports.qualifier("example.com/types/string") != "string1")
        {
            std::cerr << "predeclared identifiers should not be used as aliases\n";
            return false;
        }
        imports.addBlank("example.com/lang/stdlib/csv");
        imports.addBlank("example.com/lang/stdlib/csv");

        const std::vector<GoImport> sorted = imports.sorted();
        if (sorted.size() != 4 || sorted[0].path != "example.com/lang/ast" || sorted[0].explicitAlias ||
            sorted[1].path != "example.com/lang/stdlib/csv" || !sorted[1].blank || sorted[2].alias != "ast1" ||
            !sorted[2].explicitAlias)
        {
            std::cerr << "sorted import table mismatch\n";
            return false;
        }
    }

    const GoExpr astFile = GoExpr::qualified("example.com/lang/ast", "File");
    {
        GoImportSet imports;
        const GoExpr type = GoExpr::mapType(GoExpr::identifier("string"),
                                            GoExpr::sliceType(GoExpr::pointerType(astFile)));
        if (renderGoExpr(type, imports) != "map[string][]*ast.File" || imports.empty())
        {
            std::cerr << "composite type rendering mismatch\n";
            return false;
        }
        const GoExpr sized = GoExpr::arrayType(4, GoExpr::identifier("uint8"));
        if (renderGoExpr(sized, imports) != "[4]uint8")
        {
            std::cerr << "sized array type rendering mismatch\n";
            return false;
        }
    }

    {
        GoImportSet  imports;
        const GoExpr empty = GoExpr::composite(GoExpr::sliceType(GoExpr::identifier("int8")), {});
        if (renderGoExpr(empty, imports) != "[]int8{}" || empty.elementCount() != 0)
        {
            std::cerr << "empty composite literal rendering mismatch\n";
            return false;
        }

        const GoExpr call = GoExpr::call(GoExpr::identifier("int8"), {GoExpr::literal("5")});
        const GoExpr list = GoExpr::composite(GoExpr::sliceType(GoExpr::identifier("int8")), {call, GoExpr::nil()});
        if (renderGoExpr(list, imports) != "[]int8{\n\tint8(5),\n\tnil,\n}")
        {
            std::cerr << "positional composite literal rendering mismatch: " << renderGoExpr(list, imports) << "\n";
            return false;
        }

        const GoExpr inner = GoExpr::keyedComposite(astFile,
                                                    {GoKeyedElement{GoExpr::identifier("Name"),
                                                                    GoExpr::literal("\"a.flux\"")}});
        const GoExpr outer = GoExpr::keyedComposite(GoExpr::qualified("example.com/lang/ast", "Package"),
                                                    {GoKeyedElement{GoExpr::identifier("Files"),
                                                                    GoExpr::composite(GoExpr::sliceType(
                                                                                          GoExpr::pointerType(astFile)),
                                                                                      {GoExpr::addressOf(inner)})}});
        const std::string expected = "ast.Package{\n"
                                     "\t\tFiles: []*ast.File{\n"
                                     "\t\t\t&ast.File{\n"
                                     "\t\t\t\tName: \"a.flux\",\n"
                                     "\t\t\t},\n"
                                     "\t\t},\n"
                                     "\t}";
        if (renderGoExpr(outer, imports, 1) != expected)
        {
            std::cerr << "nested keyed composite rendering mismatch:\n" << renderGoExpr(outer, imports, 1) << "\n";
            return false;
        }

        const GoExpr inf = GoExpr::call(GoExpr::qualified("math", "Inf"), {GoExpr::literal("-1")});
        if (renderGoExpr(GoExpr::call(GoExpr::identifier("float32"), {inf}), imports) != "float32(math.Inf(-1))")
        {
            std::cerr << "call rendering mismatch\n";
            return false;
        }
    }

    if (GoExpr::literal("1") == GoExpr::identifier("1") ||
        GoExpr::composite(astFile, {GoExpr::nil()}) != GoExpr::composite(astFile, {GoExpr::nil()}))
    {
        std::cerr << "expression equality mismatch\n";
        return false;
    }

    return true;
}
