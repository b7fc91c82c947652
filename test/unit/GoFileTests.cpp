//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "gofreeze/CodeGen/GoCode.h"
#include "gofreeze/CodeGen/GoFile.h"

#include "llvm/Support/Error.h"

namespace
{

gofreeze::GoExpr samplePackage()
{
    using gofreeze::GoExpr;
    return GoExpr::addressOf(
        GoExpr::keyedComposite(GoExpr::qualified("example.com/lang/ast", "Package"),
                               {gofreeze::GoKeyedElement{GoExpr::identifier("Package"),
                                                         GoExpr::literal("\"universe\"")}}));
}

bool expectRenderFailure(const gofreeze::GoUnitFileSpec& spec, const char* what)
{
    auto text = gofreeze::renderUnitFile(spec, samplePackage());
    if (text)
    {
        std::cerr << what << ": expected render failure\n";
        return false;
    }
    llvm::consumeError(text.takeError());
    return true;
}

}  // namespace

bool runGoFileTests()
{
    gofreeze::GoUnitFileSpec spec;
    spec.packageName  = "universe";
    spec.packagePath  = "example.com/lang/stdlib/universe";
    spec.registerFunc = "github.com/influxdata/flux.RegisterPackage";

    auto text = gofreeze::renderUnitFile(spec, samplePackage());
    if (!text)
    {
        std::cerr << "unit file render failed: " << llvm::toString(text.takeError()) << "\n";
        return false;
    }
    const std::string expected = "// DO NOT EDIT: This file is autogenerated via the gofreeze generate command.\n"
                                 "\n"
                                 "package universe\n"
                                 "\n"
                                 "import (\n"
                                 "\t\"example.com/lang/ast\"\n"
                                 "\t\"github.com/influxdata/flux\"\n"
                                 ")\n"
                                 "\n"
                                 "func init() {\n"
                                 "\tflux.RegisterPackage(pkgAST)\n"
                                 "}\n"
                                 "\n"
                                 "var pkgAST = &ast.Package{\n"
                                 "\tPackage: \"universe\",\n"
                                 "}\n";
    if (*text != expected)
    {
        std::cerr << "unit file layout mismatch:\n" << *text << "\n";
        return false;
    }

    // Registration in the unit's own package needs no import.
    {
        gofreeze::GoUnitFileSpec local = spec;
        local.registerFunc             = "example.com/lang/stdlib/universe.Register";
        local.variable                 = "frozen";
        local.headerComment.clear();
        auto localText = gofreeze::renderUnitFile(local, gofreeze::GoExpr::literal("int8(1)"));
        if (!localText)
        {
            std::cerr << "local registration render failed: " << llvm::toString(localText.takeError()) << "\n";
            return false;
        }
        const std::string localExpected = "package universe\n"
                                          "\n"
                                          "func init() {\n"
                                          "\tRegister(frozen)\n"
                                          "}\n"
                                          "\n"
                                          "var frozen = int8(1)\n";
        if (*localText != localExpected)
        {
            std::cerr << "local registration layout mismatch:\n" << *localText << "\n";
            return false;
        }
    }

    // Without a registration function only the variable is emitted, with a single-line import.
    {
        gofreeze::GoUnitFileSpec bare = spec;
        bare.registerFunc.clear();
        auto bareText = gofreeze::renderUnitFile(bare, samplePackage());
        if (!bareText || bareText->find("func init()") != std::string::npos ||
            bareText->find("import \"example.com/lang/ast\"\n") == std::string::npos)
        {
            if (!bareText)
            {
                llvm::consumeError(bareText.takeError());
            }
            std::cerr << "unit file without registration mismatch\n";
            return false;
        }
    }

    {
        gofreeze::GoUnitFileSpec bad = spec;
        bad.packageName              = "my-pkg";
        if (!expectRenderFailure(bad, "invalid package name"))
        {
            return false;
        }
        bad          = spec;
        bad.variable = "var";
        if (!expectRenderFailure(bad, "keyword variable name"))
        {
            return false;
        }
        bad              = spec;
        bad.registerFunc = "github.com/influxdata/flux.";
        if (!expectRenderFailure(bad, "empty registration function name"))
        {
            return false;
        }
    }

    const std::string importFile = gofreeze::renderImportFile(gofreeze::kDefaultHeaderComment,
                                                              "stdlib",
                                                              {"example.com/lang/stdlib/csv",
                                                               "example.com/lang/stdlib/array",
                                                               "example.com/lang/stdlib/csv"});
    const std::string importExpected = "// DO NOT EDIT: This file is autogenerated via the gofreeze generate command.\n"
                                       "\n"
                                       "package stdlib\n"
                                       "\n"
                                       "import (\n"
                                       "\t_ \"example.com/lang/stdlib/array\"\n"
                                       "\t_ \"example.com/lang/stdlib/csv\"\n"
                                       ")\n";
    if (importFile != importExpected)
    {
        std::cerr << "import file layout mismatch:\n" << importFile << "\n";
        return false;
    }
    if (gofreeze::renderImportFile("", "stdlib", {"example.com/lang/stdlib/csv"}) !=
        "package stdlib\n\nimport _ \"example.com/lang/stdlib/csv\"\n")
    {
        std::cerr << "single blank import layout mismatch\n";
        return false;
    }

    return true;
}
