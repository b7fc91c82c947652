//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Go source-file assembly.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/GoFile.h"

#include <sstream>

#include "gofreeze/CodeGen/LiteralFormat.h"
#include "gofreeze/CodeGen/NamingPolicy.h"
#include "gofreeze/Model/RecordSchema.h"

namespace gofreeze
{
namespace
{

void emitLine(std::ostringstream& out, const int indent, const std::string& line)
{
    out << std::string(static_cast<std::size_t>(indent), '\t') << line << '\n';
}

std::string importSpec(const GoImport& import)
{
    const std::string quoted = quoteGoString(import.path);
    if (import.blank || import.explicitAlias)
    {
        return import.alias + " " + quoted;
    }
    return quoted;
}

void emitPreamble(std::ostringstream& out, const std::string& headerComment, const std::string& packageName)
{
    if (!headerComment.empty())
    {
        out << headerComment << "\n\n";
    }
    emitLine(out, 0, "package " + packageName);
    out << "\n";
}

}  // namespace

std::string renderImportDecl(const std::vector<GoImport>& imports)
{
    if (imports.empty())
    {
        return "";
    }
    std::ostringstream out;
    if (imports.size() == 1)
    {
        emitLine(out, 0, "import " + importSpec(imports.front()));
        return out.str();
    }
    emitLine(out, 0, "import (");
    for (const GoImport& import : imports)
    {
        emitLine(out, 1, importSpec(import));
    }
    emitLine(out, 0, ")");
    return out.str();
}

llvm::Expected<std::string> renderUnitFile(const GoUnitFileSpec& spec, const GoExpr& value)
{
    if (!goIsValidIdentifier(spec.packageName))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid Go package name: '%s'",
                                       spec.packageName.c_str());
    }
    if (!goIsValidIdentifier(spec.variable))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid Go variable name: '%s'",
                                       spec.variable.c_str());
    }

    GoImportSet        imports(spec.packagePath);
    std::ostringstream body;

    if (!spec.registerFunc.empty())
    {
        const auto [registerPackage, registerName] = TypeRegistry::splitQualifiedName(spec.registerFunc);
        if (!goIsValidIdentifier(registerName))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "invalid registration function: '%s'",
                                           spec.registerFunc.c_str());
        }
        const GoExpr call =
            GoExpr::call(GoExpr::qualified(registerPackage, registerName), {GoExpr::identifier(spec.variable)});
        emitLine(body, 0, "func init() {");
        emitLine(body, 1, renderGoExpr(call, imports, 1));
        emitLine(body, 0, "}");
        body << "\n";
    }
    emitLine(body, 0, "var " + spec.variable + " = " + renderGoExpr(value, imports, 0));

    std::ostringstream out;
    emitPreamble(out, spec.headerComment, spec.packageName);
    const std::string importDecl = renderImportDecl(imports.sorted());
    if (!importDecl.empty())
    {
        out << importDecl << "\n";
    }
    out << body.str();
    return out.str();
}

std::string renderImportFile(const std::string&              headerComment,
                             const std::string&              packageName,
                             const std::vector<std::string>& importPaths)
{
    GoImportSet imports;
    for (const std::string& path : importPaths)
    {
        imports.addBlank(path);
    }

    std::ostringstream out;
    emitPreamble(out, headerComment, packageName);
    out << renderImportDecl(imports.sorted());
    return out.str();
}

}  // namespace gofreeze
