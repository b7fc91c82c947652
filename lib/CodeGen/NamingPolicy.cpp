//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the Go identifier naming policy.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/NamingPolicy.h"

#include <cctype>
#include <string>

#include "llvm/ADT/StringSet.h"

namespace gofreeze
{
namespace
{

const llvm::StringSet<>& keywordSet()
{
    static const llvm::StringSet<> goKeywords = {"break",    "default",     "func",   "interface", "select",
                                                 "case",     "defer",       "go",     "map",       "struct",
                                                 "chan",     "else",        "goto",   "package",   "switch",
                                                 "const",    "fallthrough", "if",     "range",     "type",
                                                 "continue", "for",         "import", "return",    "var"};
    return goKeywords;
}

const llvm::StringSet<>& predeclaredSet()
{
    static const llvm::StringSet<> goPredeclared =
        {"any",     "bool",    "byte",    "comparable", "complex64", "complex128", "error",  "float32",
         "float64", "int",     "int8",    "int16",      "int32",     "int64",      "rune",   "string",
         "uint",    "uint8",   "uint16",  "uint32",     "uint64",    "uintptr",    "true",   "false",
         "iota",    "nil",     "append",  "cap",        "clear",     "close",      "complex", "copy",
         "delete",  "imag",    "len",     "make",       "max",       "min",        "new",    "panic",
         "print",   "println", "real",    "recover"};
    return goPredeclared;
}

bool isIdentifierChar(const char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

bool goIsKeyword(const llvm::StringRef name)
{
    return keywordSet().contains(name);
}

bool goIsReservedIdentifier(const llvm::StringRef name)
{
    return goIsKeyword(name) || predeclaredSet().contains(name);
}

bool goIsValidIdentifier(const llvm::StringRef name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
    {
        return false;
    }
    for (const char c : name)
    {
        if (!isIdentifierChar(c))
        {
            return false;
        }
    }
    return !goIsKeyword(name);
}

std::string goSanitizeIdentifier(const llvm::StringRef name)
{
    std::string out = name.str();
    if (out.empty())
    {
        return "_";
    }
    for (char& c : out)
    {
        if (!isIdentifierChar(c))
        {
            c = '_';
        }
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    if (goIsKeyword(out))
    {
        out += "_";
    }
    return out;
}

}  // namespace gofreeze
