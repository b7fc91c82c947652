//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the Go code-expression model, import aliasing and rendering.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/GoCode.h"

#include "gofreeze/CodeGen/NamingPolicy.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace gofreeze
{
namespace
{

void writeIndent(std::ostringstream& out, const unsigned indent)
{
    out << std::string(indent, '\t');
}

void renderInto(std::ostringstream& out, const GoExpr& expr, GoImportSet& imports, unsigned indent);

void renderElementList(std::ostringstream& out, const GoExpr& expr, GoImportSet& imports, const unsigned indent)
{
    out << "{";
    if (expr.elementCount() == 0)
    {
        out << "}";
        return;
    }
    out << "\n";
    if (expr.keyed)
    {
        for (const GoKeyedElement& entry : expr.entries)
        {
            writeIndent(out, indent + 1);
            renderInto(out, entry.key, imports, indent + 1);
            out << ": ";
            renderInto(out, entry.value, imports, indent + 1);
            out << ",\n";
        }
    }
    else
    {
        for (std::size_t i = 1; i < expr.operands.size(); ++i)
        {
            writeIndent(out, indent + 1);
            renderInto(out, expr.operands[i], imports, indent + 1);
            out << ",\n";
        }
    }
    writeIndent(out, indent);
    out << "}";
}

void renderInto(std::ostringstream& out, const GoExpr& expr, GoImportSet& imports, const unsigned indent)
{
    switch (expr.kind)
    {
    case GoExprKind::Nil:
        out << "nil";
        return;
    case GoExprKind::Literal:
    case GoExprKind::Identifier:
        out << expr.text;
        return;
    case GoExprKind::Qualified: {
        const std::string alias = imports.qualifier(expr.packagePath);
        if (!alias.empty())
        {
            out << alias << '.';
        }
        out << expr.text;
        return;
    }
    case GoExprKind::SliceType:
        out << "[]";
        renderInto(out, expr.operands.front(), imports, indent);
        return;
    case GoExprKind::ArrayType:
        out << "[" << expr.length << "]";
        renderInto(out, expr.operands.front(), imports, indent);
        return;
    case GoExprKind::MapType:
        out << "map[";
        renderInto(out, expr.operands[0], imports, indent);
        out << "]";
        renderInto(out, expr.operands[1], imports, indent);
        return;
    case GoExprKind::PointerType:
        out << "*";
        renderInto(out, expr.operands.front(), imports, indent);
        return;
    case GoExprKind::AddressOf:
        out << "&";
        renderInto(out, expr.operands.front(), imports, indent);
        return;
    case GoExprKind::Composite:
        renderInto(out, expr.operands.front(), imports, indent);
        renderElementList(out, expr, imports, indent);
        return;
    case GoExprKind::Call:
        renderInto(out, expr.operands.front(), imports, indent);
        out << "(";
        for (std::size_t i = 1; i < expr.operands.size(); ++i)
        {
            if (i > 1)
            {
                out << ", ";
            }
            renderInto(out, expr.operands[i], imports, indent);
        }
        out << ")";
        return;
    case GoExprKind::Index:
        renderInto(out, expr.operands.front(), imports, indent);
        out << "[" << expr.length << "]";
        return;
    }
}

}  // namespace

GoExpr GoExpr::nil()
{
    return GoExpr{};
}

GoExpr GoExpr::literal(std::string text)
{
    GoExpr out;
    out.kind = GoExprKind::Literal;
    out.text = std::move(text);
    return out;
}

GoExpr GoExpr::identifier(std::string name)
{
    GoExpr out;
    out.kind = GoExprKind::Identifier;
    out.text = std::move(name);
    return out;
}

GoExpr GoExpr::qualified(std::string packagePath, std::string name)
{
    GoExpr out;
    out.kind        = GoExprKind::Qualified;
    out.packagePath = std::move(packagePath);
    out.text        = std::move(name);
    return out;
}

GoExpr GoExpr::sliceType(GoExpr elem)
{
    GoExpr out;
    out.kind = GoExprKind::SliceType;
    out.operands.push_back(std::move(elem));
    return out;
}

GoExpr GoExpr::arrayType(const std::uint64_t length, GoExpr elem)
{
    GoExpr out;
    out.kind   = GoExprKind::ArrayType;
    out.length = length;
    out.operands.push_back(std::move(elem));
    return out;
}

GoExpr GoExpr::mapType(GoExpr key, GoExpr value)
{
    GoExpr out;
    out.kind = GoExprKind::MapType;
    out.operands.push_back(std::move(key));
    out.operands.push_back(std::move(value));
    return out;
}

GoExpr GoExpr::pointerType(GoExpr elem)
{
    GoExpr out;
    out.kind = GoExprKind::PointerType;
    out.operands.push_back(std::move(elem));
    return out;
}

GoExpr GoExpr::addressOf(GoExpr operand)
{
    GoExpr out;
    out.kind = GoExprKind::AddressOf;
    out.operands.push_back(std::move(operand));
    return out;
}

GoExpr GoExpr::composite(GoExpr type, std::vector<GoExpr> elements)
{
    GoExpr out;
    out.kind = GoExprKind::Composite;
    out.operands.reserve(elements.size() + 1);
    out.operands.push_back(std::move(type));
    for (GoExpr& element : elements)
    {
        out.operands.push_back(std::move(element));
    }
    return out;
}

GoExpr GoExpr::keyedComposite(GoExpr type, std::vector<GoKeyedElement> entries)
{
    GoExpr out;
    out.kind  = GoExprKind::Composite;
    out.keyed = true;
    out.operands.push_back(std::move(type));
    out.entries = std::move(entries);
    return out;
}

GoExpr GoExpr::call(GoExpr callee, std::vector<GoExpr> args)
{
    GoExpr out;
    out.kind = GoExprKind::Call;
    out.operands.reserve(args.size() + 1);
    out.operands.push_back(std::move(callee));
    for (GoExpr& arg : args)
    {
        out.operands.push_back(std::move(arg));
    }
    return out;
}

GoExpr GoExpr::index(GoExpr operand, const std::uint64_t position)
{
    GoExpr out;
    out.kind   = GoExprKind::Index;
    out.length = position;
    out.operands.push_back(std::move(operand));
    return out;
}

std::size_t GoExpr::elementCount() const
{
    if (kind != GoExprKind::Composite)
    {
        return 0;
    }
    return keyed ? entries.size() : operands.size() - 1;
}

bool operator==(const GoExpr& lhs, const GoExpr& rhs)
{
    return lhs.kind == rhs.kind && lhs.text == rhs.text && lhs.packagePath == rhs.packagePath &&
           lhs.length == rhs.length && lhs.keyed == rhs.keyed && lhs.operands == rhs.operands &&
           lhs.entries == rhs.entries;
}

bool operator!=(const GoExpr& lhs, const GoExpr& rhs)
{
    return !(lhs == rhs);
}

bool operator==(const GoKeyedElement& lhs, const GoKeyedElement& rhs)
{
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

std::string guessPackageAlias(const llvm::StringRef packagePath)
{
    llvm::StringRef leaf = packagePath;
    while (leaf.consume_back("/"))
    {
    }
    const std::size_t slash = leaf.rfind('/');
    if (slash != llvm::StringRef::npos)
    {
        leaf = leaf.substr(slash + 1);
    }

    // gopkg.in/yaml.v2 style version suffix.
    const std::size_t dot = leaf.find('.');
    if (dot != llvm::StringRef::npos)
    {
        leaf = leaf.substr(0, dot);
    }
    leaf.consume_front("go-");
    leaf.consume_back("-go");

    std::string alias;
    for (const char c : leaf)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_')
        {
            alias.push_back(static_cast<char>(std::tolower(uc)));
        }
    }
    if (alias.empty() || std::isdigit(static_cast<unsigned char>(alias.front())))
    {
        alias = "pkg" + alias;
    }
    return alias;
}

GoImportSet::GoImportSet(std::string currentPackagePath)
    : currentPackagePath_(std::move(currentPackagePath))
{
}

std::string GoImportSet::qualifier(const llvm::StringRef packagePath)
{
    if (packagePath.empty() || packagePath == currentPackagePath_)
    {
        return "";
    }
    for (const GoImport& existing : imports_)
    {
        if (existing.path == packagePath && !existing.blank)
        {
            return existing.alias;
        }
    }

    const std::string base   = guessPackageAlias(packagePath);
    std::string       alias  = base;
    std::size_t       suffix = 0;
    auto              taken  = [&](const std::string& candidate) {
        if (goIsReservedIdentifier(candidate))
        {
            return true;
        }
        return std::any_of(imports_.begin(), imports_.end(), [&](const GoImport& i) {
            return !i.blank && i.alias == candidate;
        });
    };
    while (taken(alias))
    {
        alias = base + std::to_string(++suffix);
    }

    const std::size_t slash    = packagePath.rfind('/');
    const auto        lastElem = slash == llvm::StringRef::npos ? packagePath : packagePath.substr(slash + 1);
    imports_.push_back(GoImport{packagePath.str(), alias, alias != lastElem, false});
    return alias;
}

void GoImportSet::addBlank(const llvm::StringRef packagePath)
{
    for (const GoImport& existing : imports_)
    {
        if (existing.path == packagePath && existing.blank)
        {
            return;
        }
    }
    imports_.push_back(GoImport{packagePath.str(), "_", true, true});
}

std::vector<GoImport> GoImportSet::sorted() const
{
    std::vector<GoImport> out = imports_;
    std::stable_sort(out.begin(), out.end(), [](const GoImport& a, const GoImport& b) { return a.path < b.path; });
    return out;
}

std::string renderGoExpr(const GoExpr& expr, GoImportSet& imports, const unsigned indent)
{
    std::ostringstream out;
    renderInto(out, expr, imports, indent);
    return out.str();
}

}  // namespace gofreeze
