//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go code-expression model and text renderer.
///
/// A @ref GoExpr is an immutable tree describing one complete Go expression.
/// Qualified names keep their package import path until rendering, where a
/// @ref GoImportSet assigns each path a file-local package alias.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_CODEGEN_GO_CODE_H
#define GOFREEZE_CODEGEN_GO_CODE_H

#include <cstdint>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace gofreeze
{

/// @brief Shape of a @ref GoExpr node.
enum class GoExprKind
{
    /// @brief The `nil` literal.
    Nil,

    /// @brief Literal token rendered verbatim (`int8(5)`, `"x"`, `1.5`).
    Literal,

    /// @brief Unqualified identifier.
    Identifier,

    /// @brief Package-qualified name; bare when the package path is empty.
    Qualified,

    /// @brief Slice type `[]T`.
    SliceType,

    /// @brief Array type `[N]T`.
    ArrayType,

    /// @brief Map type `map[K]V`.
    MapType,

    /// @brief Pointer type `*T`.
    PointerType,

    /// @brief Address-of `&X`.
    AddressOf,

    /// @brief Composite literal `T{...}` with positional or keyed elements.
    Composite,

    /// @brief Call or conversion `F(args)`.
    Call,

    /// @brief Constant index `X[N]`.
    Index,
};

struct GoKeyedElement;

/// @brief Immutable Go expression tree.
struct GoExpr final
{
    /// @brief Node shape.
    GoExprKind kind{GoExprKind::Nil};

    /// @brief Literal text, identifier, or local name of a qualified name.
    std::string text;

    /// @brief Import path of a qualified name.
    std::string packagePath;

    /// @brief Array length for `ArrayType`; constant index for `Index`.
    std::uint64_t length{0};

    /// @brief Child expressions.
    ///
    /// Slice/array/pointer types, address-of and index: `[operand]`. Map types:
    /// `[key, value]`. Composite literals: `[type, element...]`. Calls:
    /// `[callee, argument...]`.
    std::vector<GoExpr> operands;

    /// @brief Keyed elements of a keyed composite literal.
    std::vector<GoKeyedElement> entries;

    /// @brief True for a composite literal whose elements are `key: value` pairs.
    bool keyed{false};

    static GoExpr nil();
    static GoExpr literal(std::string text);
    static GoExpr identifier(std::string name);
    static GoExpr qualified(std::string packagePath, std::string name);
    static GoExpr sliceType(GoExpr elem);
    static GoExpr arrayType(std::uint64_t length, GoExpr elem);
    static GoExpr mapType(GoExpr key, GoExpr value);
    static GoExpr pointerType(GoExpr elem);
    static GoExpr addressOf(GoExpr operand);

    /// @brief Creates a positional composite literal `type{e0, e1, ...}`.
    static GoExpr composite(GoExpr type, std::vector<GoExpr> elements);

    /// @brief Creates a keyed composite literal `type{k0: v0, ...}`.
    static GoExpr keyedComposite(GoExpr type, std::vector<GoKeyedElement> entries);

    /// @brief Creates a call or conversion `callee(args...)`.
    static GoExpr call(GoExpr callee, std::vector<GoExpr> args);

    /// @brief Creates an index expression `operand[position]`.
    static GoExpr index(GoExpr operand, std::uint64_t position);

    /// @brief Returns the number of literal elements of a composite literal.
    [[nodiscard]] std::size_t elementCount() const;
};

/// @brief One `key: value` element of a keyed composite literal.
struct GoKeyedElement final
{
    GoExpr key;
    GoExpr value;
};

/// @brief Structural equality.
bool operator==(const GoExpr& lhs, const GoExpr& rhs);
bool operator!=(const GoExpr& lhs, const GoExpr& rhs);
bool operator==(const GoKeyedElement& lhs, const GoKeyedElement& rhs);

/// @brief One import line of a Go file.
struct GoImport final
{
    /// @brief Import path.
    std::string path;

    /// @brief Package alias used by qualified names in this file.
    std::string alias;

    /// @brief Renders the alias even when it equals the guessed package name.
    bool explicitAlias{false};

    /// @brief Renders as a blank import `_ "path"`.
    bool blank{false};
};

/// @brief File-scoped import table.
class GoImportSet final
{
public:
    /// @brief Creates an import set for a file of the given package.
    /// @param[in] currentPackagePath Import path of the file's own package; names from it render bare.
    explicit GoImportSet(std::string currentPackagePath = "");

    /// @brief Returns the alias used to qualify names of a package, registering the import on first use.
    /// @param[in] packagePath Import path.
    /// @return Alias, or an empty string for builtin names and names of the current package.
    std::string qualifier(llvm::StringRef packagePath);

    /// @brief Registers a blank import.
    /// @param[in] packagePath Import path.
    void addBlank(llvm::StringRef packagePath);

    /// @brief Imports sorted by path.
    [[nodiscard]] std::vector<GoImport> sorted() const;

    /// @brief Indicates whether no import was registered.
    [[nodiscard]] bool empty() const
    {
        return imports_.empty();
    }

private:
    std::string           currentPackagePath_;
    std::vector<GoImport> imports_;
};

/// @brief Guesses the package name of an import path (`github.com/x/go-yaml.v2` -> `yaml`).
/// @param[in] packagePath Import path.
/// @return Lower-case identifier.
std::string guessPackageAlias(llvm::StringRef packagePath);

/// @brief Renders an expression as Go source.
///
/// @details Non-empty composite literals are laid out one element per line,
/// indented with tabs relative to @p indent, each followed by a comma.
///
/// @param[in] expr Expression to render.
/// @param[in,out] imports Import table receiving every referenced package.
/// @param[in] indent Tab depth of the line the expression starts on.
/// @return Go source text.
std::string renderGoExpr(const GoExpr& expr, GoImportSet& imports, unsigned indent = 0);

}  // namespace gofreeze

#endif  // GOFREEZE_CODEGEN_GO_CODE_H
