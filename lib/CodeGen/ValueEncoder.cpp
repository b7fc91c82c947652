//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the recursive runtime value encoder.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/ValueEncoder.h"

#include <algorithm>
#include <set>
#include <utility>

#include "gofreeze/CodeGen/LiteralFormat.h"
#include "gofreeze/CodeGen/TypeExpression.h"

namespace gofreeze
{

char EncodeError::ID = 0;

namespace
{

class ValueEncoder final
{
public:
    explicit ValueEncoder(const EncodeOptions& options)
        : options_(options)
    {
        typeOptions_.sizedArrays = options.sizedArrays;
    }

    llvm::Expected<GoExpr> encode(const RuntimeValue& value)
    {
        if (!value.type)
        {
            return fail(EncodeErrorCode::TypeMismatch, "value has no type descriptor");
        }
        const TypeKind kind = value.type->kind;
        if (kind == TypeKind::Func || kind == TypeKind::Chan || kind == TypeKind::UnsafePointer)
        {
            return fail(EncodeErrorCode::UnsupportedKind, "unsupported kind " + typeKindName(kind).str());
        }

        if (options_.detectCycles && !active_.insert(&value).second)
        {
            return fail(EncodeErrorCode::CyclicValue,
                        "value of type " + value.type->str() + " refers back to itself");
        }
        auto result = std::visit([&](const auto& payload) { return encodePayload(value, payload); }, value.data);
        active_.erase(&value);
        return result;
    }

private:
    /// Appends a selector to the current path for the lifetime of the guard.
    class PathSegment final
    {
    public:
        PathSegment(std::string& path, const std::string& segment)
            : path_(path)
            , size_(path.size())
        {
            path_ += segment;
        }
        ~PathSegment()
        {
            path_.resize(size_);
        }
        PathSegment(const PathSegment&)            = delete;
        PathSegment& operator=(const PathSegment&) = delete;

    private:
        std::string&      path_;
        const std::size_t size_;
    };

    llvm::Error fail(const EncodeErrorCode code, std::string message) const
    {
        return llvm::make_error<EncodeError>(code, path_, std::move(message));
    }

    llvm::Error mismatch(const RuntimeValue& value, const llvm::StringRef payloadShape) const
    {
        return fail(EncodeErrorCode::TypeMismatch,
                    payloadShape.str() + " payload does not match type " + value.type->str());
    }

    llvm::Expected<GoExpr> encodeChild(const ValueRef& child, const std::string& segment)
    {
        PathSegment guard(path_, segment);
        if (!child)
        {
            return fail(EncodeErrorCode::TypeMismatch, "missing element value");
        }
        return encode(*child);
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const ScalarValue& scalar)
    {
        const TypeDescriptor& type = *value.type;
        if (!isScalarKind(type.kind) || scalarKind(scalar) != type.kind)
        {
            return mismatch(value, typeKindName(scalarKind(scalar)));
        }
        GoExpr literal = formatScalarLiteral(scalar);
        if (type.packagePath.empty())
        {
            return literal;
        }

        // A named scalar keeps its declared type through a conversion; the
        // builtin conversion, if any, is replaced rather than nested.
        if (literal.kind == GoExprKind::Call && literal.operands.size() == 2 &&
            literal.operands.front().kind == GoExprKind::Identifier &&
            builtinScalarKind(literal.operands.front().text))
        {
            GoExpr operand = std::move(literal.operands[1]);
            literal        = std::move(operand);
        }
        return GoExpr::call(resolveTypeExpression(type, typeOptions_), {std::move(literal)});
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const ArrayValue& array)
    {
        if (value.type->kind != TypeKind::Array)
        {
            return mismatch(value, "array");
        }
        if (array.elements.size() != value.type->length)
        {
            return fail(EncodeErrorCode::TypeMismatch,
                        "array of type " + value.type->str() + " holds " + std::to_string(array.elements.size()) +
                            " elements");
        }
        return encodeSequence(value, array.elements);
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const SliceValue& slice)
    {
        if (value.type->kind != TypeKind::Slice)
        {
            return mismatch(value, "slice");
        }
        if (slice.isNil)
        {
            return GoExpr::nil();
        }
        return encodeSequence(value, slice.elements);
    }

    llvm::Expected<GoExpr> encodeSequence(const RuntimeValue& value, const std::vector<ValueRef>& elements)
    {
        std::vector<GoExpr> encoded;
        encoded.reserve(elements.size());
        for (std::size_t i = 0; i < elements.size(); ++i)
        {
            auto element = encodeChild(elements[i], "[" + std::to_string(i) + "]");
            if (!element)
            {
                return element.takeError();
            }
            encoded.push_back(std::move(*element));
        }
        return GoExpr::composite(resolveTypeExpression(*value.type, typeOptions_), std::move(encoded));
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const MapValue& map)
    {
        if (value.type->kind != TypeKind::Map)
        {
            return mismatch(value, "map");
        }
        if (map.isNil)
        {
            return GoExpr::nil();
        }

        struct RenderedEntry final
        {
            std::string    sortKey;
            GoKeyedElement element;
        };
        std::vector<RenderedEntry> rendered;
        rendered.reserve(map.entries.size());
        for (std::size_t i = 0; i < map.entries.size(); ++i)
        {
            const MapEntry& entry = map.entries[i];
            auto            key   = encodeChild(entry.key, "{key " + std::to_string(i) + "}");
            if (!key)
            {
                return key.takeError();
            }
            GoImportSet scratch;
            std::string keyText = renderGoExpr(*key, scratch);
            auto        element = encodeChild(entry.value, "[" + keyText + "]");
            if (!element)
            {
                return element.takeError();
            }
            rendered.push_back(RenderedEntry{std::move(keyText), GoKeyedElement{std::move(*key), std::move(*element)}});
        }

        if (options_.sortMapEntries)
        {
            std::stable_sort(rendered.begin(), rendered.end(), [](const RenderedEntry& a, const RenderedEntry& b) {
                return a.sortKey < b.sortKey;
            });
        }

        std::vector<GoKeyedElement> entries;
        entries.reserve(rendered.size());
        for (RenderedEntry& entry : rendered)
        {
            entries.push_back(std::move(entry.element));
        }
        return GoExpr::keyedComposite(resolveTypeExpression(*value.type, typeOptions_), std::move(entries));
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const PointerValue& pointer)
    {
        if (value.type->kind != TypeKind::Pointer)
        {
            return mismatch(value, "pointer");
        }
        if (!pointer.pointee)
        {
            return GoExpr::nil();
        }
        auto pointee = encodeChild(pointer.pointee, "");
        if (!pointee)
        {
            return pointee.takeError();
        }
        if (pointee->kind == GoExprKind::Composite)
        {
            return GoExpr::addressOf(std::move(*pointee));
        }
        // Scalars, nil values and nested pointers are not addressable; box
        // them in a one-element slice and take the address of its element.
        GoExpr box = GoExpr::composite(GoExpr::sliceType(resolveTypeExpression(*pointer.pointee->type, typeOptions_)),
                                       {std::move(*pointee)});
        return GoExpr::addressOf(GoExpr::index(std::move(box), 0));
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const InterfaceValue& iface)
    {
        if (value.type->kind != TypeKind::Interface)
        {
            return mismatch(value, "interface");
        }
        if (!iface.held)
        {
            return GoExpr::nil();
        }
        return encodeChild(iface.held, "");
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const StructValue& record)
    {
        if (value.type->kind != TypeKind::Struct)
        {
            return mismatch(value, "struct");
        }
        std::vector<GoKeyedElement> entries;
        entries.reserve(record.fields.size());
        for (const FieldValue& field : record.fields)
        {
            if (field.visibility != FieldVisibility::Exported || !field.value)
            {
                continue;
            }
            auto encoded = encodeChild(field.value, "." + field.name);
            if (!encoded)
            {
                return encoded.takeError();
            }
            entries.push_back(GoKeyedElement{GoExpr::identifier(field.name), std::move(*encoded)});
        }
        return GoExpr::keyedComposite(resolveTypeExpression(*value.type, typeOptions_), std::move(entries));
    }

    llvm::Expected<GoExpr> encodePayload(const RuntimeValue& value, const OpaqueValue&)
    {
        return fail(EncodeErrorCode::UnsupportedKind, "unsupported kind " + typeKindName(value.type->kind).str());
    }

    const EncodeOptions&            options_;
    TypeExpressionOptions           typeOptions_;
    std::string                     path_;
    std::set<const RuntimeValue*>   active_;
};

}  // namespace

llvm::StringRef encodeErrorCodeName(const EncodeErrorCode code)
{
    switch (code)
    {
    case EncodeErrorCode::UnsupportedKind:
        return "unsupported-kind";
    case EncodeErrorCode::CyclicValue:
        return "cyclic-value";
    case EncodeErrorCode::TypeMismatch:
        return "type-mismatch";
    }
    return "unknown";
}

EncodeError::EncodeError(const EncodeErrorCode code, std::string path, std::string message)
    : code_(code)
    , path_(std::move(path))
    , message_(std::move(message))
{
}

void EncodeError::log(llvm::raw_ostream& os) const
{
    os << message_;
    if (!path_.empty())
    {
        os << " at " << path_;
    }
}

std::error_code EncodeError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Expected<GoExpr> encodeValue(const RuntimeValue& value, const EncodeOptions& options)
{
    ValueEncoder encoder(options);
    return encoder.encode(value);
}

}  // namespace gofreeze
