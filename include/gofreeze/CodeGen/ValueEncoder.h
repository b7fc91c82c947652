//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Recursive, type-directed runtime value to Go expression encoder.
///
/// The encoder walks a @ref RuntimeValue depth-first and produces one Go
/// expression that reconstructs an equal value when compiled. It performs no
/// I/O and keeps no state between calls.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_CODEGEN_VALUE_ENCODER_H
#define GOFREEZE_CODEGEN_VALUE_ENCODER_H

#include <string>
#include <system_error>

#include "gofreeze/CodeGen/GoCode.h"
#include "gofreeze/Model/RuntimeValue.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace gofreeze
{

/// @brief Options controlling value encoding.
struct EncodeOptions final
{
    /// @brief Spells array types as `[N]T`.
    bool sizedArrays{false};

    /// @brief Emits map entries sorted by their rendered key text.
    bool sortMapEntries{false};

    /// @brief Rejects values that re-enter themselves through a pointer, interface or container.
    bool detectCycles{true};
};

/// @brief Failure categories of @ref encodeValue.
enum class EncodeErrorCode
{
    /// @brief Value of a kind with no encoding rule (func, chan, unsafe pointer).
    UnsupportedKind,

    /// @brief Value reachable from itself.
    CyclicValue,

    /// @brief Payload shape disagrees with the type descriptor.
    TypeMismatch,
};

/// @brief Returns the stable spelling of an error code (`unsupported-kind`, ...).
llvm::StringRef encodeErrorCodeName(EncodeErrorCode code);

/// @brief Encoding failure with its category and the path of the offending value.
class EncodeError final : public llvm::ErrorInfo<EncodeError>
{
public:
    static char ID;

    EncodeError(EncodeErrorCode code, std::string path, std::string message);

    [[nodiscard]] EncodeErrorCode code() const
    {
        return code_;
    }

    /// @brief Selector path from the root value (`.Files[0].Body[2]`); empty for the root.
    [[nodiscard]] const std::string& path() const
    {
        return path_;
    }

    /// @brief Failure text without the path suffix.
    [[nodiscard]] const std::string& detail() const
    {
        return message_;
    }

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override;

private:
    EncodeErrorCode code_;
    std::string     path_;
    std::string     message_;
};

/// @brief Encodes a runtime value as a Go expression.
///
/// @details Dispatches on the value's kind:
/// - scalars become width-preserving literals; named scalar types are wrapped
///   in a conversion to the named type,
/// - arrays and non-nil slices become `T{e0, e1, ...}`,
/// - non-nil maps become `map[K]V{k: v, ...}` in encountered order, or sorted
///   by rendered key with @ref EncodeOptions::sortMapEntries,
/// - structs become `pkg.T{Field: v, ...}` over exported, readable fields,
/// - non-nil pointers become `&` applied to the pointee's composite literal;
///   other pointees are boxed as `&[]T{v}[0]`,
/// - non-nil interfaces encode their held value with no wrapper,
/// - nil slices, maps, pointers and interfaces become `nil`.
///
/// @param[in] value Root value; never retained.
/// @param[in] options Encoding options.
/// @return Expression, or an @ref EncodeError.
llvm::Expected<GoExpr> encodeValue(const RuntimeValue& value, const EncodeOptions& options = {});

}  // namespace gofreeze

#endif  // GOFREEZE_CODEGEN_VALUE_ENCODER_H
