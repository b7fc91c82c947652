//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Width-preserving Go literal rendering for scalar values.
///
/// Every scalar kind maps to exactly one literal spelling so that the value,
/// including its width, is reconstructed unchanged when the literal is
/// compiled: `int` and `bool` render bare, sized signed integers as decimal
/// conversions (`int8(-5)`), unsigned integers as hex conversions
/// (`uint8(0xff)`), floats and complex numbers in the shortest round-trip form.
///
//===----------------------------------------------------------------------===//
#ifndef GOFREEZE_CODEGEN_LITERAL_FORMAT_H
#define GOFREEZE_CODEGEN_LITERAL_FORMAT_H

#include <string>

#include "gofreeze/CodeGen/GoCode.h"
#include "gofreeze/Model/RuntimeValue.h"

#include "llvm/ADT/StringRef.h"

namespace gofreeze
{

/// @brief Renders a scalar value as a canonical Go literal expression.
/// @param[in] scalar Scalar payload.
/// @return Literal expression; never fails.
GoExpr formatScalarLiteral(const ScalarValue& scalar);

/// @brief Quotes text as a Go interpreted string literal, matching `strconv.Quote`.
/// @param[in] text Raw bytes.
/// @return Double-quoted literal.
std::string quoteGoString(llvm::StringRef text);

/// @brief Formats a finite float64 with the Go `%v` verb.
/// @param[in] value Finite value.
/// @return Shortest round-trip text (`0.1`, `1e+06`, `-2`).
std::string formatGoFloat64(double value);

/// @brief Formats a finite float32 with the Go `%v` verb, at float32 precision.
/// @param[in] value Finite value.
/// @return Shortest text that round-trips through float32.
std::string formatGoFloat32(float value);

}  // namespace gofreeze

#endif  // GOFREEZE_CODEGEN_LITERAL_FORMAT_H
