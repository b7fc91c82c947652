//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Go scalar literal rendering.
///
/// Float text is derived from the shortest round-trip scientific form produced
/// by `std::to_chars` and re-laid out following Go's `%v` rule: exponent form
/// when the decimal exponent is below -4 or at least 6, plain decimal
/// otherwise.
///
//===----------------------------------------------------------------------===//

#include "gofreeze/CodeGen/LiteralFormat.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"

namespace gofreeze
{
namespace
{

constexpr int kExponentFormLow  = -4;
constexpr int kExponentFormHigh = 6;

template <typename Float>
std::string shortestGoFloat(const Float value)
{
    char buffer[64];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
    if (result.ec != std::errc())
    {
        return std::to_string(value);
    }
    llvm::StringRef scientific(buffer, static_cast<std::size_t>(result.ptr - buffer));

    std::string sign;
    if (scientific.consume_front("-"))
    {
        sign = "-";
    }
    const std::size_t ePos     = scientific.find('e');
    llvm::StringRef   mantissa = scientific.substr(0, ePos);
    llvm::StringRef   expText  = scientific.substr(ePos + 1);
    expText.consume_front("+");
    int exponent = 0;
    if (expText.getAsInteger(10, exponent))
    {
        return sign + scientific.str();
    }

    if (exponent < kExponentFormLow || exponent >= kExponentFormHigh)
    {
        return sign + scientific.str();
    }

    std::string digits;
    for (const char c : mantissa)
    {
        if (c != '.')
        {
            digits.push_back(c);
        }
    }

    std::string out = sign;
    if (exponent < 0)
    {
        out += "0.";
        out.append(static_cast<std::size_t>(-exponent - 1), '0');
        out += digits;
        return out;
    }
    const auto integerDigits = static_cast<std::size_t>(exponent) + 1;
    if (digits.size() <= integerDigits)
    {
        out += digits;
        out.append(integerDigits - digits.size(), '0');
        return out;
    }
    out += digits.substr(0, integerDigits);
    out += '.';
    out += digits.substr(integerDigits);
    return out;
}

/// True for values that Go constant arithmetic cannot spell: infinities, NaN
/// and negative zero (constants fold `-0.0` to `+0`).
bool needsMathCall(const double value)
{
    return !std::isfinite(value) || (value == 0 && std::signbit(value));
}

/// Builds the `math` call producing a value for which @ref needsMathCall holds.
GoExpr mathFloat(const double value)
{
    if (std::isnan(value))
    {
        return GoExpr::call(GoExpr::qualified("math", "NaN"), {});
    }
    if (value == 0)
    {
        return GoExpr::call(GoExpr::qualified("math", "Copysign"), {GoExpr::literal("0"), GoExpr::literal("-1")});
    }
    return GoExpr::call(GoExpr::qualified("math", "Inf"), {GoExpr::literal(value < 0 ? "-1" : "1")});
}

GoExpr conversion(const llvm::StringRef typeName, GoExpr operand)
{
    return GoExpr::call(GoExpr::identifier(typeName.str()), {std::move(operand)});
}

GoExpr hexConversion(const llvm::StringRef typeName, const std::uint64_t value)
{
    return conversion(typeName, GoExpr::literal("0x" + llvm::utohexstr(value, /*LowerCase=*/true)));
}

GoExpr decimalConversion(const llvm::StringRef typeName, const std::int64_t value)
{
    return conversion(typeName, GoExpr::literal(std::to_string(value)));
}

GoExpr float64Literal(const double value)
{
    if (needsMathCall(value))
    {
        return mathFloat(value);
    }
    std::string text = formatGoFloat64(value);
    if (text.find_first_of(".e") == std::string::npos)
    {
        text += ".0";
    }
    return GoExpr::literal(std::move(text));
}

GoExpr float32Literal(const float value)
{
    if (needsMathCall(static_cast<double>(value)))
    {
        return conversion("float32", mathFloat(static_cast<double>(value)));
    }
    return conversion("float32", GoExpr::literal(formatGoFloat32(value)));
}

/// Renders a complex number. Finite values use the `(re+imi)` constant form;
/// a part that needs a `math` call forces the `complex(re, im)` builtin.
template <typename Float>
GoExpr complexLiteral(const std::complex<Float>& value)
{
    const Float re = value.real();
    const Float im = value.imag();
    if (!needsMathCall(static_cast<double>(re)) && !needsMathCall(static_cast<double>(im)))
    {
        const std::string reText = shortestGoFloat(re);
        const std::string imText = shortestGoFloat(im);
        const bool        negativeIm = !imText.empty() && imText.front() == '-';
        return GoExpr::literal("(" + reText + (negativeIm ? "" : "+") + imText + "i)");
    }

    auto part = [](const Float f) {
        const auto wide = static_cast<double>(f);
        return needsMathCall(wide) ? mathFloat(wide) : GoExpr::literal(shortestGoFloat(f));
    };
    return GoExpr::call(GoExpr::identifier("complex"), {part(re), part(im)});
}

bool isGoPrintable(const llvm::UTF32 rune)
{
    if (rune < 0x20 || rune == 0x7F || (rune >= 0x80 && rune <= 0x9F))
    {
        return false;
    }
    switch (rune)
    {
    case 0x00A0:
    case 0x00AD:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
    case 0xFEFF:
        return false;
    default:
        break;
    }
    if ((rune >= 0x2000 && rune <= 0x200F) || (rune >= 0x2060 && rune <= 0x2064))
    {
        return false;
    }
    return true;
}

void appendHex(std::string& out, const std::uint32_t value, const unsigned width)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    for (unsigned i = width; i > 0; --i)
    {
        out.push_back(kDigits[(value >> ((i - 1) * 4)) & 0xFU]);
    }
}

}  // namespace

std::string formatGoFloat64(const double value)
{
    return shortestGoFloat(value);
}

std::string formatGoFloat32(const float value)
{
    return shortestGoFloat(value);
}

std::string quoteGoString(const llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');

    const auto*       cursor = reinterpret_cast<const llvm::UTF8*>(text.data());
    const auto* const end    = cursor + text.size();
    while (cursor < end)
    {
        const llvm::UTF8 byte = *cursor;
        if (byte < 0x80)
        {
            ++cursor;
            switch (byte)
            {
            case '\a':
                out += "\\a";
                continue;
            case '\b':
                out += "\\b";
                continue;
            case '\f':
                out += "\\f";
                continue;
            case '\n':
                out += "\\n";
                continue;
            case '\r':
                out += "\\r";
                continue;
            case '\t':
                out += "\\t";
                continue;
            case '\v':
                out += "\\v";
                continue;
            case '\\':
                out += "\\\\";
                continue;
            case '"':
                out += "\\\"";
                continue;
            default:
                break;
            }
            if (byte < 0x20 || byte == 0x7F)
            {
                out += "\\x";
                appendHex(out, byte, 2);
            }
            else
            {
                out.push_back(static_cast<char>(byte));
            }
            continue;
        }

        const llvm::UTF8* start = cursor;
        llvm::UTF32       rune  = 0;
        if (llvm::convertUTF8Sequence(&cursor, end, &rune, llvm::strictConversion) != llvm::conversionOK)
        {
            cursor = start + 1;
            out += "\\x";
            appendHex(out, byte, 2);
            continue;
        }
        if (isGoPrintable(rune))
        {
            out.append(reinterpret_cast<const char*>(start), static_cast<std::size_t>(cursor - start));
        }
        else if (rune < 0x10000)
        {
            out += "\\u";
            appendHex(out, rune, 4);
        }
        else
        {
            out += "\\U";
            appendHex(out, rune, 8);
        }
    }

    out.push_back('"');
    return out;
}

GoExpr formatScalarLiteral(const ScalarValue& scalar)
{
    return std::visit(
        [](const auto& v) -> GoExpr {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
            {
                return GoExpr::literal(v ? "true" : "false");
            }
            else if constexpr (std::is_same_v<T, GoInt>)
            {
                return GoExpr::literal(std::to_string(v.value));
            }
            else if constexpr (std::is_same_v<T, std::int8_t>)
            {
                return decimalConversion("int8", v);
            }
            else if constexpr (std::is_same_v<T, std::int16_t>)
            {
                return decimalConversion("int16", v);
            }
            else if constexpr (std::is_same_v<T, std::int32_t>)
            {
                return decimalConversion("int32", v);
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return decimalConversion("int64", v);
            }
            else if constexpr (std::is_same_v<T, GoUint>)
            {
                return hexConversion("uint", v.value);
            }
            else if constexpr (std::is_same_v<T, std::uint8_t>)
            {
                return hexConversion("uint8", v);
            }
            else if constexpr (std::is_same_v<T, std::uint16_t>)
            {
                return hexConversion("uint16", v);
            }
            else if constexpr (std::is_same_v<T, std::uint32_t>)
            {
                return hexConversion("uint32", v);
            }
            else if constexpr (std::is_same_v<T, std::uint64_t>)
            {
                return hexConversion("uint64", v);
            }
            else if constexpr (std::is_same_v<T, GoUintptr>)
            {
                return hexConversion("uintptr", v.value);
            }
            else if constexpr (std::is_same_v<T, float>)
            {
                return float32Literal(v);
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return float64Literal(v);
            }
            else if constexpr (std::is_same_v<T, std::complex<float>>)
            {
                return conversion("complex64", complexLiteral(v));
            }
            else if constexpr (std::is_same_v<T, std::complex<double>>)
            {
                return complexLiteral(v);
            }
            else
            {
                static_assert(std::is_same_v<T, std::string>, "unhandled scalar alternative");
                return GoExpr::literal(quoteGoString(v));
            }
        },
        scalar);
}

}  // namespace gofreeze
