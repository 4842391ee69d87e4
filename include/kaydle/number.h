//===- number.h - Numeric literal classification ----------------*- C++ -*-===//
//
// KDL does not distinguish integers from floats, or signed from unsigned.
// The resolver asks a NumberPolicy to turn each literal into exactly one of
// int64_t, uint64_t or double before converting it to the requested width.
//
// Default rules (classifyNumber):
//   - `_` is a digit separator; `0x`, `0o` and `0b` select the radix.
//   - A decimal literal with a fractional part or an exponent is a double.
//   - Otherwise a negative literal is an int64_t, anything else a uint64_t.
//   - Integers that overflow 64 bits are a ConversionFailed error.
//
//===----------------------------------------------------------------------===//

#ifndef KAYDLE_NUMBER_H
#define KAYDLE_NUMBER_H

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace kaydle {

using NumberRepr = std::variant<int64_t, uint64_t, double>;

using NumberPolicy = std::function<NumberRepr(std::string_view literal)>;

/// The default policy. Throws kaydle::Error on malformed or out-of-range
/// literals.
NumberRepr classifyNumber(std::string_view literal);

/// Render a decoded double as a literal that classifyNumber maps back to a
/// double (always has a fraction or exponent, or is inf/nan).
std::string floatLiteral(double value);

} // namespace kaydle

#endif // KAYDLE_NUMBER_H
