//===- number.cpp - Numeric literal classification -------------------------===//
//
// The default NumberPolicy. See number.h for the rules.
//
//===----------------------------------------------------------------------===//

#include "kaydle/number.h"

#include "kaydle/error.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>

namespace kaydle {

[[noreturn]] static void badLiteral(std::string_view literal, const char *why) {
  fail(ErrorKind::ConversionFailed,
       "invalid number literal `" + std::string(literal) + "`: " + why);
}

/// Strip `_` separators from a run of digits. A separator may not lead.
static std::string stripSeparators(std::string_view literal, std::string_view digits) {
  if (digits.empty() || digits.front() == '_')
    badLiteral(literal, "expected a digit");
  std::string clean;
  clean.reserve(digits.size());
  for (char c : digits)
    if (c != '_')
      clean.push_back(c);
  return clean;
}

static NumberRepr makeInteger(std::string_view literal, bool negative, const std::string &digits,
                              int base) {
  uint64_t magnitude = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
  if (ec == std::errc::result_out_of_range)
    fail(ErrorKind::ConversionFailed,
         "number literal `" + std::string(literal) + "` does not fit in 64 bits");
  if (ec != std::errc() || ptr != digits.data() + digits.size())
    badLiteral(literal, "unexpected character");

  if (!negative)
    return magnitude;
  constexpr uint64_t minMagnitude = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
  if (magnitude > minMagnitude)
    fail(ErrorKind::ConversionFailed,
         "number literal `" + std::string(literal) + "` does not fit in 64 bits");
  if (magnitude == minMagnitude)
    return std::numeric_limits<int64_t>::min();
  return -static_cast<int64_t>(magnitude);
}

NumberRepr classifyNumber(std::string_view literal) {
  if (literal == "inf" || literal == "+inf")
    return std::numeric_limits<double>::infinity();
  if (literal == "-inf")
    return -std::numeric_limits<double>::infinity();
  if (literal == "nan")
    return std::numeric_limits<double>::quiet_NaN();

  std::string_view rest = literal;
  bool negative = false;
  if (!rest.empty() && (rest.front() == '+' || rest.front() == '-')) {
    negative = rest.front() == '-';
    rest.remove_prefix(1);
  }
  if (rest.empty())
    badLiteral(literal, "empty");

  if (rest.size() > 2 && rest[0] == '0') {
    int base = 0;
    switch (rest[1]) {
    case 'x':
      base = 16;
      break;
    case 'o':
      base = 8;
      break;
    case 'b':
      base = 2;
      break;
    default:
      break;
    }
    if (base != 0)
      return makeInteger(literal, negative, stripSeparators(literal, rest.substr(2)), base);
  }

  // Decimal: integer part, optional fraction, optional exponent.
  size_t fractionAt = rest.find('.');
  size_t exponentAt = rest.find_first_of("eE");
  if (fractionAt == std::string_view::npos && exponentAt == std::string_view::npos)
    return makeInteger(literal, negative, stripSeparators(literal, rest), 10);

  std::string text = negative ? "-" : "";
  size_t integerEnd = std::min(fractionAt, exponentAt);
  text += stripSeparators(literal, rest.substr(0, integerEnd));
  if (fractionAt != std::string_view::npos) {
    if (exponentAt != std::string_view::npos && exponentAt < fractionAt)
      badLiteral(literal, "fraction after exponent");
    size_t fractionEnd = exponentAt == std::string_view::npos ? rest.size() : exponentAt;
    text += '.';
    text += stripSeparators(literal, rest.substr(fractionAt + 1, fractionEnd - fractionAt - 1));
  }
  if (exponentAt != std::string_view::npos) {
    std::string_view exponent = rest.substr(exponentAt + 1);
    text += 'e';
    if (!exponent.empty() && (exponent.front() == '+' || exponent.front() == '-')) {
      text += exponent.front();
      exponent.remove_prefix(1);
    }
    text += stripSeparators(literal, exponent);
  }

  double value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc::result_out_of_range)
    fail(ErrorKind::ConversionFailed,
         "number literal `" + std::string(literal) + "` is out of range for f64");
  if (ec != std::errc() || ptr != text.data() + text.size())
    badLiteral(literal, "unexpected character");
  return value;
}

std::string floatLiteral(double value) {
  if (std::isnan(value))
    return "nan";
  if (std::isinf(value))
    return value < 0 ? "-inf" : "inf";

  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  std::string text(buf, ec == std::errc() ? ptr : buf);
  if (text.find_first_of(".eE") == std::string::npos)
    text += ".0";
  return text;
}

} // namespace kaydle
