//===- resolve_value.cpp - Scalar value resolution -------------------------===//
//
// Maps a single argument or property value onto the requested shape. Values
// are leaves: options, annotated-value structs and enums get special
// handling, everything else is decided by the value kind alone.
//
//===----------------------------------------------------------------------===//

#include "kaydle/resolver.h"

#include "resolver_helpers.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace kaydle {

[[noreturn]] static void invalidType(const Value &value, const std::string &expected) {
  std::string found = valueKindName(value.kind());
  if (value.kind() != ValueKind::Null)
    found += " `" + value.literal() + "`";
  fail(ErrorKind::ConversionFailed, "invalid type: " + found + ", expected " + expected,
       value.span);
}

static Value bareValue(const Value &value) {
  Value bare = value;
  bare.annotation.reset();
  return bare;
}

Datum Resolver::resolveValue(const Value &value, const Shape &shape) {
  DepthGuard guard(*this, "value", shape, value.literal(), value.span);

  switch (shape.tag()) {
  case ShapeKind::Option: {
    if (value.isNull())
      return Datum{DatumNone{}};
    return makeSome(resolveValue(value, *std::get<OptionShape>(shape.kind).inner));
  }
  case ShapeKind::NewtypeStruct: {
    const auto &nt = std::get<NewtypeStructShape>(shape.kind);
    return newtypeStruct(nt.name, resolveValue(value, *nt.inner));
  }
  case ShapeKind::Struct: {
    const auto &st = std::get<StructShape>(shape.kind);
    if (st.hasRole(FieldRole::Annotation))
      return resolveAnnotatedStruct(value, st);
    return resolveValueByKind(value, shape);
  }
  case ShapeKind::Enum:
    return resolveValueEnum(value, std::get<EnumShape>(shape.kind));
  default:
    return resolveValueByKind(value, shape);
  }
}

/// `(tag)value` into a struct with an annotation field and one other field.
Datum Resolver::resolveAnnotatedStruct(const Value &value, const StructShape &shape) {
  if (shape.fields.size() != 2)
    fail(ErrorKind::InvalidAnnotatedValue,
         "struct " + shape.name +
             " takes an annotated value only with exactly one field besides the annotation",
         value.span);
  const Field &marker = *shape.roleField(FieldRole::Annotation);
  const Field &other = shape.fields[shape.indexOf(marker) == 0 ? 1 : 0];
  if (other.role != FieldRole::Plain)
    fail(ErrorKind::InvalidAnnotatedValue,
         "struct " + shape.name + ": field `" + other.name + "` cannot receive a value",
         value.span);

  StructAssembler out(shape, value.span);
  if (value.annotation)
    out.set(marker, resolveIdentifierField(&*value.annotation, marker, value.span));
  out.set(other, resolveValue(bareValue(value), *other.shape));
  return out.finish();
}

Datum Resolver::resolveValueEnum(const Value &value, const EnumShape &shape) {
  if (value.annotation) {
    const VariantShape *variant = shape.findVariant(*value.annotation);
    if (!variant)
      fail(ErrorKind::UnknownVariant,
           "unknown variant `" + *value.annotation + "` of enum " + shape.name, value.span);
    if (variant->kind != VariantKind::Newtype)
      fail(ErrorKind::InvalidAnnotatedValue,
           "annotated value can only select a newtype variant; `" + variant->name + "` of enum " +
               shape.name + " is not one",
           value.span);
    return makeVariant(shape.name, variant->name, resolveValue(bareValue(value), *variant->payload));
  }

  auto *text = std::get_if<std::string>(&value.data);
  if (!text)
    invalidType(value, "enum " + shape.name);
  const VariantShape *variant = shape.findVariant(*text);
  if (!variant)
    fail(ErrorKind::UnknownVariant, "unknown variant `" + *text + "` of enum " + shape.name,
         value.span);
  if (variant->kind != VariantKind::Unit)
    fail(ErrorKind::ConversionFailed,
         "variant `" + *text + "` of enum " + shape.name + " is not a unit variant", value.span);
  return makeVariant(shape.name, variant->name, Datum{DatumUnit{}});
}

Datum Resolver::resolveValueByKind(const Value &value, const Shape &shape) {
  switch (shape.tag()) {
  case ShapeKind::IgnoredAny:
    return Datum{DatumUnit{}};
  case ShapeKind::Primitive:
    return convertPrimitive(value, std::get<PrimitiveShape>(shape.kind).kind);
  case ShapeKind::Unit:
    if (!value.isNull())
      invalidType(value, "unit");
    return Datum{DatumUnit{}};
  case ShapeKind::UnitStruct:
    if (!value.isNull())
      invalidType(value, describeShape(shape));
    return unitStruct(shape.typeName());
  case ShapeKind::Any:
    break;
  default:
    invalidType(value, describeShape(shape));
  }

  // Self-describing: the value kind decides.
  switch (value.kind()) {
  case ValueKind::Null:
    return Datum{DatumUnit{}};
  case ValueKind::Bool:
    return Datum{std::get<bool>(value.data)};
  case ValueKind::String:
    return Datum{std::get<std::string>(value.data)};
  case ValueKind::Number:
    break;
  }
  NumberRepr repr = classify(value);
  return std::visit([](auto n) { return Datum{n}; }, repr);
}

// ── Primitive conversion ────────────────────────────────────────────────────

NumberRepr Resolver::classify(const Value &value) {
  const std::string &literal = std::get<Number>(value.data).literal;
  try {
    return options.number_policy(literal);
  } catch (const Error &e) {
    if (e.span())
      throw;
    fail(e.kind(), e.detail(), value.span);
  }
}

Datum Resolver::convertPrimitive(const Value &value, PrimitiveKind kind) {
  switch (value.kind()) {
  case ValueKind::Number:
    return convertNumber(value, kind);
  case ValueKind::Bool:
    if (kind == PrimitiveKind::Bool)
      return Datum{std::get<bool>(value.data)};
    break;
  case ValueKind::String: {
    const auto &text = std::get<std::string>(value.data);
    if (kind == PrimitiveKind::String)
      return Datum{text};
    if (kind == PrimitiveKind::Char) {
      if (!isSingleCodepoint(text))
        fail(ErrorKind::ConversionFailed,
             "invalid value: string `" + text + "`, expected a single character", value.span);
      return Datum{text};
    }
    break;
  }
  case ValueKind::Null:
    break;
  }
  invalidType(value, primitiveKindName(kind));
}

namespace {

struct IntegerRange {
  int64_t min;
  uint64_t max;
};

/// Bounds of an integer primitive; nullopt for non-integers.
std::optional<IntegerRange> integerRange(PrimitiveKind kind) {
  switch (kind) {
  case PrimitiveKind::I8:
    return IntegerRange{INT8_MIN, INT8_MAX};
  case PrimitiveKind::I16:
    return IntegerRange{INT16_MIN, INT16_MAX};
  case PrimitiveKind::I32:
    return IntegerRange{INT32_MIN, INT32_MAX};
  case PrimitiveKind::I64:
    return IntegerRange{INT64_MIN, INT64_MAX};
  case PrimitiveKind::U8:
    return IntegerRange{0, UINT8_MAX};
  case PrimitiveKind::U16:
    return IntegerRange{0, UINT16_MAX};
  case PrimitiveKind::U32:
    return IntegerRange{0, UINT32_MAX};
  case PrimitiveKind::U64:
    return IntegerRange{0, UINT64_MAX};
  default:
    return std::nullopt;
  }
}

bool isSigned(PrimitiveKind kind) {
  return kind == PrimitiveKind::I8 || kind == PrimitiveKind::I16 || kind == PrimitiveKind::I32 ||
         kind == PrimitiveKind::I64;
}

} // namespace

Datum Resolver::convertNumber(const Value &value, PrimitiveKind kind) {
  const std::string &literal = std::get<Number>(value.data).literal;

  if (kind == PrimitiveKind::F32 || kind == PrimitiveKind::F64) {
    NumberRepr repr = classify(value);
    double d = std::visit([](auto n) { return static_cast<double>(n); }, repr);
    if (kind == PrimitiveKind::F32) {
      if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max())
        fail(ErrorKind::ConversionFailed,
             "invalid value: number `" + literal + "` is out of range for f32", value.span);
      d = static_cast<double>(static_cast<float>(d));
    }
    return Datum{d};
  }

  auto range = integerRange(kind);
  if (!range)
    invalidType(value, primitiveKindName(kind));

  NumberRepr repr = classify(value);
  if (std::holds_alternative<double>(repr))
    fail(ErrorKind::ConversionFailed,
         "invalid type: floating point `" + literal + "`, expected " + primitiveKindName(kind),
         value.span);

  bool inRange;
  if (auto *i = std::get_if<int64_t>(&repr))
    inRange = *i >= range->min && (*i < 0 || static_cast<uint64_t>(*i) <= range->max);
  else
    inRange = std::get<uint64_t>(repr) <= range->max;
  if (!inRange)
    fail(ErrorKind::ConversionFailed,
         "invalid value: number `" + literal + "` is out of range for " + primitiveKindName(kind),
         value.span);

  if (isSigned(kind)) {
    if (auto *i = std::get_if<int64_t>(&repr))
      return Datum{*i};
    return Datum{static_cast<int64_t>(std::get<uint64_t>(repr))};
  }
  if (auto *u = std::get_if<uint64_t>(&repr))
    return Datum{*u};
  return Datum{static_cast<uint64_t>(std::get<int64_t>(repr))};
}

} // namespace kaydle
