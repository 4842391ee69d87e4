//===- resolver_helpers.h - Shared resolver internals -----------*- C++ -*-===//
//
// Private helpers shared by the resolve_*.cpp translation units. Not part of
// the public interface.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "kaydle/error.h"
#include "kaydle/resolver.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kaydle {

// ── Struct assembly ─────────────────────────────────────────────────────────

/// Collects field values of a struct in any order and emits them in
/// declaration order. Each field may be set once.
class Resolver::StructAssembler {
public:
  StructAssembler(const StructShape &shape, const Span &span)
      : shape(shape), span(span), slots(shape.fields.size()) {}

  bool has(const Field &field) const { return slots[shape.indexOf(field)].has_value(); }

  void set(const Field &field, Datum value) {
    auto &slot = slots[shape.indexOf(field)];
    if (slot)
      fail(ErrorKind::DuplicateField,
           "duplicate field `" + field.name + "` in struct " + shape.name, span);
    slot = std::move(value);
  }

  /// Fill absent option fields with none and build the struct. Throws
  /// MissingField for any other absent field.
  Datum finish() {
    DatumStruct out;
    out.name = shape.name;
    out.form = StructForm::Named;
    out.fields.reserve(slots.size());
    for (size_t i = 0; i < slots.size(); ++i) {
      const Field &f = shape.fields[i];
      if (!slots[i]) {
        if (f.shape->tag() != ShapeKind::Option)
          fail(ErrorKind::MissingField,
               "missing field `" + f.name + "` in struct " + shape.name, span);
        slots[i] = Datum{DatumNone{}};
      }
      out.fields.emplace_back(f.name, std::move(*slots[i]));
    }
    return Datum{std::move(out)};
  }

private:
  const StructShape &shape;
  Span span;
  std::vector<std::optional<Datum>> slots;
};

// ── Sequence targets ────────────────────────────────────────────────────────

/// Uniform view of Seq, Tuple and TupleStruct requests.
class SequenceTarget {
public:
  explicit SequenceTarget(const Shape &shape) : shape(shape) {
    if (auto *s = std::get_if<SeqShape>(&shape.kind))
      element = s->element.get();
    else if (auto *t = std::get_if<TupleShape>(&shape.kind))
      elements = &t->elements;
    else if (auto *t = std::get_if<TupleStructShape>(&shape.kind))
      elements = &t->elements;
  }

  const Shape &elementAt(size_t index) const {
    return element ? *element : *(*elements)[index];
  }

  /// Tuples and tuple structs need exactly their declared element count.
  void checkLength(size_t count, const Span &span) const {
    if (!elements || count == elements->size())
      return;
    fail(ErrorKind::InvalidLength,
         describeShape(shape) + " expects " + std::to_string(elements->size()) +
             " elements, got " + std::to_string(count),
         span);
  }

  Datum finish(std::vector<Datum> values) const {
    auto *ts = std::get_if<TupleStructShape>(&shape.kind);
    if (!ts)
      return Datum{DatumSeq{std::move(values)}};
    DatumStruct out;
    out.name = ts->name;
    out.form = StructForm::Tuple;
    out.fields.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i)
      out.fields.emplace_back(std::to_string(i), std::move(values[i]));
    return Datum{std::move(out)};
  }

private:
  const Shape &shape;
  const Shape *element = nullptr;
  const std::vector<ShapePtr> *elements = nullptr;
};

// ── Map assembly ────────────────────────────────────────────────────────────

/// Append an entry according to the map's duplicate-key policy.
inline void insertMapEntry(DatumMap &map, std::string key, Datum value, MapDuplicates policy) {
  if (policy == MapDuplicates::LastWins) {
    for (auto &entry : map.entries) {
      if (entry.first == key) {
        entry.second = std::move(value);
        return;
      }
    }
  }
  map.entries.emplace_back(std::move(key), std::move(value));
}

/// True when \p text is exactly one well-formed UTF-8 code point: no
/// overlong forms, no surrogates, nothing above U+10FFFF.
inline bool isSingleCodepoint(llvm::StringRef text) {
  if (text.empty())
    return false;
  auto lead = static_cast<unsigned char>(text.front());
  size_t length;
  uint32_t cp;
  if (lead < 0x80) {
    length = 1;
    cp = lead;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead >> 4) == 0xE) {
    length = 3;
    cp = lead & 0x0F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    cp = lead & 0x07;
  } else {
    return false;
  }
  if (text.size() != length)
    return false;
  for (size_t i = 1; i < length; ++i) {
    auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0) != 0x80)
      return false;
    cp = (cp << 6) | (byte & 0x3F);
  }
  static constexpr uint32_t minForLength[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < minForLength[length])
    return false;
  return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

inline Datum newtypeStruct(const std::string &name, Datum inner) {
  DatumStruct out;
  out.name = name;
  out.form = StructForm::Newtype;
  out.fields.emplace_back("0", std::move(inner));
  return Datum{std::move(out)};
}

inline Datum unitStruct(const std::string &name) {
  DatumStruct out;
  out.name = name;
  out.form = StructForm::Unit;
  return Datum{std::move(out)};
}

} // namespace kaydle
