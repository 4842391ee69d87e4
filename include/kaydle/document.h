//===- document.h - Node-document model consumed by the resolver ---------===//
//
// The parsed form of a KDL-style document: a list of named nodes, each with
// ordered arguments, properties kept in parse order (duplicates included),
// and an optional children block.
//
// Producers (the document reader, or hand-built trees in tests) own these
// structures; the resolver only ever borrows them.
//
//===----------------------------------------------------------------------===//

#ifndef KAYDLE_DOCUMENT_H
#define KAYDLE_DOCUMENT_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kaydle {

// ── Span ──────────────────────────────────────────────────────────────────

/// Source span with byte offsets into the original document text.
/// A zero-length span at offset 0 means "unknown".
struct Span {
  uint64_t start = 0;
  uint64_t end = 0;

  bool known() const { return start != 0 || end != 0; }
};

// ── Values ────────────────────────────────────────────────────────────────

struct Null {};

/// A number as it was spelled in the source (hex, octal, binary, decimal,
/// with or without exponent). Whether it becomes a signed, unsigned or
/// floating-point value is decided at resolution time by the number policy.
struct Number {
  std::string literal;
};

enum class ValueKind {
  Null,
  Bool,
  Number,
  String,
};

/// A scalar argument or property value. Quoted, raw and bare-identifier
/// strings are all just strings here.
struct Value {
  std::variant<Null, bool, Number, std::string> data;
  std::optional<std::string> annotation;
  Span span;

  ValueKind kind() const { return static_cast<ValueKind>(data.index()); }
  bool isNull() const { return std::holds_alternative<Null>(data); }

  /// Text used in diagnostics: the literal for numbers, the contents for
  /// strings, `null`/`true`/`false` otherwise.
  std::string literal() const;
};

const char *valueKindName(ValueKind kind);

// ── Nodes ─────────────────────────────────────────────────────────────────

struct Property {
  std::string key;
  Value value;
};

struct Node;

/// An ordered list of nodes: a whole document or one children block.
using NodeList = std::vector<Node>;

struct Node {
  std::string name;
  std::optional<std::string> annotation;
  std::vector<Value> arguments;
  std::vector<Property> properties;
  std::optional<NodeList> children; // nullopt: no block; empty: `node {}`
  Span span;
};

// ── Builders ──────────────────────────────────────────────────────────────
// Small helpers for building documents in code.

inline Value nullValue() {
  return Value{Null{}, std::nullopt, {}};
}
inline Value boolValue(bool b) {
  return Value{b, std::nullopt, {}};
}
inline Value numberValue(std::string literal) {
  return Value{Number{std::move(literal)}, std::nullopt, {}};
}
inline Value stringValue(std::string s) {
  return Value{std::move(s), std::nullopt, {}};
}
inline Value annotated(std::string annotation, Value v) {
  v.annotation = std::move(annotation);
  return v;
}

} // namespace kaydle

#endif // KAYDLE_DOCUMENT_H
