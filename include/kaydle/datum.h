//===- datum.h - Resolved target values -------------------------*- C++ -*-===//
//
// A Datum is what the resolver hands back: a value of the requested shape,
// independently owned (nothing points back into the document).
//
// Output conventions:
//   - Primitives           → bool / int64_t / uint64_t / double / std::string
//   - Unit                 → DatumUnit
//   - Option               → DatumNone or DatumSome
//   - Seq, Tuple           → DatumSeq
//   - Map                  → DatumMap (entries in insertion order)
//   - Struct and the named unit/newtype/tuple structs → DatumStruct
//   - Enum                 → DatumVariant
//
//===----------------------------------------------------------------------===//

#ifndef KAYDLE_DATUM_H
#define KAYDLE_DATUM_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kaydle {

struct Datum;

struct DatumUnit {};
struct DatumNone {};
struct DatumSome {
  std::unique_ptr<Datum> value;
};
struct DatumSeq {
  std::vector<Datum> elements;
};
struct DatumMap {
  std::vector<std::pair<std::string, Datum>> entries;
  bool keep_all = false; // true: duplicate keys may appear
};

enum class StructForm {
  Named,   // struct with named fields
  Unit,    // unit struct: no fields
  Newtype, // one field named "0"
  Tuple,   // fields named "0", "1", ...
};

struct DatumStruct {
  std::string name;
  StructForm form = StructForm::Named;
  std::vector<std::pair<std::string, Datum>> fields; // declaration order
};
struct DatumVariant {
  std::string enum_name;
  std::string variant;
  std::unique_ptr<Datum> payload; // DatumUnit for unit variants
};

struct Datum {
  std::variant<DatumUnit, bool, int64_t, uint64_t, double, std::string, DatumNone, DatumSome,
               DatumSeq, DatumMap, DatumStruct, DatumVariant>
      kind;

  bool isUnit() const { return std::holds_alternative<DatumUnit>(kind); }
  bool isNone() const { return std::holds_alternative<DatumNone>(kind); }

  /// The wrapped value of a DatumSome, or nullptr.
  const Datum *some() const;

  /// Struct field or map entry by name (the last one for keep-all maps with
  /// repeated keys), or nullptr.
  const Datum *get(llvm::StringRef key) const;

  /// Sequence element, or nullptr when out of range or not a sequence.
  const Datum *at(size_t index) const;
};

Datum makeSome(Datum value);
Datum makeVariant(std::string enumName, std::string variant, Datum payload);

/// Compact single-line debug rendering, e.g.
/// `point{x: 1.5, y: -2}`, `[1, 2]`, `Some("a")`, `shape::circle([5.0])`.
void printDatum(const Datum &datum, llvm::raw_ostream &os);
std::string toString(const Datum &datum);

/// JSON rendering. Structs and last-wins maps become objects, keep-all maps
/// become arrays of [key, value] pairs, newtype structs are transparent,
/// unit structs and unit values are null, variants are externally tagged
/// (`{"circle": [5.0]}`, or the bare variant name for unit variants).
nlohmann::ordered_json toJson(const Datum &datum);

} // namespace kaydle

#endif // KAYDLE_DATUM_H
