//===- shape.h - Shape requests announced by the target model ---*- C++ -*-===//
//
// A Shape describes what the target data model expects at the current
// position: a map, a sequence, a struct with declared fields, an enum, a
// primitive, and so on. Shapes are built once (in code, or by the schema
// reader) and shared immutably through ShapePtr.
//
// Struct fields may carry a FieldRole. A non-Plain role is a "magic" that
// asks for a node's raw sub-part (its properties, arguments, children,
// annotation or name) instead of a keyed entry.
//
//===----------------------------------------------------------------------===//

#ifndef KAYDLE_SHAPE_H
#define KAYDLE_SHAPE_H

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kaydle {

struct Shape;
using ShapePtr = std::shared_ptr<const Shape>;

// ── Kinds ─────────────────────────────────────────────────────────────────

enum class PrimitiveKind {
  Bool,
  I8,
  I16,
  I32,
  I64,
  U8,
  U16,
  U32,
  U64,
  F32,
  F64,
  Char,
  String,
};

/// Magic marker attached to a struct field.
enum class FieldRole {
  Plain,
  Properties,
  Arguments,
  Children,
  Annotation,
  Name,
  Transparent, // modifier on Name: the field receives the rest of the node
};

constexpr size_t kFieldRoleCount = 7;

/// How a map consumer treats repeated keys.
enum class MapDuplicates {
  LastWins, // unordered map: a later entry replaces the earlier one
  KeepAll,  // ordered list of pairs: every entry is kept in parse order
};

enum class VariantKind {
  Unit,
  Newtype,
  Tuple,
  Struct,
};

// ── Shape alternatives ────────────────────────────────────────────────────

struct AnyShape {};
struct IgnoredShape {};
struct PrimitiveShape {
  PrimitiveKind kind;
};
struct UnitShape {};
struct UnitStructShape {
  std::string name;
};
struct NewtypeStructShape {
  std::string name;
  ShapePtr inner;
};
struct OptionShape {
  ShapePtr inner;
};
struct SeqShape {
  ShapePtr element;
};
struct TupleShape {
  std::vector<ShapePtr> elements;
};
struct TupleStructShape {
  std::string name;
  std::vector<ShapePtr> elements;
};
struct MapShape {
  ShapePtr key; // a String or Char primitive
  ShapePtr value;
  MapDuplicates duplicates = MapDuplicates::LastWins;
};

struct Field {
  std::string name;
  ShapePtr shape;
  FieldRole role = FieldRole::Plain;
};

struct StructShape {
  std::string name;
  std::vector<Field> fields;
  bool allow_unknown_fields = false;

  /// Build the lookup tables and check role consistency. Must be called once
  /// after the field list is complete; throws InvalidSchema on duplicate
  /// names, repeated roles, or `Transparent` without `Name`.
  void finalize();

  /// The Plain field with this name, or nullptr.
  const Field *plainField(llvm::StringRef fieldName) const;
  /// The field carrying this role, or nullptr.
  const Field *roleField(FieldRole role) const;
  bool hasRole(FieldRole role) const { return roleField(role) != nullptr; }
  bool hasMagics() const { return magicCount_ != 0; }
  size_t indexOf(const Field &field) const { return static_cast<size_t>(&field - fields.data()); }

private:
  llvm::StringMap<size_t> plainIndex_;
  std::array<int, kFieldRoleCount> roleIndex_ = {-1, -1, -1, -1, -1, -1, -1};
  size_t magicCount_ = 0;
};

struct VariantShape {
  std::string name;
  VariantKind kind = VariantKind::Unit;
  ShapePtr payload; // Unit: a Unit shape; Newtype: the inner shape;
                    // Tuple: a Tuple shape; Struct: a Struct shape
};

struct EnumShape {
  std::string name;
  std::vector<VariantShape> variants;

  const VariantShape *findVariant(llvm::StringRef variantName) const;
};

enum class ShapeKind {
  Any,
  IgnoredAny,
  Primitive,
  Unit,
  UnitStruct,
  NewtypeStruct,
  Option,
  Seq,
  Tuple,
  TupleStruct,
  Map,
  Struct,
  Enum,
};

struct Shape {
  std::variant<AnyShape, IgnoredShape, PrimitiveShape, UnitShape, UnitStructShape,
               NewtypeStructShape, OptionShape, SeqShape, TupleShape, TupleStructShape, MapShape,
               StructShape, EnumShape>
      kind;

  ShapeKind tag() const { return static_cast<ShapeKind>(kind.index()); }

  /// Declared type identifier for named shapes (struct, unit/newtype/tuple
  /// struct, enum); empty otherwise.
  const std::string &typeName() const;
};

const char *shapeKindName(ShapeKind kind);
const char *primitiveKindName(PrimitiveKind kind);
const char *fieldRoleName(FieldRole role);

/// Short human-readable description used in diagnostics, e.g.
/// `struct Point`, `seq`, `i32`.
std::string describeShape(const Shape &shape);

/// Map a reserved field name (`$kaydle::children`, ...) to its role.
std::optional<FieldRole> roleForReservedName(llvm::StringRef fieldName);

// ── Construction ──────────────────────────────────────────────────────────

ShapePtr anyShape();
ShapePtr ignoredShape();
ShapePtr primitiveShape(PrimitiveKind kind);
ShapePtr unitShape();
ShapePtr unitStructShape(std::string name);
ShapePtr newtypeStructShape(std::string name, ShapePtr inner);
ShapePtr optionShape(ShapePtr inner);
ShapePtr seqShape(ShapePtr element);
ShapePtr tupleShape(std::vector<ShapePtr> elements);
ShapePtr tupleStructShape(std::string name, std::vector<ShapePtr> elements);
ShapePtr mapShape(ShapePtr value, MapDuplicates duplicates = MapDuplicates::LastWins,
                  ShapePtr key = nullptr);
ShapePtr structShape(StructShape shape);
ShapePtr enumShape(EnumShape shape);

/// Incremental construction of struct shapes:
///
///   auto point = StructBuilder("point")
///                    .field("x", primitiveShape(PrimitiveKind::F64))
///                    .field("y", primitiveShape(PrimitiveKind::F64))
///                    .build();
class StructBuilder {
public:
  explicit StructBuilder(std::string name);

  StructBuilder &field(std::string name, ShapePtr shape);
  StructBuilder &magic(FieldRole role, std::string name, ShapePtr shape);
  StructBuilder &allowUnknownFields(bool allow = true);

  /// Finalizes the struct; throws InvalidSchema on inconsistent roles.
  ShapePtr build();

private:
  StructShape shape_;
};

class EnumBuilder {
public:
  explicit EnumBuilder(std::string name);

  EnumBuilder &unit(std::string variant);
  EnumBuilder &newtype(std::string variant, ShapePtr payload);
  EnumBuilder &tuple(std::string variant, std::vector<ShapePtr> elements);
  /// \p payload must be a Struct shape.
  EnumBuilder &structVariant(std::string variant, ShapePtr payload);

  ShapePtr build();

private:
  EnumShape shape_;
};

} // namespace kaydle

#endif // KAYDLE_SHAPE_H
