//===- shape.cpp - Shape construction and lookup ---------------------------===//

#include "kaydle/shape.h"

#include "kaydle/error.h"

#include <string>
#include <utility>

namespace kaydle {

// ── StructShape ─────────────────────────────────────────────────────────────

void StructShape::finalize() {
  plainIndex_.clear();
  roleIndex_.fill(-1);
  magicCount_ = 0;

  for (size_t i = 0; i < fields.size(); ++i) {
    const Field &f = fields[i];
    if (!f.shape)
      fail(ErrorKind::InvalidSchema, "struct " + name + ": field `" + f.name + "` has no shape");
    if (f.role == FieldRole::Plain) {
      if (!plainIndex_.try_emplace(f.name, i).second)
        fail(ErrorKind::InvalidSchema,
             "struct " + name + ": duplicate field `" + f.name + "`");
      continue;
    }
    auto &slot = roleIndex_[static_cast<size_t>(f.role)];
    if (slot != -1)
      fail(ErrorKind::InvalidSchema, "struct " + name + ": more than one " +
                                         fieldRoleName(f.role) + " field");
    slot = static_cast<int>(i);
    ++magicCount_;
  }

  if (hasRole(FieldRole::Transparent) && !hasRole(FieldRole::Name))
    fail(ErrorKind::InvalidSchema,
         "struct " + name + ": a transparent field requires a name field");
}

const Field *StructShape::plainField(llvm::StringRef fieldName) const {
  auto it = plainIndex_.find(fieldName);
  if (it == plainIndex_.end())
    return nullptr;
  return &fields[it->second];
}

const Field *StructShape::roleField(FieldRole role) const {
  int idx = roleIndex_[static_cast<size_t>(role)];
  if (idx < 0)
    return nullptr;
  return &fields[static_cast<size_t>(idx)];
}

const VariantShape *EnumShape::findVariant(llvm::StringRef variantName) const {
  for (const auto &v : variants)
    if (v.name == variantName)
      return &v;
  return nullptr;
}

const std::string &Shape::typeName() const {
  static const std::string empty;
  if (auto *s = std::get_if<StructShape>(&kind))
    return s->name;
  if (auto *s = std::get_if<UnitStructShape>(&kind))
    return s->name;
  if (auto *s = std::get_if<NewtypeStructShape>(&kind))
    return s->name;
  if (auto *s = std::get_if<TupleStructShape>(&kind))
    return s->name;
  if (auto *s = std::get_if<EnumShape>(&kind))
    return s->name;
  return empty;
}

// ── Names ───────────────────────────────────────────────────────────────────

const char *shapeKindName(ShapeKind kind) {
  switch (kind) {
  case ShapeKind::Any:
    return "any";
  case ShapeKind::IgnoredAny:
    return "ignored";
  case ShapeKind::Primitive:
    return "primitive";
  case ShapeKind::Unit:
    return "unit";
  case ShapeKind::UnitStruct:
    return "unit struct";
  case ShapeKind::NewtypeStruct:
    return "newtype struct";
  case ShapeKind::Option:
    return "option";
  case ShapeKind::Seq:
    return "seq";
  case ShapeKind::Tuple:
    return "tuple";
  case ShapeKind::TupleStruct:
    return "tuple struct";
  case ShapeKind::Map:
    return "map";
  case ShapeKind::Struct:
    return "struct";
  case ShapeKind::Enum:
    return "enum";
  }
  return "shape";
}

const char *primitiveKindName(PrimitiveKind kind) {
  switch (kind) {
  case PrimitiveKind::Bool:
    return "bool";
  case PrimitiveKind::I8:
    return "i8";
  case PrimitiveKind::I16:
    return "i16";
  case PrimitiveKind::I32:
    return "i32";
  case PrimitiveKind::I64:
    return "i64";
  case PrimitiveKind::U8:
    return "u8";
  case PrimitiveKind::U16:
    return "u16";
  case PrimitiveKind::U32:
    return "u32";
  case PrimitiveKind::U64:
    return "u64";
  case PrimitiveKind::F32:
    return "f32";
  case PrimitiveKind::F64:
    return "f64";
  case PrimitiveKind::Char:
    return "char";
  case PrimitiveKind::String:
    return "string";
  }
  return "primitive";
}

const char *fieldRoleName(FieldRole role) {
  switch (role) {
  case FieldRole::Plain:
    return "plain";
  case FieldRole::Properties:
    return "properties";
  case FieldRole::Arguments:
    return "arguments";
  case FieldRole::Children:
    return "children";
  case FieldRole::Annotation:
    return "annotation";
  case FieldRole::Name:
    return "name";
  case FieldRole::Transparent:
    return "transparent";
  }
  return "role";
}

std::string describeShape(const Shape &shape) {
  if (auto *p = std::get_if<PrimitiveShape>(&shape.kind))
    return primitiveKindName(p->kind);
  if (auto *o = std::get_if<OptionShape>(&shape.kind))
    return "option<" + describeShape(*o->inner) + ">";
  std::string text = shapeKindName(shape.tag());
  if (!shape.typeName().empty())
    text += " " + shape.typeName();
  return text;
}

std::optional<FieldRole> roleForReservedName(llvm::StringRef fieldName) {
  if (!fieldName.consume_front("$kaydle::"))
    return std::nullopt;
  if (fieldName == "properties")
    return FieldRole::Properties;
  if (fieldName == "arguments")
    return FieldRole::Arguments;
  if (fieldName == "children")
    return FieldRole::Children;
  if (fieldName == "annotation")
    return FieldRole::Annotation;
  if (fieldName == "name")
    return FieldRole::Name;
  if (fieldName == "transparent")
    return FieldRole::Transparent;
  return std::nullopt;
}

// ── Construction ────────────────────────────────────────────────────────────

static ShapePtr make(Shape shape) {
  return std::make_shared<const Shape>(std::move(shape));
}

static void requireShape(const ShapePtr &shape, const char *what) {
  if (!shape)
    fail(ErrorKind::InvalidSchema, std::string(what) + " requires an inner shape");
}

ShapePtr anyShape() {
  static const ShapePtr shape = make(Shape{AnyShape{}});
  return shape;
}

ShapePtr ignoredShape() {
  static const ShapePtr shape = make(Shape{IgnoredShape{}});
  return shape;
}

ShapePtr primitiveShape(PrimitiveKind kind) {
  return make(Shape{PrimitiveShape{kind}});
}

ShapePtr unitShape() {
  static const ShapePtr shape = make(Shape{UnitShape{}});
  return shape;
}

ShapePtr unitStructShape(std::string name) {
  return make(Shape{UnitStructShape{std::move(name)}});
}

ShapePtr newtypeStructShape(std::string name, ShapePtr inner) {
  requireShape(inner, "newtype struct");
  return make(Shape{NewtypeStructShape{std::move(name), std::move(inner)}});
}

ShapePtr optionShape(ShapePtr inner) {
  requireShape(inner, "option");
  return make(Shape{OptionShape{std::move(inner)}});
}

ShapePtr seqShape(ShapePtr element) {
  requireShape(element, "seq");
  return make(Shape{SeqShape{std::move(element)}});
}

ShapePtr tupleShape(std::vector<ShapePtr> elements) {
  for (const auto &e : elements)
    requireShape(e, "tuple element");
  return make(Shape{TupleShape{std::move(elements)}});
}

ShapePtr tupleStructShape(std::string name, std::vector<ShapePtr> elements) {
  for (const auto &e : elements)
    requireShape(e, "tuple struct element");
  return make(Shape{TupleStructShape{std::move(name), std::move(elements)}});
}

ShapePtr mapShape(ShapePtr value, MapDuplicates duplicates, ShapePtr key) {
  requireShape(value, "map");
  if (!key)
    key = primitiveShape(PrimitiveKind::String);
  auto *keyPrim = std::get_if<PrimitiveShape>(&key->kind);
  if (!keyPrim || (keyPrim->kind != PrimitiveKind::String && keyPrim->kind != PrimitiveKind::Char))
    fail(ErrorKind::InvalidSchema, "map keys must be string or char, got " + describeShape(*key));
  return make(Shape{MapShape{std::move(key), std::move(value), duplicates}});
}

ShapePtr structShape(StructShape shape) {
  shape.finalize();
  return make(Shape{std::move(shape)});
}

ShapePtr enumShape(EnumShape shape) {
  for (size_t i = 0; i < shape.variants.size(); ++i) {
    auto &v = shape.variants[i];
    for (size_t j = 0; j < i; ++j)
      if (shape.variants[j].name == v.name)
        fail(ErrorKind::InvalidSchema,
             "enum " + shape.name + ": duplicate variant `" + v.name + "`");
    if (!v.payload) {
      if (v.kind != VariantKind::Unit)
        fail(ErrorKind::InvalidSchema,
             "enum " + shape.name + ": variant `" + v.name + "` has no payload shape");
      v.payload = unitShape();
    }
    if (v.kind == VariantKind::Struct && v.payload->tag() != ShapeKind::Struct)
      fail(ErrorKind::InvalidSchema,
           "enum " + shape.name + ": struct variant `" + v.name + "` needs a struct payload");
  }
  return make(Shape{std::move(shape)});
}

// ── Builders ────────────────────────────────────────────────────────────────

StructBuilder::StructBuilder(std::string name) {
  shape_.name = std::move(name);
}

StructBuilder &StructBuilder::field(std::string name, ShapePtr shape) {
  shape_.fields.push_back(Field{std::move(name), std::move(shape), FieldRole::Plain});
  return *this;
}

StructBuilder &StructBuilder::magic(FieldRole role, std::string name, ShapePtr shape) {
  shape_.fields.push_back(Field{std::move(name), std::move(shape), role});
  return *this;
}

StructBuilder &StructBuilder::allowUnknownFields(bool allow) {
  shape_.allow_unknown_fields = allow;
  return *this;
}

ShapePtr StructBuilder::build() {
  return structShape(shape_);
}

EnumBuilder::EnumBuilder(std::string name) {
  shape_.name = std::move(name);
}

EnumBuilder &EnumBuilder::unit(std::string variant) {
  shape_.variants.push_back(VariantShape{std::move(variant), VariantKind::Unit, unitShape()});
  return *this;
}

EnumBuilder &EnumBuilder::newtype(std::string variant, ShapePtr payload) {
  shape_.variants.push_back(
      VariantShape{std::move(variant), VariantKind::Newtype, std::move(payload)});
  return *this;
}

EnumBuilder &EnumBuilder::tuple(std::string variant, std::vector<ShapePtr> elements) {
  shape_.variants.push_back(
      VariantShape{std::move(variant), VariantKind::Tuple, tupleShape(std::move(elements))});
  return *this;
}

EnumBuilder &EnumBuilder::structVariant(std::string variant, ShapePtr payload) {
  shape_.variants.push_back(
      VariantShape{std::move(variant), VariantKind::Struct, std::move(payload)});
  return *this;
}

ShapePtr EnumBuilder::build() {
  return enumShape(shape_);
}

} // namespace kaydle
