//===- shape_reader.cpp - Build shapes from JSON schemas -------------------===//

#include "kaydle/shape_reader.h"

#include "kaydle/error.h"

#include "llvm/ADT/StringSwitch.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kaydle {

using json = nlohmann::json;

[[noreturn]] static void invalid(const std::string &msg) {
  fail(ErrorKind::InvalidSchema, "schema error: " + msg);
}

// ── JSON helpers ────────────────────────────────────────────────────────────

static const json &req(const json &obj, const char *key, const std::string &where) {
  auto it = obj.find(key);
  if (it == obj.end())
    invalid(where + ": missing required key \"" + key + "\"");
  return *it;
}

static std::string getString(const json &j, const std::string &where) {
  if (!j.is_string())
    invalid(where + ": expected string, got " + j.type_name());
  return j.get<std::string>();
}

static bool getOptBool(const json &obj, const char *key, const std::string &where) {
  auto it = obj.find(key);
  if (it == obj.end())
    return false;
  if (!it->is_boolean())
    invalid(where + ": \"" + key + "\" must be a bool");
  return it->get<bool>();
}

static const json &getArray(const json &j, const std::string &where) {
  if (!j.is_array())
    invalid(where + ": expected array, got " + j.type_name());
  return j;
}

// ── Shapes ──────────────────────────────────────────────────────────────────

static ShapePtr parseShape(const json &j, const std::string &where);

static std::optional<PrimitiveKind> primitiveByName(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<PrimitiveKind>>(name)
      .Case("bool", PrimitiveKind::Bool)
      .Case("i8", PrimitiveKind::I8)
      .Case("i16", PrimitiveKind::I16)
      .Case("i32", PrimitiveKind::I32)
      .Case("i64", PrimitiveKind::I64)
      .Case("u8", PrimitiveKind::U8)
      .Case("u16", PrimitiveKind::U16)
      .Case("u32", PrimitiveKind::U32)
      .Case("u64", PrimitiveKind::U64)
      .Case("f32", PrimitiveKind::F32)
      .Case("f64", PrimitiveKind::F64)
      .Case("char", PrimitiveKind::Char)
      .Case("string", PrimitiveKind::String)
      .Default(std::nullopt);
}

static ShapePtr parseShorthand(const std::string &name, const std::string &where) {
  if (name == "any")
    return anyShape();
  if (name == "ignored")
    return ignoredShape();
  if (name == "unit")
    return unitShape();
  if (auto prim = primitiveByName(name))
    return primitiveShape(*prim);
  invalid(where + ": unknown shape \"" + name + "\"");
}

static std::vector<ShapePtr> parseElements(const json &obj, const std::string &where) {
  std::vector<ShapePtr> elements;
  const json &arr = getArray(req(obj, "elements", where), where + ".elements");
  for (size_t i = 0; i < arr.size(); ++i)
    elements.push_back(parseShape(arr[i], where + ".elements[" + std::to_string(i) + "]"));
  return elements;
}

static FieldRole parseRole(const json &j, const std::string &where) {
  std::string name = getString(j, where);
  auto role = llvm::StringSwitch<std::optional<FieldRole>>(name)
                  .Case("plain", FieldRole::Plain)
                  .Case("properties", FieldRole::Properties)
                  .Case("arguments", FieldRole::Arguments)
                  .Case("children", FieldRole::Children)
                  .Case("annotation", FieldRole::Annotation)
                  .Case("name", FieldRole::Name)
                  .Case("transparent", FieldRole::Transparent)
                  .Default(std::nullopt);
  if (!role)
    invalid(where + ": unknown field role \"" + name + "\"");
  return *role;
}

static ShapePtr parseStruct(const json &obj, std::string name, const std::string &where) {
  StructShape shape;
  shape.name = std::move(name);
  shape.allow_unknown_fields = getOptBool(obj, "allow_unknown_fields", where);

  const json &fields = getArray(req(obj, "fields", where), where + ".fields");
  for (size_t i = 0; i < fields.size(); ++i) {
    std::string fieldWhere = where + ".fields[" + std::to_string(i) + "]";
    const json &f = fields[i];
    if (!f.is_object())
      invalid(fieldWhere + ": expected object, got " + f.type_name());

    Field field;
    field.name = getString(req(f, "name", fieldWhere), fieldWhere + ".name");
    field.shape = parseShape(req(f, "shape", fieldWhere), fieldWhere + ".shape");
    if (auto it = f.find("role"); it != f.end())
      field.role = parseRole(*it, fieldWhere + ".role");
    else if (auto reserved = roleForReservedName(field.name))
      field.role = *reserved;
    shape.fields.push_back(std::move(field));
  }
  return structShape(std::move(shape));
}

static ShapePtr parseEnum(const json &obj, const std::string &where) {
  EnumShape shape;
  shape.name = getString(req(obj, "name", where), where + ".name");

  const json &variants = getArray(req(obj, "variants", where), where + ".variants");
  for (size_t i = 0; i < variants.size(); ++i) {
    std::string variantWhere = where + ".variants[" + std::to_string(i) + "]";
    const json &v = variants[i];
    if (!v.is_object())
      invalid(variantWhere + ": expected object, got " + v.type_name());

    VariantShape variant;
    variant.name = getString(req(v, "name", variantWhere), variantWhere + ".name");
    std::string kind = getString(req(v, "kind", variantWhere), variantWhere + ".kind");
    if (kind == "unit") {
      variant.kind = VariantKind::Unit;
      variant.payload = unitShape();
    } else if (kind == "newtype") {
      variant.kind = VariantKind::Newtype;
      variant.payload = parseShape(req(v, "inner", variantWhere), variantWhere + ".inner");
    } else if (kind == "tuple") {
      variant.kind = VariantKind::Tuple;
      variant.payload = tupleShape(parseElements(v, variantWhere));
    } else if (kind == "struct") {
      variant.kind = VariantKind::Struct;
      variant.payload = parseStruct(v, variant.name, variantWhere);
    } else {
      invalid(variantWhere + ": unknown variant kind \"" + kind + "\"");
    }
    shape.variants.push_back(std::move(variant));
  }
  return enumShape(std::move(shape));
}

static ShapePtr parseShape(const json &j, const std::string &where) {
  if (j.is_string())
    return parseShorthand(j.get<std::string>(), where);
  if (!j.is_object())
    invalid(where + ": expected shape name or object, got " + j.type_name());

  std::string kind = getString(req(j, "kind", where), where + ".kind");
  if (kind == "option")
    return optionShape(parseShape(req(j, "inner", where), where + ".inner"));
  if (kind == "seq")
    return seqShape(parseShape(req(j, "element", where), where + ".element"));
  if (kind == "tuple")
    return tupleShape(parseElements(j, where));
  if (kind == "map") {
    MapDuplicates duplicates = MapDuplicates::LastWins;
    if (auto it = j.find("duplicates"); it != j.end()) {
      std::string policy = getString(*it, where + ".duplicates");
      if (policy == "keep_all")
        duplicates = MapDuplicates::KeepAll;
      else if (policy != "last_wins")
        invalid(where + ".duplicates: expected \"last_wins\" or \"keep_all\", got \"" + policy +
                "\"");
    }
    ShapePtr key;
    if (auto it = j.find("key"); it != j.end())
      key = parseShape(*it, where + ".key");
    return mapShape(parseShape(req(j, "value", where), where + ".value"), duplicates,
                    std::move(key));
  }
  if (kind == "struct")
    return parseStruct(j, getString(req(j, "name", where), where + ".name"), where);
  if (kind == "newtype")
    return newtypeStructShape(getString(req(j, "name", where), where + ".name"),
                              parseShape(req(j, "inner", where), where + ".inner"));
  if (kind == "unit_struct")
    return unitStructShape(getString(req(j, "name", where), where + ".name"));
  if (kind == "tuple_struct")
    return tupleStructShape(getString(req(j, "name", where), where + ".name"),
                            parseElements(j, where));
  if (kind == "enum")
    return parseEnum(j, where);
  invalid(where + ": unknown shape kind \"" + kind + "\"");
}

// ── Public API ──────────────────────────────────────────────────────────────

ShapePtr parseShapeJson(const json &j) {
  return parseShape(j, "$");
}

ShapePtr parseShapeText(std::string_view text) {
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error &e) {
    invalid(std::string("invalid JSON: ") + e.what());
  }
  return parseShapeJson(j);
}

} // namespace kaydle
