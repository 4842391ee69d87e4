//===- shape_reader.h - Build shapes from JSON schemas ----------*- C++ -*-===//
//
// Lets tools describe the target data model without C++ code.
//
//   "i32", "string", "char", "bool", "f64", ...   primitives
//   "any", "ignored", "unit"                      special shapes
//   {"kind": "option", "inner": S}
//   {"kind": "seq", "element": S}
//   {"kind": "tuple", "elements": [S, ...]}
//   {"kind": "map", "value": S, "key"?: "string"|"char",
//    "duplicates"?: "last_wins"|"keep_all"}
//   {"kind": "struct", "name": N, "allow_unknown_fields"?: bool,
//    "fields": [{"name": F, "shape": S, "role"?: R}, ...]}
//   {"kind": "newtype", "name": N, "inner": S}
//   {"kind": "unit_struct", "name": N}
//   {"kind": "tuple_struct", "name": N, "elements": [S, ...]}
//   {"kind": "enum", "name": N, "variants": [V, ...]}
//
// A variant is {"name": N, "kind": "unit"} or adds "inner" (newtype),
// "elements" (tuple) or "fields" (struct). A field role R is one of
// "properties", "arguments", "children", "annotation", "name",
// "transparent"; a field named `$kaydle::<role>` gets that role implicitly.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "kaydle/shape.h"

#include <nlohmann/json.hpp>

#include <string_view>

namespace kaydle {

/// Throws kaydle::Error (InvalidSchema) on malformed descriptions.
ShapePtr parseShapeJson(const nlohmann::json &j);

/// Parse JSON text, then parseShapeJson.
ShapePtr parseShapeText(std::string_view text);

} // namespace kaydle
