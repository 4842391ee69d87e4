//===- document.cpp - Node-document helpers --------------------------------===//

#include "kaydle/document.h"

namespace kaydle {

const char *valueKindName(ValueKind kind) {
  switch (kind) {
  case ValueKind::Null:
    return "null";
  case ValueKind::Bool:
    return "bool";
  case ValueKind::Number:
    return "number";
  case ValueKind::String:
    return "string";
  }
  return "value";
}

std::string Value::literal() const {
  if (std::holds_alternative<Null>(data))
    return "null";
  if (auto *b = std::get_if<bool>(&data))
    return *b ? "true" : "false";
  if (auto *n = std::get_if<Number>(&data))
    return n->literal;
  return std::get<std::string>(data);
}

} // namespace kaydle
