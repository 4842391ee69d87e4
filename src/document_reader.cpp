//===- document_reader.cpp - Decode node documents from msgpack/JSON -------===//

#include "kaydle/document_reader.h"

#include "kaydle/error.h"
#include "kaydle/number.h"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace kaydle {

/// Deepest children nesting a document may have.
static constexpr unsigned kMaxNodeDepth = 256;
/// Container nesting bound for the msgpack and JSON decoders. A node level
/// costs two containers (the node map and its children array).
static constexpr unsigned kMaxContainerDepth = 2 * kMaxNodeDepth + 8;

// ── Error helper ────────────────────────────────────────────────────────────

[[noreturn]] static void malformed(const std::string &msg) {
  fail(ErrorKind::MalformedDocument, "document decode error: " + msg);
}

// ── msgpack object helpers ──────────────────────────────────────────────────

static std::string typeName(const msgpack::object &obj) {
  switch (obj.type) {
  case msgpack::type::NIL:
    return "nil";
  case msgpack::type::BOOLEAN:
    return "bool";
  case msgpack::type::POSITIVE_INTEGER:
  case msgpack::type::NEGATIVE_INTEGER:
    return "integer";
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64:
    return "float";
  case msgpack::type::STR:
    return "string";
  case msgpack::type::BIN:
    return "binary";
  case msgpack::type::ARRAY:
    return "array";
  case msgpack::type::MAP:
    return "map";
  case msgpack::type::EXT:
    return "ext";
  }
  return "type " + std::to_string(obj.type);
}

static std::string getString(const msgpack::object &obj) {
  if (obj.type != msgpack::type::STR)
    malformed("expected string, got " + typeName(obj));
  return std::string(obj.via.str.ptr, obj.via.str.size);
}

static uint64_t getUint(const msgpack::object &obj) {
  if (obj.type == msgpack::type::POSITIVE_INTEGER)
    return obj.via.u64;
  malformed("expected unsigned integer, got " + typeName(obj));
}

static bool isNil(const msgpack::object &obj) {
  return obj.type == msgpack::type::NIL;
}

/// Find a key in a msgpack map. Returns nullptr if not found.
static const msgpack::object *mapGet(const msgpack::object &obj, std::string_view key) {
  if (obj.type != msgpack::type::MAP)
    malformed("expected map, got " + typeName(obj));
  for (uint32_t i = 0; i < obj.via.map.size; ++i) {
    const auto &kv = obj.via.map.ptr[i];
    if (kv.key.type == msgpack::type::STR &&
        std::string_view(kv.key.via.str.ptr, kv.key.via.str.size) == key)
      return &kv.val;
  }
  return nullptr;
}

static const msgpack::object &mapReq(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  if (!v)
    malformed("missing required key: " + std::string(key));
  return *v;
}

static const msgpack::object *arrayData(const msgpack::object &obj, uint32_t &size) {
  if (obj.type != msgpack::type::ARRAY)
    malformed("expected array, got " + typeName(obj));
  size = obj.via.array.size;
  return obj.via.array.ptr;
}

template <typename T, typename ParseFn>
static std::vector<T> parseVec(const msgpack::object &obj, ParseFn parseFn) {
  uint32_t size;
  const auto *arr = arrayData(obj, size);
  std::vector<T> result;
  result.reserve(size);
  for (uint32_t i = 0; i < size; ++i)
    result.push_back(parseFn(arr[i]));
  return result;
}

// ── Span ────────────────────────────────────────────────────────────────────

static Span parseSpan(const msgpack::object &obj) {
  return {getUint(mapReq(obj, "start")), getUint(mapReq(obj, "end"))};
}

static Span parseOptSpan(const msgpack::object &obj) {
  const auto *span = mapGet(obj, "span");
  if (!span || isNil(*span))
    return {};
  return parseSpan(*span);
}

static std::optional<std::string> parseOptAnnotation(const msgpack::object &obj) {
  const auto *ann = mapGet(obj, "annotation");
  if (!ann || isNil(*ann))
    return std::nullopt;
  return getString(*ann);
}

// ── Values ──────────────────────────────────────────────────────────────────

static Value parseScalar(const msgpack::object &obj) {
  switch (obj.type) {
  case msgpack::type::NIL:
    return nullValue();
  case msgpack::type::BOOLEAN:
    return boolValue(obj.via.boolean);
  case msgpack::type::POSITIVE_INTEGER:
    return numberValue(std::to_string(obj.via.u64));
  case msgpack::type::NEGATIVE_INTEGER:
    return numberValue(std::to_string(obj.via.i64));
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64:
    return numberValue(floatLiteral(obj.via.f64));
  case msgpack::type::STR:
    return stringValue(getString(obj));
  default:
    malformed("expected a scalar value, got " + typeName(obj));
  }
}

static Value parseValue(const msgpack::object &obj) {
  if (obj.type != msgpack::type::MAP)
    return parseScalar(obj);

  // Wrapped form: {"value": scalar} or {"number": "literal"}, plus extras.
  Value value;
  if (const auto *number = mapGet(obj, "number"))
    value = numberValue(getString(*number));
  else if (const auto *inner = mapGet(obj, "value"))
    value = parseScalar(*inner);
  else
    malformed("value map needs a \"value\" or \"number\" key");
  value.annotation = parseOptAnnotation(obj);
  value.span = parseOptSpan(obj);
  return value;
}

// ── Nodes ───────────────────────────────────────────────────────────────────

static Property parseProperty(const msgpack::object &obj) {
  return {getString(mapReq(obj, "key")), parseValue(mapReq(obj, "value"))};
}

static std::vector<Property> parseProperties(const msgpack::object &obj) {
  if (obj.type == msgpack::type::ARRAY)
    return parseVec<Property>(obj, parseProperty);
  if (obj.type != msgpack::type::MAP)
    malformed("properties must be an array or a map, got " + typeName(obj));
  std::vector<Property> props;
  props.reserve(obj.via.map.size);
  for (uint32_t i = 0; i < obj.via.map.size; ++i) {
    const auto &kv = obj.via.map.ptr[i];
    props.push_back({getString(kv.key), parseValue(kv.val)});
  }
  return props;
}

static Node parseNode(const msgpack::object &obj, unsigned depth) {
  if (depth > kMaxNodeDepth)
    malformed("children nest deeper than " + std::to_string(kMaxNodeDepth) + " levels");
  Node node;
  node.name = getString(mapReq(obj, "name"));
  node.annotation = parseOptAnnotation(obj);
  if (const auto *args = mapGet(obj, "arguments"); args && !isNil(*args))
    node.arguments = parseVec<Value>(*args, parseValue);
  if (const auto *props = mapGet(obj, "properties"); props && !isNil(*props))
    node.properties = parseProperties(*props);
  if (const auto *children = mapGet(obj, "children"); children && !isNil(*children))
    node.children = parseVec<Node>(
        *children, [depth](const msgpack::object &child) { return parseNode(child, depth + 1); });
  node.span = parseOptSpan(obj);
  return node;
}

static NodeList parseDocument(const msgpack::object &obj) {
  auto topLevel = [](const msgpack::object &node) { return parseNode(node, 1); };
  if (obj.type == msgpack::type::MAP)
    return parseVec<Node>(mapReq(obj, "nodes"), topLevel);
  return parseVec<Node>(obj, topLevel);
}

// ── Public API ──────────────────────────────────────────────────────────────

NodeList parseMsgpackDocument(const uint8_t *data, size_t size) {
  msgpack::object_handle oh;
  try {
    msgpack::unpack_limit limit(0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff,
                                kMaxContainerDepth);
    oh = msgpack::unpack(reinterpret_cast<const char *>(data), size, nullptr, nullptr, limit);
  } catch (const msgpack::unpack_error &e) {
    malformed(std::string("invalid msgpack: ") + e.what());
  }
  return parseDocument(oh.get());
}

NodeList parseJsonDocument(const uint8_t *data, size_t size) {
  // Parse JSON, convert to msgpack bytes, then reuse the msgpack decoder.
  // ordered_json keeps property maps in document order.
  nlohmann::ordered_json j;
  try {
    j = nlohmann::ordered_json::parse(
        data, data + size,
        [](int depth, nlohmann::ordered_json::parse_event_t, nlohmann::ordered_json &) {
          if (depth > static_cast<int>(kMaxContainerDepth))
            malformed("JSON nests deeper than " + std::to_string(kMaxContainerDepth) + " levels");
          return true;
        });
  } catch (const nlohmann::json::parse_error &e) {
    malformed(std::string("invalid JSON: ") + e.what());
  }
  auto msgpackBytes = nlohmann::ordered_json::to_msgpack(j);
  return parseMsgpackDocument(msgpackBytes.data(), msgpackBytes.size());
}

} // namespace kaydle
