//===- document_reader.h - Decode node documents from msgpack/JSON -------===//
//
// Reads a node document encoded as msgpack (or JSON, for hand-written
// inputs) into the in-memory model of document.h.
//
// Encoding:
//
//   document   := [node, ...] | {"nodes": [node, ...]}
//   node       := {"name": str, "annotation"?: str, "arguments"?: [value],
//                  "properties"?: [{"key": str, "value": value}] | {str: value},
//                  "children"?: [node] | nil, "span"?: {"start": N, "end": N}}
//   value      := nil | bool | int | float | str
//               | {"value": scalar, "annotation"?: str, "span"?: span}
//               | {"number": "0x1F", "annotation"?: str, "span"?: span}
//
// A missing or nil "children" means the node has no children block; an
// empty array is an empty block.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "kaydle/document.h"

#include <cstddef>
#include <cstdint>

namespace kaydle {

/// Parse a msgpack-encoded node document.
///
/// Throws kaydle::Error (MalformedDocument) on decode failures.
NodeList parseMsgpackDocument(const uint8_t *data, size_t size);

/// Parse a JSON-encoded node document.
///
/// The JSON is converted to msgpack bytes (keeping object key order) and fed
/// through parseMsgpackDocument, so both inputs share one decoder.
///
/// Throws kaydle::Error (MalformedDocument) on parse failures.
NodeList parseJsonDocument(const uint8_t *data, size_t size);

} // namespace kaydle
