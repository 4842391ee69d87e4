//===- resolver.h - Node-document to shape resolution -----------*- C++ -*-===//
//
// Declares the Resolver, the decision engine that maps a node document onto
// a requested Shape. It is a recursive descent over four views:
//
//   node list  ──► named node ──► anonymous node ──► value
//        ▲                              │
//        └──────── children ────────────┘
//
// Implementation is split by view: resolve_node_list.cpp,
// resolve_named_node.cpp, resolve_anonymous_node.cpp, resolve_magic.cpp and
// resolve_value.cpp.
//
//===----------------------------------------------------------------------===//

#ifndef KAYDLE_RESOLVER_H
#define KAYDLE_RESOLVER_H

#include "kaydle/datum.h"
#include "kaydle/document.h"
#include "kaydle/number.h"
#include "kaydle/shape.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <functional>
#include <string>

namespace kaydle {

/// Called once per resolution step when set: component ("node-list",
/// "named-node", "anonymous-node", "value"), requested shape, and the node
/// name or value literal being resolved.
using TraceFn = std::function<void(llvm::StringRef component, const Shape &shape,
                                   llvm::StringRef subject, unsigned depth)>;

struct ResolveOptions {
  /// Nesting limit across node lists, nodes and values.
  size_t max_depth = 256;
  /// Numeric literal classification; see number.h.
  NumberPolicy number_policy = classifyNumber;
  TraceFn trace;
};

/// A node seen without its name: the name was consumed as a map key or an
/// enum variant selector, or the node is `-`. Borrows from the node.
struct AnonymousNode {
  const std::string *annotation = nullptr;
  llvm::ArrayRef<Value> arguments;
  llvm::ArrayRef<Property> properties;
  const NodeList *children = nullptr; // nullptr: no children block
  Span span;

  static AnonymousNode of(const Node &node);

  bool hasChildNodes() const { return children && !children->empty(); }
};

class Resolver {
public:
  explicit Resolver(ResolveOptions options = {});

  /// Entry point for documents and children blocks (map or sequence shapes).
  Datum resolveNodeList(const NodeList &nodes, const Shape &shape, const Span &span = {});

  /// A node with its name visible: enum variant selection, type-name
  /// matching, the name magic, and the `-` placeholder.
  Datum resolveNamedNode(const Node &node, const Shape &shape);

  /// A node without its name; applies the magic extractor and the ambiguity
  /// rules for the requested shape.
  Datum resolveAnonymousNode(const AnonymousNode &node, const Shape &shape);

  /// A single scalar.
  Datum resolveValue(const Value &value, const Shape &shape);

private:
  class DepthGuard {
  public:
    DepthGuard(Resolver &resolver, llvm::StringRef component, const Shape &shape,
               llvm::StringRef subject, const Span &span);
    ~DepthGuard();
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

  private:
    Resolver &resolver;
  };

  /// Which node sub-parts a magic field has already taken.
  struct MagicConsumption {
    bool arguments = false;
    bool properties = false;
    bool children = false;
  };

  class StructAssembler;

  // ── Node list ────────────────────────────────────────────────────
  Datum resolveNodeListSequence(const NodeList &nodes, const Shape &shape, const Span &span);
  Datum resolveNodeListMap(const NodeList &nodes, const MapShape &shape);

  // ── Named node ───────────────────────────────────────────────────
  void checkTypeName(const Node &node, const Shape &shape);

  // ── Anonymous node ───────────────────────────────────────────────
  Datum resolveAnonymousStruct(const AnonymousNode &node, const StructShape &shape,
                               const std::string *visibleName);
  Datum resolveTransparentStruct(const AnonymousNode &node, const StructShape &shape,
                                 const std::string *visibleName);
  Datum resolveAnonymousMap(const AnonymousNode &node, const MapShape &shape);
  Datum resolveAnonymousSequence(const AnonymousNode &node, const Shape &shape);
  Datum resolveAnonymousEnum(const AnonymousNode &node, const EnumShape &shape);
  Datum resolveAnonymousOption(const AnonymousNode &node, const OptionShape &shape);
  Datum resolveAnonymousPrimitive(const AnonymousNode &node, const Shape &shape);
  Datum resolveAnonymousUnit(const AnonymousNode &node, const Shape &shape);

  // ── Magics ───────────────────────────────────────────────────────
  MagicConsumption extractMagics(const AnonymousNode &node, const StructShape &shape,
                                 const std::string *visibleName, StructAssembler &out);
  Datum resolvePropertiesField(const AnonymousNode &node, const Shape &shape);
  Datum resolveArgumentsField(const AnonymousNode &node, const Shape &shape);
  Datum resolveChildrenField(const AnonymousNode &node, const Shape &shape);
  /// Annotation and name fields: a string that may be absent.
  Datum resolveIdentifierField(const std::string *text, const Field &field, const Span &span);

  // ── Values ───────────────────────────────────────────────────────
  Datum resolveAnnotatedStruct(const Value &value, const StructShape &shape);
  Datum resolveValueEnum(const Value &value, const EnumShape &shape);
  Datum resolveValueByKind(const Value &value, const Shape &shape);
  Datum convertPrimitive(const Value &value, PrimitiveKind kind);
  Datum convertNumber(const Value &value, PrimitiveKind kind);
  /// Run the number policy on a Number value, attaching the value's span to
  /// policy errors.
  NumberRepr classify(const Value &value);

  // ── Shared ───────────────────────────────────────────────────────
  /// Key of a map entry (property key or child node name) as the map's key
  /// shape wants it.
  std::string resolveMapKey(const std::string &key, const MapShape &shape, const Span &span);

  ResolveOptions options;
  unsigned depth = 0;
};

/// Convenience wrappers around a fresh Resolver.
Datum resolveDocument(const NodeList &nodes, const Shape &shape,
                      const ResolveOptions &options = {});
Datum resolveNode(const Node &node, const Shape &shape, const ResolveOptions &options = {});
Datum resolveValue(const Value &value, const Shape &shape, const ResolveOptions &options = {});

} // namespace kaydle

#endif // KAYDLE_RESOLVER_H
