//===- resolver.cpp - Resolver setup and entry points ----------------------===//

#include "kaydle/resolver.h"

#include "resolver_helpers.h"

#include <utility>

namespace kaydle {

AnonymousNode AnonymousNode::of(const Node &node) {
  AnonymousNode view;
  view.annotation = node.annotation ? &*node.annotation : nullptr;
  view.arguments = node.arguments;
  view.properties = node.properties;
  view.children = node.children ? &*node.children : nullptr;
  view.span = node.span;
  return view;
}

Resolver::Resolver(ResolveOptions options) : options(std::move(options)) {
  if (!this->options.number_policy)
    this->options.number_policy = classifyNumber;
}

Resolver::DepthGuard::DepthGuard(Resolver &resolver, llvm::StringRef component,
                                 const Shape &shape, llvm::StringRef subject, const Span &span)
    : resolver(resolver) {
  if (resolver.depth >= resolver.options.max_depth)
    fail(ErrorKind::RecursionLimit,
         "nesting exceeds the limit of " + std::to_string(resolver.options.max_depth) +
             " while resolving " + describeShape(shape),
         span);
  // Depth is committed only after the trace hook returns.
  if (resolver.options.trace)
    resolver.options.trace(component, shape, subject, resolver.depth + 1);
  ++resolver.depth;
}

Resolver::DepthGuard::~DepthGuard() {
  --resolver.depth;
}

std::string Resolver::resolveMapKey(const std::string &key, const MapShape &shape,
                                    const Span &span) {
  auto *prim = std::get_if<PrimitiveShape>(&shape.key->kind);
  if (prim && prim->kind == PrimitiveKind::Char && !isSingleCodepoint(key))
    fail(ErrorKind::ConversionFailed, "map key `" + key + "` is not a single character", span);
  return key;
}

// ── Convenience wrappers ────────────────────────────────────────────────────

Datum resolveDocument(const NodeList &nodes, const Shape &shape, const ResolveOptions &options) {
  return Resolver(options).resolveNodeList(nodes, shape);
}

Datum resolveNode(const Node &node, const Shape &shape, const ResolveOptions &options) {
  return Resolver(options).resolveNamedNode(node, shape);
}

Datum resolveValue(const Value &value, const Shape &shape, const ResolveOptions &options) {
  return Resolver(options).resolveValue(value, shape);
}

} // namespace kaydle
