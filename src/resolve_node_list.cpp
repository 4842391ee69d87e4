//===- resolve_node_list.cpp - Documents and children blocks ---------------===//

#include "kaydle/resolver.h"

#include "resolver_helpers.h"

#include <string>
#include <vector>

namespace kaydle {

Datum Resolver::resolveNodeList(const NodeList &nodes, const Shape &shape, const Span &span) {
  DepthGuard guard(*this, "node-list", shape, std::to_string(nodes.size()) + " node(s)", span);

  switch (shape.tag()) {
  case ShapeKind::IgnoredAny:
    return Datum{DatumUnit{}};
  case ShapeKind::Any:
    fail(ErrorKind::TypeHintRequired, "cannot resolve a node list without a type hint", span);
  case ShapeKind::Seq:
  case ShapeKind::Tuple:
  case ShapeKind::TupleStruct:
    return resolveNodeListSequence(nodes, shape, span);
  case ShapeKind::Map:
    return resolveNodeListMap(nodes, std::get<MapShape>(shape.kind));
  case ShapeKind::Struct: {
    // The list acts as the children block of a node with nothing else.
    AnonymousNode holder;
    holder.children = &nodes;
    holder.span = span;
    return resolveAnonymousStruct(holder, std::get<StructShape>(shape.kind), nullptr);
  }
  default:
    fail(ErrorKind::UnsupportedShape,
         "a node list cannot be resolved as " + describeShape(shape), span);
  }
}

Datum Resolver::resolveNodeListSequence(const NodeList &nodes, const Shape &shape,
                                        const Span &span) {
  SequenceTarget target(shape);
  target.checkLength(nodes.size(), span);
  std::vector<Datum> values;
  values.reserve(nodes.size());
  for (size_t i = 0; i < nodes.size(); ++i)
    values.push_back(resolveNamedNode(nodes[i], target.elementAt(i)));
  return target.finish(std::move(values));
}

Datum Resolver::resolveNodeListMap(const NodeList &nodes, const MapShape &shape) {
  DatumMap out;
  out.keep_all = shape.duplicates == MapDuplicates::KeepAll;
  for (const auto &node : nodes) {
    std::string key = resolveMapKey(node.name, shape, node.span);
    insertMapEntry(out, std::move(key), resolveAnonymousNode(AnonymousNode::of(node), *shape.value),
                   shape.duplicates);
  }
  return Datum{std::move(out)};
}

} // namespace kaydle
