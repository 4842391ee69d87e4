//===- resolve_named_node.cpp - Nodes with a visible name ------------------===//
//
// Inside a sequence every node keeps its name, and the name has to mean
// something to the requested shape: an enum variant, the declared type
// name, a struct's name field, or the `-` placeholder for unnamed targets.
//
//===----------------------------------------------------------------------===//

#include "kaydle/resolver.h"

#include "resolver_helpers.h"

namespace kaydle {

void Resolver::checkTypeName(const Node &node, const Shape &shape) {
  if (node.name != shape.typeName())
    fail(ErrorKind::NodeNameMismatch,
         "expected node `" + shape.typeName() + "` for " + describeShape(shape) + ", found `" +
             node.name + "`",
         node.span);
}

Datum Resolver::resolveNamedNode(const Node &node, const Shape &shape) {
  DepthGuard guard(*this, "named-node", shape, node.name, node.span);
  AnonymousNode view = AnonymousNode::of(node);

  switch (shape.tag()) {
  case ShapeKind::Any:
    fail(ErrorKind::TypeHintRequired,
         "cannot resolve node `" + node.name + "` without a type hint", node.span);
  case ShapeKind::IgnoredAny:
    return Datum{DatumUnit{}};

  case ShapeKind::Enum: {
    const auto &en = std::get<EnumShape>(shape.kind);
    const VariantShape *variant = en.findVariant(node.name);
    if (!variant)
      fail(ErrorKind::UnknownVariant, "unknown variant `" + node.name + "` of enum " + en.name,
           node.span);
    return makeVariant(en.name, variant->name, resolveAnonymousNode(view, *variant->payload));
  }

  case ShapeKind::Struct: {
    const auto &st = std::get<StructShape>(shape.kind);
    // A name field takes the node name in place of the type-name check.
    if (st.hasRole(FieldRole::Name))
      return resolveAnonymousStruct(view, st, &node.name);
    checkTypeName(node, shape);
    return resolveAnonymousStruct(view, st, nullptr);
  }

  case ShapeKind::UnitStruct:
  case ShapeKind::NewtypeStruct:
  case ShapeKind::TupleStruct:
    checkTypeName(node, shape);
    return resolveAnonymousNode(view, shape);

  default:
    if (node.name != "-")
      fail(ErrorKind::AnonymousNodeNameMismatch,
           "node `" + node.name + "` resolves to an unnamed " + describeShape(shape) +
               "; name it `-`",
           node.span);
    return resolveAnonymousNode(view, shape);
  }
}

} // namespace kaydle
