//===- resolve_anonymous_node.cpp - Nodes without their name ---------------===//
//
// An anonymous node has up to three competing sources of data: arguments,
// properties and child nodes. Each shape accepts a fixed combination of
// them; anything else is rejected rather than guessed at.
//
//   shape            arguments  properties  children
//   ───────────────  ─────────  ──────────  ────────
//   struct           magic only    ──── one of ────
//   map              never         ──── one of ────
//   seq / tuple      ──── one of ────       never
//   enum             selector, rest resolved as the variant payload
//   primitive        exactly 1  never       never
//   unit             never      never       no block at all
//
//===----------------------------------------------------------------------===//

#include "kaydle/resolver.h"

#include "resolver_helpers.h"

#include <string>
#include <vector>

namespace kaydle {

Datum Resolver::resolveAnonymousNode(const AnonymousNode &node, const Shape &shape) {
  DepthGuard guard(*this, "anonymous-node", shape, "-", node.span);

  switch (shape.tag()) {
  case ShapeKind::Any:
    fail(ErrorKind::TypeHintRequired,
         "cannot resolve a node without a type hint; request a concrete shape", node.span);
  case ShapeKind::IgnoredAny:
    return Datum{DatumUnit{}};
  case ShapeKind::Primitive:
    return resolveAnonymousPrimitive(node, shape);
  case ShapeKind::Unit:
  case ShapeKind::UnitStruct:
    return resolveAnonymousUnit(node, shape);
  case ShapeKind::NewtypeStruct: {
    const auto &nt = std::get<NewtypeStructShape>(shape.kind);
    return newtypeStruct(nt.name, resolveAnonymousNode(node, *nt.inner));
  }
  case ShapeKind::Option:
    return resolveAnonymousOption(node, std::get<OptionShape>(shape.kind));
  case ShapeKind::Seq:
  case ShapeKind::Tuple:
  case ShapeKind::TupleStruct:
    return resolveAnonymousSequence(node, shape);
  case ShapeKind::Map:
    return resolveAnonymousMap(node, std::get<MapShape>(shape.kind));
  case ShapeKind::Struct:
    return resolveAnonymousStruct(node, std::get<StructShape>(shape.kind), nullptr);
  case ShapeKind::Enum:
    return resolveAnonymousEnum(node, std::get<EnumShape>(shape.kind));
  }
  fail(ErrorKind::UnsupportedShape, "unknown shape", node.span);
}

Datum Resolver::resolveAnonymousPrimitive(const AnonymousNode &node, const Shape &shape) {
  if (node.arguments.size() != 1 || !node.properties.empty() || node.hasChildNodes())
    fail(ErrorKind::ArityMismatch,
         describeShape(shape) + " needs exactly one argument and nothing else; node has " +
             std::to_string(node.arguments.size()) + " argument(s), " +
             std::to_string(node.properties.size()) + " propert(ies) and " +
             std::to_string(node.children ? node.children->size() : 0) + " child node(s)",
         node.span);
  return resolveValue(node.arguments.front(), shape);
}

Datum Resolver::resolveAnonymousUnit(const AnonymousNode &node, const Shape &shape) {
  if (!node.arguments.empty() || !node.properties.empty() || node.children)
    fail(ErrorKind::UnexpectedData,
         describeShape(shape) + " takes no arguments, properties or children block", node.span);
  if (shape.tag() == ShapeKind::UnitStruct)
    return unitStruct(shape.typeName());
  return Datum{DatumUnit{}};
}

Datum Resolver::resolveAnonymousOption(const AnonymousNode &node, const OptionShape &shape) {
  bool onlyNull = node.arguments.size() == 1 && node.arguments.front().isNull();
  if ((node.arguments.empty() || onlyNull) && node.properties.empty() && !node.hasChildNodes())
    return Datum{DatumNone{}};
  return makeSome(resolveAnonymousNode(node, *shape.inner));
}

Datum Resolver::resolveAnonymousSequence(const AnonymousNode &node, const Shape &shape) {
  if (!node.properties.empty())
    fail(ErrorKind::UnexpectedProperties,
         describeShape(shape) + " cannot be built from properties", node.span);
  if (!node.arguments.empty() && node.hasChildNodes())
    fail(ErrorKind::AmbiguousNode,
         "node has both arguments and child nodes; " + describeShape(shape) +
             " can only take one of them",
         node.span);

  if (node.hasChildNodes())
    return resolveNodeListSequence(*node.children, shape, node.span);

  SequenceTarget target(shape);
  target.checkLength(node.arguments.size(), node.span);
  std::vector<Datum> values;
  values.reserve(node.arguments.size());
  for (size_t i = 0; i < node.arguments.size(); ++i)
    values.push_back(resolveValue(node.arguments[i], target.elementAt(i)));
  return target.finish(std::move(values));
}

Datum Resolver::resolveAnonymousMap(const AnonymousNode &node, const MapShape &shape) {
  if (!node.arguments.empty())
    fail(ErrorKind::UnexpectedArguments, "a map cannot be built from arguments", node.span);
  if (!node.properties.empty() && node.hasChildNodes())
    fail(ErrorKind::AmbiguousNode,
         "node has both properties and child nodes; a map can only take one of them", node.span);

  if (node.hasChildNodes())
    return resolveNodeListMap(*node.children, shape);

  DatumMap out;
  out.keep_all = shape.duplicates == MapDuplicates::KeepAll;
  for (const auto &prop : node.properties) {
    std::string key = resolveMapKey(prop.key, shape, prop.value.span);
    insertMapEntry(out, std::move(key), resolveValue(prop.value, *shape.value), shape.duplicates);
  }
  return Datum{std::move(out)};
}

Datum Resolver::resolveAnonymousEnum(const AnonymousNode &node, const EnumShape &shape) {
  if (node.arguments.empty())
    fail(ErrorKind::MissingVariantSelector,
         "enum " + shape.name + " needs its variant name as the first argument", node.span);

  const Value &selector = node.arguments.front();
  auto *name = std::get_if<std::string>(&selector.data);
  if (!name)
    fail(ErrorKind::UnknownVariant,
         "variant selector for enum " + shape.name + " must be a string, got " +
             valueKindName(selector.kind()) + " `" + selector.literal() + "`",
         selector.span);
  const VariantShape *variant = shape.findVariant(*name);
  if (!variant)
    fail(ErrorKind::UnknownVariant, "unknown variant `" + *name + "` of enum " + shape.name,
         selector.span);

  AnonymousNode rest = node;
  rest.arguments = node.arguments.drop_front(1);
  return makeVariant(shape.name, variant->name, resolveAnonymousNode(rest, *variant->payload));
}

Datum Resolver::resolveAnonymousStruct(const AnonymousNode &node, const StructShape &shape,
                                       const std::string *visibleName) {
  if (shape.hasRole(FieldRole::Transparent))
    return resolveTransparentStruct(node, shape, visibleName);

  StructAssembler out(shape, node.span);
  MagicConsumption used = extractMagics(node, shape, visibleName, out);

  if (!used.arguments && !node.arguments.empty())
    fail(ErrorKind::UnexpectedArguments,
         "struct " + shape.name + " takes no arguments; found " +
             std::to_string(node.arguments.size()),
         node.span);
  bool fromProperties = !used.properties && !node.properties.empty();
  bool fromChildren = !used.children && node.hasChildNodes();
  if (fromProperties && fromChildren)
    fail(ErrorKind::AmbiguousNode,
         "node has both properties and child nodes; struct " + shape.name +
             " can only take its fields from one of them",
         node.span);

  if (fromProperties) {
    for (const auto &prop : node.properties) {
      const Field *field = shape.plainField(prop.key);
      if (!field) {
        if (shape.allow_unknown_fields)
          continue;
        fail(ErrorKind::UnexpectedField,
             "unknown field `" + prop.key + "` in struct " + shape.name, prop.value.span);
      }
      if (out.has(*field))
        fail(ErrorKind::DuplicateField,
             "duplicate field `" + prop.key + "` in struct " + shape.name, prop.value.span);
      out.set(*field, resolveValue(prop.value, *field->shape));
    }
  }

  if (fromChildren) {
    for (const auto &child : *node.children) {
      const Field *field = shape.plainField(child.name);
      if (!field) {
        if (shape.allow_unknown_fields)
          continue;
        fail(ErrorKind::UnexpectedField,
             "unknown field `" + child.name + "` in struct " + shape.name, child.span);
      }
      if (out.has(*field))
        fail(ErrorKind::DuplicateField,
             "duplicate field `" + child.name + "` in struct " + shape.name, child.span);
      out.set(*field, resolveAnonymousNode(AnonymousNode::of(child), *field->shape));
    }
  }

  return out.finish();
}

} // namespace kaydle
