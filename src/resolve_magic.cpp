//===- resolve_magic.cpp - Struct fields bound to node sub-parts -----------===//
//
// A struct field with a non-Plain role takes a raw part of the node instead
// of a keyed entry:
//
//   Properties   all properties, as a map or struct
//   Arguments    all arguments, as a sequence
//   Children     the children block, through the node-list resolver
//   Annotation   the node's `(annotation)`
//   Name         the node's name, when it is visible
//   Transparent  everything except the name (only next to Name)
//
// Sub-parts taken here are hidden from the ordinary struct rules.
//
//===----------------------------------------------------------------------===//

#include "kaydle/resolver.h"

#include "resolver_helpers.h"

namespace kaydle {

Resolver::MagicConsumption Resolver::extractMagics(const AnonymousNode &node,
                                                   const StructShape &shape,
                                                   const std::string *visibleName,
                                                   StructAssembler &out) {
  MagicConsumption used;
  if (!shape.hasMagics())
    return used;

  if (const Field *f = shape.roleField(FieldRole::Properties)) {
    out.set(*f, resolvePropertiesField(node, *f->shape));
    used.properties = true;
  }
  if (const Field *f = shape.roleField(FieldRole::Arguments)) {
    out.set(*f, resolveArgumentsField(node, *f->shape));
    used.arguments = true;
  }
  if (const Field *f = shape.roleField(FieldRole::Children)) {
    out.set(*f, resolveChildrenField(node, *f->shape));
    used.children = true;
  }
  if (const Field *f = shape.roleField(FieldRole::Annotation))
    out.set(*f, resolveIdentifierField(node.annotation, *f, node.span));
  if (const Field *f = shape.roleField(FieldRole::Name))
    out.set(*f, resolveIdentifierField(visibleName, *f, node.span));
  return used;
}

Datum Resolver::resolvePropertiesField(const AnonymousNode &node, const Shape &shape) {
  AnonymousNode props;
  props.properties = node.properties;
  props.span = node.span;

  switch (shape.tag()) {
  case ShapeKind::Map:
  case ShapeKind::Struct:
  case ShapeKind::NewtypeStruct:
  case ShapeKind::IgnoredAny:
    return resolveAnonymousNode(props, shape);
  case ShapeKind::Option:
    if (node.properties.empty())
      return Datum{DatumNone{}};
    return makeSome(resolvePropertiesField(node, *std::get<OptionShape>(shape.kind).inner));
  default:
    fail(ErrorKind::UnsupportedShape,
         "properties field needs a map or struct, got " + describeShape(shape), node.span);
  }
}

Datum Resolver::resolveArgumentsField(const AnonymousNode &node, const Shape &shape) {
  AnonymousNode args;
  args.arguments = node.arguments;
  args.span = node.span;

  switch (shape.tag()) {
  case ShapeKind::Seq:
  case ShapeKind::Tuple:
  case ShapeKind::TupleStruct:
  case ShapeKind::NewtypeStruct:
  case ShapeKind::IgnoredAny:
    return resolveAnonymousNode(args, shape);
  case ShapeKind::Option:
    if (node.arguments.empty())
      return Datum{DatumNone{}};
    return makeSome(resolveArgumentsField(node, *std::get<OptionShape>(shape.kind).inner));
  default:
    fail(ErrorKind::UnsupportedShape,
         "arguments field needs a sequence, got " + describeShape(shape), node.span);
  }
}

Datum Resolver::resolveChildrenField(const AnonymousNode &node, const Shape &shape) {
  static const NodeList noChildren;
  const NodeList &children = node.children ? *node.children : noChildren;

  if (auto *opt = std::get_if<OptionShape>(&shape.kind)) {
    if (children.empty())
      return Datum{DatumNone{}};
    return makeSome(resolveChildrenField(node, *opt->inner));
  }
  return resolveNodeList(children, shape, node.span);
}

Datum Resolver::resolveIdentifierField(const std::string *text, const Field &field,
                                       const Span &span) {
  if (!text) {
    switch (field.shape->tag()) {
    case ShapeKind::Option:
      return Datum{DatumNone{}};
    case ShapeKind::IgnoredAny:
      return Datum{DatumUnit{}};
    default:
      fail(ErrorKind::MissingField,
           "missing field `" + field.name + "`: no " + fieldRoleName(field.role) +
               " is available here",
           span);
    }
  }
  Value value = stringValue(*text);
  value.span = span;
  return resolveValue(value, *field.shape);
}

/// A struct made of a name field and a transparent field: the name goes to
/// one, the rest of the node to the other.
Datum Resolver::resolveTransparentStruct(const AnonymousNode &node, const StructShape &shape,
                                         const std::string *visibleName) {
  const Field &nameField = *shape.roleField(FieldRole::Name);
  const Field &inner = *shape.roleField(FieldRole::Transparent);
  for (const auto &f : shape.fields)
    if (&f != &nameField && &f != &inner)
      fail(ErrorKind::UnexpectedField,
           "struct " + shape.name + ": field `" + f.name +
               "` cannot appear next to a transparent field",
           node.span);

  StructAssembler out(shape, node.span);
  out.set(nameField, resolveIdentifierField(visibleName, nameField, node.span));
  out.set(inner, resolveAnonymousNode(node, *inner.shape));
  return out.finish();
}

} // namespace kaydle
