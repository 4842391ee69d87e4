//===- test_anonymous_node.cpp - Tests for nodes resolved without a name --===//

#include "kaydle/error.h"
#include "kaydle/resolver.h"

#include "test_helpers.h"

#include <cstdio>
#include <string>

using namespace kaydle;
using namespace kaydle::test;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name)                                                                                 \
  do {                                                                                             \
    tests_run++;                                                                                   \
    printf("  test %s ... ", #name);                                                               \
  } while (0)

#define PASS()                                                                                     \
  do {                                                                                             \
    tests_passed++;                                                                                \
    printf("ok\n");                                                                                \
  } while (0)

#define FAIL(msg)                                                                                  \
  do {                                                                                             \
    printf("FAILED: %s\n", msg);                                                                   \
  } while (0)

static std::string anon(const Node &node, const Shape &shape) {
  return toString(Resolver().resolveAnonymousNode(AnonymousNode::of(node), shape));
}

// ============================================================================
// Test: primitives need exactly one argument
// ============================================================================
static void test_primitive() {
  TEST(primitive);
  auto s = i32();

  if (anon(N("-").arg(num("5")), *s) != "5") {
    FAIL("single argument should resolve");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")).arg(num("2")), *s); }) !=
      ErrorKind::ArityMismatch) {
    FAIL("two arguments should be an arity mismatch");
    return;
  }
  if (errorOf([&] { anon(N("-"), *s); }) != ErrorKind::ArityMismatch) {
    FAIL("no argument should be an arity mismatch");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")).prop("x", num("2")), *s); }) !=
      ErrorKind::ArityMismatch) {
    FAIL("a property next to the argument should be rejected");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")).child(N("x")), *s); }) !=
      ErrorKind::ArityMismatch) {
    FAIL("a child node next to the argument should be rejected");
    return;
  }
  // An empty children block carries no data.
  if (anon(N("-").arg(num("1")).block(), *s) != "1") {
    FAIL("empty block should be tolerated");
    return;
  }

  PASS();
}

// ============================================================================
// Test: unit and unit structs
// ============================================================================
static void test_unit() {
  TEST(unit);

  if (anon(N("-"), *unitShape()) != "()") {
    FAIL("bare node should be unit");
    return;
  }
  if (anon(N("-"), *unitStructShape("marker")) != "marker") {
    FAIL("bare node should be a unit struct");
    return;
  }
  if (errorOf([] { anon(N("-").block(), *unitShape()); }) != ErrorKind::UnexpectedData) {
    FAIL("even an empty block should be unexpected for unit");
    return;
  }
  if (errorOf([] { anon(N("-").arg(nullValue()), *unitShape()); }) !=
      ErrorKind::UnexpectedData) {
    FAIL("arguments should be unexpected for unit");
    return;
  }

  PASS();
}

// ============================================================================
// Test: options
// ============================================================================
static void test_option() {
  TEST(option);
  auto s = optionShape(i32());

  if (anon(N("-"), *s) != "None" || anon(N("-").arg(nullValue()), *s) != "None") {
    FAIL("empty node and lone null should be None");
    return;
  }
  if (anon(N("-").block(), *s) != "None" || anon(N("-").arg(nullValue()).block(), *s) != "None") {
    FAIL("an empty children block should not make the option present");
    return;
  }
  if (anon(N("-").arg(num("5")).block(), *s) != "Some(5)") {
    FAIL("value with an empty block should be Some");
    return;
  }
  if (anon(N("-").arg(num("7")), *s) != "Some(7)") {
    FAIL("value should be Some");
    return;
  }
  if (anon(N("-").prop("x", num("1")), *optionShape(mapShape(i32()))) != "Some({x: 1})") {
    FAIL("properties should make the option present");
    return;
  }

  PASS();
}

// ============================================================================
// Test: sequences and tuples from arguments or children
// ============================================================================
static void test_sequence() {
  TEST(sequence);
  auto s = seqShape(i32());

  if (anon(N("-").arg(num("1")).arg(num("2")).arg(num("3")), *s) != "[1, 2, 3]") {
    FAIL("arguments should become elements");
    return;
  }
  if (anon(N("-").child(N("-").arg(num("1"))).child(N("-").arg(num("2"))), *s) != "[1, 2]") {
    FAIL("children should become elements");
    return;
  }
  if (anon(N("-"), *s) != "[]" || anon(N("-").block(), *s) != "[]") {
    FAIL("empty node should be an empty sequence");
    return;
  }
  if (errorOf([&] { anon(N("-").prop("a", num("1")), *s); }) != ErrorKind::UnexpectedProperties) {
    FAIL("properties should be rejected");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")).child(N("-").arg(num("2"))), *s); }) !=
      ErrorKind::AmbiguousNode) {
    FAIL("arguments and children together should be ambiguous");
    return;
  }

  auto pair = tupleShape({i32(), string()});
  if (anon(N("-").arg(num("1")).arg(str("a")), *pair) != "[1, \"a\"]") {
    FAIL("tuple from arguments");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")), *pair); }) != ErrorKind::InvalidLength) {
    FAIL("short tuple should be an invalid length");
    return;
  }
  auto rgb = tupleStructShape("rgb", {u32(), u32(), u32()});
  if (anon(N("-").arg(num("1")).arg(num("2")).arg(num("3")), *rgb) != "rgb(1, 2, 3)") {
    FAIL("tuple struct from arguments");
    return;
  }

  PASS();
}

// ============================================================================
// Test: maps from properties or children
// ============================================================================
static void test_map() {
  TEST(map);
  auto s = mapShape(i32());

  if (anon(N("-").prop("b", num("2")).prop("a", num("1")), *s) != "{b: 2, a: 1}") {
    FAIL("properties should keep their order");
    return;
  }
  if (anon(N("-").prop("a", num("1")).prop("a", num("3")), *s) != "{a: 3}") {
    FAIL("last property should win");
    return;
  }
  auto all = mapShape(i32(), MapDuplicates::KeepAll);
  if (anon(N("-").prop("a", num("1")).prop("a", num("3")), *all) != "{a: 1, a: 3}") {
    FAIL("keep-all map should keep every entry");
    return;
  }
  if (anon(N("-").child(N("x").arg(num("1"))).child(N("y").arg(num("2"))), *s) !=
      "{x: 1, y: 2}") {
    FAIL("children should become entries keyed by name");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")), *s); }) != ErrorKind::UnexpectedArguments) {
    FAIL("arguments should be rejected");
    return;
  }
  if (errorOf([&] { anon(N("-").prop("a", num("1")).child(N("b").arg(num("2"))), *s); }) !=
      ErrorKind::AmbiguousNode) {
    FAIL("properties and children together should be ambiguous");
    return;
  }
  auto chars = mapShape(i32(), MapDuplicates::LastWins, primitiveShape(PrimitiveKind::Char));
  if (anon(N("-").prop("a", num("1")), *chars) != "{a: 1}" ||
      errorOf([&] { anon(N("-").prop("ab", num("1")), *chars); }) !=
          ErrorKind::ConversionFailed) {
    FAIL("char keys should be single characters");
    return;
  }

  PASS();
}

// ============================================================================
// Test: structs from properties or children
// ============================================================================
static void test_struct() {
  TEST(struct_fields);
  auto point = StructBuilder("point").field("x", i32()).field("y", i32()).build();

  if (anon(N("-").prop("y", num("2")).prop("x", num("1")), *point) != "point{x: 1, y: 2}") {
    FAIL("fields should come out in declaration order");
    return;
  }
  if (anon(N("-").child(N("x").arg(num("1"))).child(N("y").arg(num("2"))), *point) !=
      "point{x: 1, y: 2}") {
    FAIL("children should fill fields");
    return;
  }
  if (errorOf([&] { anon(N("-").prop("x", num("1")), *point); }) != ErrorKind::MissingField) {
    FAIL("missing field should be reported");
    return;
  }
  if (errorOf([&] { anon(N("-").prop("x", num("1")).prop("y", num("2")).prop("z", num("3")),
                         *point); }) != ErrorKind::UnexpectedField) {
    FAIL("unknown field should be reported");
    return;
  }
  if (errorOf([&] { anon(N("-").prop("x", num("1")).prop("x", num("2")).prop("y", num("3")),
                         *point); }) != ErrorKind::DuplicateField) {
    FAIL("repeated property should be a duplicate field");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(num("1")), *point); }) != ErrorKind::UnexpectedArguments) {
    FAIL("arguments should be rejected");
    return;
  }
  if (errorOf([&] { anon(N("-").prop("x", num("1")).child(N("y").arg(num("2"))), *point); }) !=
      ErrorKind::AmbiguousNode) {
    FAIL("properties and children together should be ambiguous");
    return;
  }

  auto loose = StructBuilder("loose")
                   .field("x", i32())
                   .field("label", optionShape(string()))
                   .allowUnknownFields()
                   .build();
  if (anon(N("-").prop("x", num("1")).prop("extra", str("?")), *loose) !=
      "loose{x: 1, label: None}") {
    FAIL("unknown fields should be skipped and absent options filled");
    return;
  }

  auto nested = StructBuilder("line").field("from", point).field("to", point).build();
  Node line = N("-")
                  .child(N("from").prop("x", num("0")).prop("y", num("0")))
                  .child(N("to").child(N("x").arg(num("3"))).child(N("y").arg(num("4"))));
  if (anon(line, *nested) != "line{from: point{x: 0, y: 0}, to: point{x: 3, y: 4}}") {
    FAIL("nested structs through children");
    return;
  }

  PASS();
}

// ============================================================================
// Test: enums select their variant from the first argument
// ============================================================================
static void test_enum() {
  TEST(enum_selector);
  auto square = StructBuilder("square").field("side", f64()).build();
  auto shape = EnumBuilder("shape")
                   .unit("dot")
                   .newtype("circle", f64())
                   .tuple("rect", {f64(), f64()})
                   .structVariant("square", square)
                   .build();

  if (anon(N("-").arg(str("dot")), *shape) != "shape::dot") {
    FAIL("unit variant");
    return;
  }
  if (anon(N("-").arg(str("circle")).arg(num("5")), *shape) != "shape::circle(5.0)") {
    FAIL("newtype variant");
    return;
  }
  if (anon(N("-").arg(str("rect")).arg(num("1")).arg(num("2")), *shape) !=
      "shape::rect([1.0, 2.0])") {
    FAIL("tuple variant");
    return;
  }
  if (anon(N("-").arg(str("square")).prop("side", num("2")), *shape) !=
      "shape::square(square{side: 2.0})") {
    FAIL("struct variant");
    return;
  }
  if (errorOf([&] { anon(N("-"), *shape); }) != ErrorKind::MissingVariantSelector) {
    FAIL("missing selector");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(str("hexagon")), *shape); }) != ErrorKind::UnknownVariant ||
      errorOf([&] { anon(N("-").arg(num("1")), *shape); }) != ErrorKind::UnknownVariant) {
    FAIL("unknown or non-string selector");
    return;
  }
  if (errorOf([&] { anon(N("-").arg(str("dot")).arg(num("1")), *shape); }) !=
      ErrorKind::UnexpectedData) {
    FAIL("unit variant with extra data");
    return;
  }

  PASS();
}

// ============================================================================
// Test: newtype wrappers, Any and IgnoredAny
// ============================================================================
static void test_newtype_and_any() {
  TEST(newtype_and_any);

  if (anon(N("-").arg(num("5")), *newtypeStructShape("meters", f64())) != "meters(5.0)") {
    FAIL("newtype should wrap its inner resolution");
    return;
  }
  if (errorOf([] { anon(N("-").arg(num("5")), *anyShape()); }) != ErrorKind::TypeHintRequired) {
    FAIL("Any should need a type hint");
    return;
  }
  if (anon(N("-").arg(num("5")).prop("a", str("b")).child(N("c")), *ignoredShape()) != "()") {
    FAIL("IgnoredAny should accept anything");
    return;
  }

  PASS();
}

int main() {
  printf("=== kaydle Anonymous Node Tests ===\n");

  test_primitive();
  test_unit();
  test_option();
  test_sequence();
  test_map();
  test_struct();
  test_enum();
  test_newtype_and_any();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
