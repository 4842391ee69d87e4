//===- test_named_node.cpp - Tests for nodes resolved with their name -----===//

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

static std::string named(const Node &node, const Shape &shape) {
  return toString(resolveNode(node, shape));
}

static ShapePtr point() {
  return StructBuilder("point").field("x", i32()).field("y", i32()).build();
}

// ============================================================================
// Test: the node name selects an enum variant
// ============================================================================
static void test_enum_by_name() {
  TEST(enum_by_name);
  auto shape = EnumBuilder("shape")
                   .unit("dot")
                   .newtype("circle", f64())
                   .tuple("rect", {f64(), f64()})
                   .structVariant("square", StructBuilder("square").field("side", f64()).build())
                   .build();

  if (named(N("dot"), *shape) != "shape::dot") {
    FAIL("unit variant");
    return;
  }
  if (named(N("circle").arg(num("5")), *shape) != "shape::circle(5.0)") {
    FAIL("newtype variant");
    return;
  }
  if (named(N("rect").arg(num("1")).arg(num("2.5")), *shape) != "shape::rect([1.0, 2.5])") {
    FAIL("tuple variant");
    return;
  }
  if (named(N("square").child(N("side").arg(num("3"))), *shape) !=
      "shape::square(square{side: 3.0})") {
    FAIL("struct variant from children");
    return;
  }
  if (errorOf([&] { named(N("hexagon"), *shape); }) != ErrorKind::UnknownVariant) {
    FAIL("unknown node name should be an unknown variant");
    return;
  }

  auto tupled = EnumBuilder("shape").tuple("circle", {f64()}).build();
  if (named(N("circle").arg(num("5.0")), *tupled) != "shape::circle([5.0])") {
    FAIL("one-element tuple variant should receive the argument list");
    return;
  }

  PASS();
}

// ============================================================================
// Test: named shapes check the node name against their type name
// ============================================================================
static void test_type_name() {
  TEST(type_name);
  auto p = point();

  if (named(N("point").prop("x", num("1")).prop("y", num("2")), *p) != "point{x: 1, y: 2}") {
    FAIL("matching struct name");
    return;
  }
  if (errorOf([&] { named(N("pt").prop("x", num("1")).prop("y", num("2")), *p); }) !=
      ErrorKind::NodeNameMismatch) {
    FAIL("mismatched struct name");
    return;
  }
  if (named(N("marker"), *unitStructShape("marker")) != "marker") {
    FAIL("unit struct");
    return;
  }
  if (named(N("meters").arg(num("5")), *newtypeStructShape("meters", f64())) != "meters(5.0)") {
    FAIL("newtype struct");
    return;
  }
  if (errorOf([] { named(N("feet").arg(num("5")), *newtypeStructShape("meters", f64())); }) !=
      ErrorKind::NodeNameMismatch) {
    FAIL("mismatched newtype name");
    return;
  }
  auto rgb = tupleStructShape("rgb", {u32(), u32(), u32()});
  if (named(N("rgb").arg(num("1")).arg(num("2")).arg(num("3")), *rgb) != "rgb(1, 2, 3)") {
    FAIL("tuple struct");
    return;
  }

  PASS();
}

// ============================================================================
// Test: unnamed shapes want the `-` placeholder
// ============================================================================
static void test_placeholder() {
  TEST(placeholder);

  if (named(N("-").arg(num("1")), *i32()) != "1") {
    FAIL("placeholder primitive");
    return;
  }
  if (named(N("-").arg(num("1")).arg(num("2")), *seqShape(i32())) != "[1, 2]") {
    FAIL("placeholder sequence");
    return;
  }
  if (named(N("-").prop("a", str("b")), *mapShape(string())) != "{a: \"b\"}") {
    FAIL("placeholder map");
    return;
  }
  if (errorOf([] { named(N("x").arg(num("1")), *i32()); }) !=
      ErrorKind::AnonymousNodeNameMismatch) {
    FAIL("named primitive should be rejected");
    return;
  }
  if (errorOf([] { named(N("list").arg(num("1")), *seqShape(i32())); }) !=
      ErrorKind::AnonymousNodeNameMismatch) {
    FAIL("named sequence should be rejected");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a name field receives the node name instead of checking it
// ============================================================================
static void test_name_field() {
  TEST(name_field);
  auto entry = StructBuilder("entry")
                   .magic(FieldRole::Name, "key", string())
                   .field("value", i32())
                   .build();

  if (named(N("anything").prop("value", num("4")), *entry) !=
      "entry{key: \"anything\", value: 4}") {
    FAIL("name field should take the node name");
    return;
  }
  if (named(N("entry").prop("value", num("4")), *entry) != "entry{key: \"entry\", value: 4}") {
    FAIL("type name is an ordinary node name here");
    return;
  }

  PASS();
}

// ============================================================================
// Test: name + transparent fields wrap any inner shape
// ============================================================================
static void test_transparent() {
  TEST(transparent);
  auto wrapped = StructBuilder("named")
                     .magic(FieldRole::Name, "name", string())
                     .magic(FieldRole::Transparent, "value", point())
                     .build();

  if (named(N("origin").prop("x", num("0")).prop("y", num("0")), *wrapped) !=
      "named{name: \"origin\", value: point{x: 0, y: 0}}") {
    FAIL("transparent struct value");
    return;
  }

  auto scalar = StructBuilder("named")
                    .magic(FieldRole::Name, "name", string())
                    .magic(FieldRole::Transparent, "value", i32())
                    .build();
  if (named(N("anything").arg(num("5")), *scalar) != "named{name: \"anything\", value: 5}") {
    FAIL("transparent primitive value");
    return;
  }

  auto list = StructBuilder("named")
                  .magic(FieldRole::Name, "name", string())
                  .magic(FieldRole::Transparent, "value", seqShape(i32()))
                  .build();
  if (named(N("nums").arg(num("1")).arg(num("2")), *list) != "named{name: \"nums\", value: [1, 2]}") {
    FAIL("transparent sequence value");
    return;
  }

  auto crowded = StructBuilder("crowded")
                     .magic(FieldRole::Name, "name", string())
                     .magic(FieldRole::Transparent, "value", i32())
                     .field("extra", i32())
                     .build();
  if (errorOf([&] { named(N("n").arg(num("1")), *crowded); }) != ErrorKind::UnexpectedField) {
    FAIL("a third field next to a transparent field should be rejected");
    return;
  }

  PASS();
}

// ============================================================================
// Test: Any and IgnoredAny
// ============================================================================
static void test_any() {
  TEST(any);

  if (errorOf([] { named(N("thing").arg(num("1")), *anyShape()); }) !=
      ErrorKind::TypeHintRequired) {
    FAIL("Any should need a type hint");
    return;
  }
  if (named(N("thing").arg(num("1")).child(N("x")), *ignoredShape()) != "()") {
    FAIL("IgnoredAny should accept any node name");
    return;
  }

  PASS();
}

int main() {
  printf("=== kaydle Named Node Tests ===\n");

  test_enum_by_name();
  test_type_name();
  test_placeholder();
  test_name_field();
  test_transparent();
  test_any();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
