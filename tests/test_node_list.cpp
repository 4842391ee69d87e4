//===- test_node_list.cpp - Tests for documents and children blocks -------===//

#include "kaydle/error.h"
#include "kaydle/resolver.h"

#include "test_helpers.h"

#include <cstdio>
#include <string>
#include <vector>

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

static std::string doc(const NodeList &nodes, const Shape &shape,
                       const ResolveOptions &options = {}) {
  return toString(resolveDocument(nodes, shape, options));
}

// ============================================================================
// Test: sequences of named nodes
// ============================================================================
static void test_sequence() {
  TEST(sequence);
  auto shape = EnumBuilder("shape").newtype("circle", f64()).unit("dot").build();

  NodeList nodes = {N("circle").arg(num("1")), N("dot"), N("circle").arg(num("2"))};
  if (doc(nodes, *seqShape(shape)) != "[shape::circle(1.0), shape::dot, shape::circle(2.0)]") {
    FAIL("sequence of enum nodes");
    return;
  }
  if (doc({}, *seqShape(i32())) != "[]") {
    FAIL("empty document should be an empty sequence");
    return;
  }

  NodeList pair = {N("-").arg(num("1")), N("-").arg(str("a"))};
  if (doc(pair, *tupleShape({i32(), string()})) != "[1, \"a\"]") {
    FAIL("tuple of placeholders");
    return;
  }
  if (errorOf([&] { doc(pair, *tupleShape({i32()})); }) != ErrorKind::InvalidLength) {
    FAIL("tuple length should be checked");
    return;
  }

  PASS();
}

// ============================================================================
// Test: maps keyed by node name
// ============================================================================
static void test_map() {
  TEST(map);
  NodeList nodes = {N("a").arg(num("1")), N("b").arg(num("2")), N("a").arg(num("3"))};

  if (doc(nodes, *mapShape(i32())) != "{a: 3, b: 2}") {
    FAIL("last-wins map should replace in place");
    return;
  }
  if (doc(nodes, *mapShape(i32(), MapDuplicates::KeepAll)) != "{a: 1, b: 2, a: 3}") {
    FAIL("keep-all map should keep every node");
    return;
  }

  auto servers = mapShape(StructBuilder("server")
                              .field("host", string())
                              .field("port", u32())
                              .build());
  NodeList config = {N("primary").prop("host", str("a.example")).prop("port", num("80")),
                     N("backup").child(N("host").arg(str("b.example"))).child(
                         N("port").arg(num("8080")))};
  if (doc(config, *servers) !=
      "{primary: server{host: \"a.example\", port: 80}, backup: server{host: \"b.example\", "
      "port: 8080}}") {
    FAIL("map of structs");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a document can fill a struct directly
// ============================================================================
static void test_struct() {
  TEST(struct_document);
  auto settings = StructBuilder("settings")
                      .field("name", string())
                      .field("verbose", primitiveShape(PrimitiveKind::Bool))
                      .field("tags", seqShape(string()))
                      .build();

  NodeList nodes = {N("name").arg(str("demo")), N("verbose").arg(boolValue(true)),
                    N("tags").arg(str("a")).arg(str("b"))};
  if (doc(nodes, *settings) != "settings{name: \"demo\", verbose: true, tags: [\"a\", \"b\"]}") {
    FAIL("struct from top-level nodes");
    return;
  }

  NodeList dup = {N("name").arg(str("a")), N("name").arg(str("b"))};
  if (errorOf([&] { doc(dup, *settings); }) != ErrorKind::DuplicateField) {
    FAIL("repeated top-level field should be a duplicate");
    return;
  }

  PASS();
}

// ============================================================================
// Test: shapes a node list cannot become
// ============================================================================
static void test_unsupported() {
  TEST(unsupported);
  NodeList nodes = {N("-").arg(num("1"))};

  if (errorOf([&] { doc(nodes, *i32()); }) != ErrorKind::UnsupportedShape ||
      errorOf([&] { doc(nodes, *optionShape(i32())); }) != ErrorKind::UnsupportedShape ||
      errorOf([&] { doc(nodes, *EnumBuilder("e").unit("a").build()); }) !=
          ErrorKind::UnsupportedShape) {
    FAIL("scalar, option and enum documents should be unsupported");
    return;
  }
  if (errorOf([&] { doc(nodes, *anyShape()); }) != ErrorKind::TypeHintRequired) {
    FAIL("Any document should need a type hint");
    return;
  }
  if (doc(nodes, *ignoredShape()) != "()") {
    FAIL("ignored document");
    return;
  }

  PASS();
}

// ============================================================================
// Test: the nesting limit
// ============================================================================
static void test_recursion_limit() {
  TEST(recursion_limit);

  // seq<seq<i32>>: node list -> named node -> anonymous node -> value.
  auto nested = seqShape(seqShape(i32()));
  NodeList nodes = {N("-").arg(num("1"))};

  ResolveOptions shallow;
  shallow.max_depth = 3;
  if (errorOf([&] { doc(nodes, *nested, shallow); }) != ErrorKind::RecursionLimit) {
    FAIL("depth 4 should exceed a limit of 3");
    return;
  }
  ResolveOptions enough;
  enough.max_depth = 4;
  if (doc(nodes, *nested, enough) != "[[1]]") {
    FAIL("depth 4 should fit a limit of 4");
    return;
  }

  // Limits must hold for deep children chains too.
  Node deep = N("-").arg(num("0"));
  ShapePtr shape = i32();
  for (int i = 0; i < 20; ++i) {
    deep = N("-").child(deep);
    shape = seqShape(shape);
  }
  ResolveOptions limited;
  limited.max_depth = 16;
  if (errorOf([&] { doc({deep}, *seqShape(shape), limited); }) != ErrorKind::RecursionLimit) {
    FAIL("deep children should hit the limit");
    return;
  }

  PASS();
}

// ============================================================================
// Test: trace callback
// ============================================================================
static void test_trace() {
  TEST(trace);
  std::vector<std::string> steps;

  ResolveOptions options;
  options.trace = [&steps](llvm::StringRef component, const Shape &shape, llvm::StringRef subject,
                           unsigned depth) {
    steps.push_back(std::to_string(depth) + " " + component.str() + " " + describeShape(shape) +
                    " " + subject.str());
  };

  NodeList nodes = {N("-").arg(num("7"))};
  doc(nodes, *seqShape(i32()), options);

  std::vector<std::string> expected = {
      "1 node-list seq 1 node(s)",
      "2 named-node i32 -",
      "3 anonymous-node i32 -",
      "4 value i32 7",
  };
  if (steps != expected) {
    FAIL("trace should report each step with its depth");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a failing trace hook leaves the resolver reusable
// ============================================================================
static void test_trace_failure() {
  TEST(trace_failure);
  bool reject = true;

  ResolveOptions options;
  options.max_depth = 1;
  options.trace = [&reject](llvm::StringRef, const Shape &, llvm::StringRef, unsigned) {
    if (reject)
      fail(ErrorKind::UnexpectedData, "trace rejected the step");
  };

  Resolver resolver(options);
  if (errorOf([&] { resolver.resolveValue(num("1"), *i32()); }) != ErrorKind::UnexpectedData) {
    FAIL("trace error should propagate");
    return;
  }
  reject = false;
  if (errorOf([&] { resolver.resolveValue(num("1"), *i32()); }) ||
      toString(resolver.resolveValue(num("2"), *i32())) != "2") {
    FAIL("depth should be restored after a trace error");
    return;
  }

  PASS();
}

int main() {
  printf("=== kaydle Node List Tests ===\n");

  test_sequence();
  test_map();
  test_struct();
  test_unsupported();
  test_recursion_limit();
  test_trace();
  test_trace_failure();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
