//===- kaydle_main.cpp - kaydle-resolve: document + schema → datum --------===//
//
// Standalone resolver tool. Reads a node document (msgpack, or JSON with
// --input-json) from stdin or a file, resolves it against a JSON schema, and
// prints the resulting datum (debug form, or JSON with --emit-json).
//
// Exit codes: 0 success, 1 input or resolution failure, 2 usage error.
//
//===----------------------------------------------------------------------===//

#include "kaydle/document_reader.h"
#include "kaydle/resolver.h"
#include "kaydle/shape_reader.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

namespace {

struct Options {
  std::string input_file;
  std::string schema_file;
  bool input_json = false;
  bool emit_json = false;
  bool trace = false;
  size_t max_depth = kaydle::ResolveOptions{}.max_depth;
};

void printUsage() {
  std::cerr << "Usage: kaydle-resolve --schema <schema.json> [options] [document]\n"
            << "  (no document file = read msgpack document from stdin)\n"
            << "\n"
            << "Options:\n"
            << "  --schema <path>     JSON description of the target shape (required)\n"
            << "  --input-json        Read a JSON document instead of msgpack\n"
            << "  --emit-json         Print the result as JSON\n"
            << "  --max-depth=<n>     Nesting limit (default: 256)\n"
            << "  --trace             Log each resolution step to stderr\n"
            << "  --help              Show this help\n";
}

[[noreturn]] void usageError(const std::string &msg) {
  std::cerr << msg << "\n";
  printUsage();
  std::exit(2);
}

auto parse_args(int argc, char *argv[]) -> Options {
  Options opts;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    llvm::StringRef arg = args[i];
    if (arg == "--help" || arg == "-h") {
      printUsage();
      std::exit(0);
    } else if (arg == "--input-json") {
      opts.input_json = true;
    } else if (arg == "--emit-json") {
      opts.emit_json = true;
    } else if (arg == "--trace") {
      opts.trace = true;
    } else if (arg.consume_front("--max-depth=")) {
      unsigned long long depth;
      if (arg.getAsInteger(10, depth) || depth == 0)
        usageError("Invalid --max-depth value: " + arg.str());
      opts.max_depth = static_cast<size_t>(depth);
    } else if (arg == "--schema") {
      if (i + 1 >= args.size())
        usageError("--schema needs a file argument");
      opts.schema_file = args[++i];
    } else if (!arg.empty() && arg.front() != '-') {
      opts.input_file = args[i];
    } else {
      usageError("Unknown option: " + args[i]);
    }
  }

  if (opts.schema_file.empty())
    usageError("Missing --schema");
  return opts;
}

bool readFile(const std::string &path, std::vector<uint8_t> &out) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    return false;
  out = std::vector<uint8_t>(std::istreambuf_iterator<char>(f), {});
  return true;
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  auto opts = parse_args(argc, argv);

  std::vector<uint8_t> schemaData;
  if (!readFile(opts.schema_file, schemaData)) {
    std::cerr << "Error: could not open file: " << opts.schema_file << "\n";
    return 1;
  }

  // Read the document from stdin or file
  std::vector<uint8_t> inputData;
  if (!opts.input_file.empty()) {
    if (!readFile(opts.input_file, inputData)) {
      std::cerr << "Error: could not open file: " << opts.input_file << "\n";
      return 1;
    }
  } else {
#ifdef _WIN32
    // Text-mode stdin would corrupt binary msgpack data.
    _setmode(_fileno(stdin), _O_BINARY);
#endif
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(std::cin), {});
  }

  if (inputData.empty()) {
    std::cerr << "Error: no input data\n";
    return 1;
  }

  kaydle::ResolveOptions resolveOpts;
  resolveOpts.max_depth = opts.max_depth;
  if (opts.trace) {
    resolveOpts.trace = [](llvm::StringRef component, const kaydle::Shape &shape,
                           llvm::StringRef subject, unsigned depth) {
      llvm::errs().indent(2 * (depth - 1))
          << component << " " << kaydle::describeShape(shape) << " <- " << subject << "\n";
    };
  }

  try {
    kaydle::ShapePtr shape = kaydle::parseShapeText(
        std::string_view(reinterpret_cast<const char *>(schemaData.data()), schemaData.size()));

    // Parse the document (msgpack by default, JSON with --input-json)
    kaydle::NodeList document =
        opts.input_json ? kaydle::parseJsonDocument(inputData.data(), inputData.size())
                        : kaydle::parseMsgpackDocument(inputData.data(), inputData.size());

    kaydle::Datum result = kaydle::resolveDocument(document, *shape, resolveOpts);

    if (opts.emit_json) {
      llvm::outs() << kaydle::toJson(result).dump(2) << "\n";
    } else {
      kaydle::printDatum(result, llvm::outs());
      llvm::outs() << "\n";
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
