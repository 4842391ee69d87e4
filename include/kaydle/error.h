//===- error.h - Resolution errors ------------------------------*- C++ -*-===//
//
// Every failure in kaydle is reported by throwing kaydle::Error. Resolution
// is fail-fast: the first error aborts the whole document.
//
//===----------------------------------------------------------------------===//

#ifndef KAYDLE_ERROR_H
#define KAYDLE_ERROR_H

#include "kaydle/document.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace kaydle {

enum class ErrorKind {
  UnsupportedShape,
  TypeHintRequired,
  NodeNameMismatch,
  AnonymousNodeNameMismatch,
  UnknownVariant,
  MissingVariantSelector,
  AmbiguousNode,
  UnexpectedArguments,
  UnexpectedProperties,
  UnexpectedData,
  UnexpectedField,
  ArityMismatch,
  ConversionFailed,
  DuplicateField,
  MissingField,
  InvalidLength,
  InvalidAnnotatedValue,
  RecursionLimit,
  InvalidSchema,
  MalformedDocument,
};

/// Stable name of an error kind ("AmbiguousNode", ...).
const char *errorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message, std::optional<Span> span = std::nullopt);

  ErrorKind kind() const { return kind_; }
  const std::optional<Span> &span() const { return span_; }

  /// The message without the kind prefix and span suffix.
  const std::string &detail() const { return detail_; }

private:
  ErrorKind kind_;
  std::string detail_;
  std::optional<Span> span_;
};

/// Throw a kaydle::Error. The span is attached only if it is known.
[[noreturn]] void fail(ErrorKind kind, const std::string &message, const Span &span = {});

} // namespace kaydle

#endif // KAYDLE_ERROR_H
