//===- error.cpp - Resolution errors ---------------------------------------===//

#include "kaydle/error.h"

#include <string>

namespace kaydle {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnsupportedShape:
    return "UnsupportedShape";
  case ErrorKind::TypeHintRequired:
    return "TypeHintRequired";
  case ErrorKind::NodeNameMismatch:
    return "NodeNameMismatch";
  case ErrorKind::AnonymousNodeNameMismatch:
    return "AnonymousNodeNameMismatch";
  case ErrorKind::UnknownVariant:
    return "UnknownVariant";
  case ErrorKind::MissingVariantSelector:
    return "MissingVariantSelector";
  case ErrorKind::AmbiguousNode:
    return "AmbiguousNode";
  case ErrorKind::UnexpectedArguments:
    return "UnexpectedArguments";
  case ErrorKind::UnexpectedProperties:
    return "UnexpectedProperties";
  case ErrorKind::UnexpectedData:
    return "UnexpectedData";
  case ErrorKind::UnexpectedField:
    return "UnexpectedField";
  case ErrorKind::ArityMismatch:
    return "ArityMismatch";
  case ErrorKind::ConversionFailed:
    return "ConversionFailed";
  case ErrorKind::DuplicateField:
    return "DuplicateField";
  case ErrorKind::MissingField:
    return "MissingField";
  case ErrorKind::InvalidLength:
    return "InvalidLength";
  case ErrorKind::InvalidAnnotatedValue:
    return "InvalidAnnotatedValue";
  case ErrorKind::RecursionLimit:
    return "RecursionLimit";
  case ErrorKind::InvalidSchema:
    return "InvalidSchema";
  case ErrorKind::MalformedDocument:
    return "MalformedDocument";
  }
  return "Unknown";
}

static std::string formatMessage(ErrorKind kind, const std::string &message,
                                 const std::optional<Span> &span) {
  std::string text = std::string(errorKindName(kind)) + ": " + message;
  if (span)
    text += " (at bytes " + std::to_string(span->start) + ".." + std::to_string(span->end) + ")";
  return text;
}

Error::Error(ErrorKind kind, const std::string &message, std::optional<Span> span)
    : std::runtime_error(formatMessage(kind, message, span)), kind_(kind), detail_(message),
      span_(span) {}

void fail(ErrorKind kind, const std::string &message, const Span &span) {
  if (span.known())
    throw Error(kind, message, span);
  throw Error(kind, message);
}

} // namespace kaydle
