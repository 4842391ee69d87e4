//===- datum.cpp - Resolved value accessors and rendering ------------------===//

#include "kaydle/datum.h"

#include "kaydle/number.h"

#include <type_traits>
#include <utility>
#include <variant>

namespace kaydle {

const Datum *Datum::some() const {
  if (auto *s = std::get_if<DatumSome>(&kind))
    return s->value.get();
  return nullptr;
}

const Datum *Datum::get(llvm::StringRef key) const {
  const std::vector<std::pair<std::string, Datum>> *entries = nullptr;
  if (auto *s = std::get_if<DatumStruct>(&kind))
    entries = &s->fields;
  else if (auto *m = std::get_if<DatumMap>(&kind))
    entries = &m->entries;
  if (!entries)
    return nullptr;
  for (auto it = entries->rbegin(); it != entries->rend(); ++it)
    if (it->first == key)
      return &it->second;
  return nullptr;
}

const Datum *Datum::at(size_t index) const {
  if (auto *s = std::get_if<DatumSeq>(&kind))
    return index < s->elements.size() ? &s->elements[index] : nullptr;
  if (auto *s = std::get_if<DatumStruct>(&kind))
    if (s->form == StructForm::Tuple && index < s->fields.size())
      return &s->fields[index].second;
  return nullptr;
}

Datum makeSome(Datum value) {
  return Datum{DatumSome{std::make_unique<Datum>(std::move(value))}};
}

Datum makeVariant(std::string enumName, std::string variant, Datum payload) {
  return Datum{DatumVariant{std::move(enumName), std::move(variant),
                            std::make_unique<Datum>(std::move(payload))}};
}

// ── Debug printing ──────────────────────────────────────────────────────────

static void printQuoted(llvm::StringRef text, llvm::raw_ostream &os) {
  os << '"';
  os.write_escaped(text);
  os << '"';
}

static void printEntries(const std::vector<std::pair<std::string, Datum>> &entries,
                         llvm::raw_ostream &os) {
  os << '{';
  bool first = true;
  for (const auto &[key, value] : entries) {
    if (!first)
      os << ", ";
    first = false;
    os << key << ": ";
    printDatum(value, os);
  }
  os << '}';
}

static void printElements(const std::vector<std::pair<std::string, Datum>> &fields,
                          llvm::raw_ostream &os) {
  os << '(';
  bool first = true;
  for (const auto &field : fields) {
    if (!first)
      os << ", ";
    first = false;
    printDatum(field.second, os);
  }
  os << ')';
}

void printDatum(const Datum &datum, llvm::raw_ostream &os) {
  std::visit(
      [&os](const auto &d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, DatumUnit>) {
          os << "()";
        } else if constexpr (std::is_same_v<T, bool>) {
          os << (d ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
          os << d;
        } else if constexpr (std::is_same_v<T, double>) {
          os << floatLiteral(d);
        } else if constexpr (std::is_same_v<T, std::string>) {
          printQuoted(d, os);
        } else if constexpr (std::is_same_v<T, DatumNone>) {
          os << "None";
        } else if constexpr (std::is_same_v<T, DatumSome>) {
          os << "Some(";
          printDatum(*d.value, os);
          os << ')';
        } else if constexpr (std::is_same_v<T, DatumSeq>) {
          os << '[';
          for (size_t i = 0; i < d.elements.size(); ++i) {
            if (i)
              os << ", ";
            printDatum(d.elements[i], os);
          }
          os << ']';
        } else if constexpr (std::is_same_v<T, DatumMap>) {
          printEntries(d.entries, os);
        } else if constexpr (std::is_same_v<T, DatumStruct>) {
          os << d.name;
          switch (d.form) {
          case StructForm::Named:
            printEntries(d.fields, os);
            break;
          case StructForm::Unit:
            break;
          case StructForm::Newtype:
          case StructForm::Tuple:
            printElements(d.fields, os);
            break;
          }
        } else if constexpr (std::is_same_v<T, DatumVariant>) {
          os << d.enum_name << "::" << d.variant;
          if (!d.payload->isUnit()) {
            os << '(';
            printDatum(*d.payload, os);
            os << ')';
          }
        }
      },
      datum.kind);
}

std::string toString(const Datum &datum) {
  std::string text;
  llvm::raw_string_ostream os(text);
  printDatum(datum, os);
  os.flush();
  return text;
}

// ── JSON ────────────────────────────────────────────────────────────────────

nlohmann::ordered_json toJson(const Datum &datum) {
  using json = nlohmann::ordered_json;
  return std::visit(
      [](const auto &d) -> json {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, DatumUnit> || std::is_same_v<T, DatumNone>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, uint64_t> || std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string>) {
          return json(d);
        } else if constexpr (std::is_same_v<T, DatumSome>) {
          return toJson(*d.value);
        } else if constexpr (std::is_same_v<T, DatumSeq>) {
          json arr = json::array();
          for (const auto &e : d.elements)
            arr.push_back(toJson(e));
          return arr;
        } else if constexpr (std::is_same_v<T, DatumMap>) {
          if (d.keep_all) {
            json arr = json::array();
            for (const auto &[key, value] : d.entries)
              arr.push_back(json::array({json(key), toJson(value)}));
            return arr;
          }
          json obj = json::object();
          for (const auto &[key, value] : d.entries)
            obj[key] = toJson(value);
          return obj;
        } else if constexpr (std::is_same_v<T, DatumStruct>) {
          switch (d.form) {
          case StructForm::Unit:
            return nullptr;
          case StructForm::Newtype:
            return toJson(d.fields.front().second);
          case StructForm::Tuple: {
            json arr = json::array();
            for (const auto &field : d.fields)
              arr.push_back(toJson(field.second));
            return arr;
          }
          case StructForm::Named:
            break;
          }
          json obj = json::object();
          for (const auto &[key, value] : d.fields)
            obj[key] = toJson(value);
          return obj;
        } else {
          static_assert(std::is_same_v<T, DatumVariant>);
          if (d.payload->isUnit())
            return json(d.variant);
          json obj = json::object();
          obj[d.variant] = toJson(*d.payload);
          return obj;
        }
      },
      datum.kind);
}

} // namespace kaydle
