#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cfgjson {

class Value;
using ValueList = std::vector<Value>;

/**
 * Ordered name -> value mapping.
 *
 * Backs both struct literals and the parsed document. Entries keep the
 * position of their first insertion; setting an existing name replaces the
 * value in place.
 */
class ValueMap {
public:
  void set(const std::string &name, Value value);

  // nullptr when the name is not present
  const Value *find(std::string_view name) const;
  bool contains(std::string_view name) const { return find(name) != nullptr; }
  // Throws std::out_of_range when the name is not present
  const Value &at(std::string_view name) const;

  size_t size() const { return names.size(); }
  bool empty() const { return names.empty(); }
  const std::vector<std::string> &keys() const { return names; }
  const std::string &nameAt(size_t index) const { return names.at(index); }
  const Value &valueAt(size_t index) const;

  bool operator==(const ValueMap &other) const;

private:
  std::vector<std::string> names;
  std::vector<Value> values;
};

// A name with no binding, kept as a literal placeholder
struct Identifier {
  std::string name;

  bool operator==(const Identifier &) const = default;
};

class Value {
public:
  using Data = std::variant<std::int64_t, std::string, bool, ValueList, ValueMap, Identifier>;

  Value() = default;

  static Value integer(std::int64_t number);
  static Value text(std::string text);
  static Value boolean(bool flag);
  static Value list(ValueList items);
  static Value structure(ValueMap fields);
  static Value identifier(std::string name);

  bool isInteger() const { return std::holds_alternative<std::int64_t>(data_); }
  bool isText() const { return std::holds_alternative<std::string>(data_); }
  bool isBoolean() const { return std::holds_alternative<bool>(data_); }
  bool isList() const { return std::holds_alternative<ValueList>(data_); }
  bool isStruct() const { return std::holds_alternative<ValueMap>(data_); }
  bool isIdentifier() const { return std::holds_alternative<Identifier>(data_); }

  // Accessors throw std::bad_variant_access on a kind mismatch
  std::int64_t asInteger() const { return std::get<std::int64_t>(data_); }
  const std::string &asText() const { return std::get<std::string>(data_); }
  bool asBoolean() const { return std::get<bool>(data_); }
  const ValueList &asList() const { return std::get<ValueList>(data_); }
  const ValueMap &asStruct() const { return std::get<ValueMap>(data_); }
  const Identifier &asIdentifier() const { return std::get<Identifier>(data_); }

  const Data &data() const { return data_; }
  std::string_view typeName() const;

  bool operator==(const Value &other) const;

private:
  explicit Value(Data data) : data_(std::move(data)) {}

  Data data_;
};

// Result of a parse: top-level names in source order
using Document = ValueMap;

// Key under which a bare top-level value is stored
inline constexpr std::string_view bareValueKey = "_value";

} // namespace cfgjson
