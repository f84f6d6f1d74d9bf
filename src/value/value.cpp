#include "value/value.hpp"

#include <algorithm>
#include <stdexcept>

namespace cfgjson {

void ValueMap::set(const std::string &name, Value value) {
	auto it = std::find(names.begin(), names.end(), name);
	if (it != names.end()) {
		values[it - names.begin()] = std::move(value);
		return;
	}
	names.push_back(name);
	values.push_back(std::move(value));
}

const Value *ValueMap::find(std::string_view name) const {
	auto it = std::find(names.begin(), names.end(), name);
	if (it == names.end()) {
		return nullptr;
	}
	return &values[it - names.begin()];
}

const Value &ValueMap::at(std::string_view name) const {
	const Value *value = find(name);
	if (!value) {
		throw std::out_of_range("no entry named '" + std::string(name) + "'");
	}
	return *value;
}

const Value &ValueMap::valueAt(size_t index) const { return values.at(index); }

bool ValueMap::operator==(const ValueMap &other) const { return names == other.names && values == other.values; }

Value Value::integer(std::int64_t number) { return Value(Data(std::in_place_type<std::int64_t>, number)); }

Value Value::text(std::string text) { return Value(Data(std::in_place_type<std::string>, std::move(text))); }

Value Value::boolean(bool flag) { return Value(Data(std::in_place_type<bool>, flag)); }

Value Value::list(ValueList items) { return Value(Data(std::in_place_type<ValueList>, std::move(items))); }

Value Value::structure(ValueMap fields) { return Value(Data(std::in_place_type<ValueMap>, std::move(fields))); }

Value Value::identifier(std::string name) {
	return Value(Data(std::in_place_type<Identifier>, Identifier{std::move(name)}));
}

std::string_view Value::typeName() const {
	switch (data_.index()) {
	case 0:
		return "integer";
	case 1:
		return "text";
	case 2:
		return "boolean";
	case 3:
		return "list";
	case 4:
		return "struct";
	case 5:
		return "identifier";
	default:
		return "unknown";
	}
}

bool Value::operator==(const Value &other) const { return data_ == other.data_; }

} // namespace cfgjson
