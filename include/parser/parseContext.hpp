#pragma once

#include "value/value.hpp"

#include <string>
#include <unordered_map>

namespace cfgjson {

// Names bound with `:=`. Values are stored fully resolved and handed out by
// copy, so rebinding a name never changes earlier substitutions.
class ConstantTable {
public:
	// Rebinding an existing name overwrites it
	void define(const std::string &name, Value value) { constants[name] = std::move(value); }

	// nullptr when the name is unbound
	const Value *lookup(const std::string &name) const {
		auto it = constants.find(name);
		return it == constants.end() ? nullptr : &it->second;
	}

	bool contains(const std::string &name) const { return constants.contains(name); }
	size_t size() const { return constants.size(); }

private:
	std::unordered_map<std::string, Value> constants;
};

// State of one parse session. Passed by reference into every recursive parse
// function; never shared between parses.
struct ParseContext {
	ConstantTable constants;
	// Statements consumed so far, empty statements included
	size_t statementCount = 0;
	// Open lists, structs and chr( calls around the value being parsed
	size_t depth = 0;
	size_t maxDepth = 1000;
};

} // namespace cfgjson
