#pragma once

#include "value/value.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace cfgjson {

// ordered_json keeps struct fields and document entries in insertion order
using OrderedJson = nlohmann::ordered_json;

// Integer -> number, Text and Identifier -> string, Boolean -> bool,
// List -> array, Struct -> object
void to_json(OrderedJson &j, const Value &value);
void to_json(OrderedJson &j, const ValueMap &map);

// Serialize a document with `indent` spaces per level. Non-ASCII text is
// written as UTF-8; invalid byte sequences become U+FFFD.
std::string dumpDocument(const Document &document, int indent = 2);

} // namespace cfgjson
