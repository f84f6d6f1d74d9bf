#include "json/jsonEncoder.hpp"

#include <type_traits>
#include <variant>

namespace cfgjson {

void to_json(OrderedJson &j, const Value &value) {
	std::visit(
		[&j](const auto &data) {
			using T = std::decay_t<decltype(data)>;
			if constexpr (std::is_same_v<T, ValueList>) {
				j = OrderedJson::array();
				for (const Value &item : data) {
					j.push_back(OrderedJson(item));
				}
			} else if constexpr (std::is_same_v<T, ValueMap>) {
				to_json(j, data);
			} else if constexpr (std::is_same_v<T, Identifier>) {
				j = data.name;
			} else {
				j = data;
			}
		},
		value.data()
	);
}

void to_json(OrderedJson &j, const ValueMap &map) {
	j = OrderedJson::object();
	for (size_t index = 0; index < map.size(); index++) {
		j[map.nameAt(index)] = OrderedJson(map.valueAt(index));
	}
}

std::string dumpDocument(const Document &document, int indent) {
	OrderedJson j = OrderedJson(document);
	return j.dump(indent, ' ', false, OrderedJson::error_handler_t::replace);
}

} // namespace cfgjson
