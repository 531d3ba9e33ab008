#include "schema.h"
#include "errors.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

Schema inferSchema(const ParsedGame& first) {
	Schema schema;
	for (auto& [name, value]: first.fields()) {
		schema.fields.push_back({name, TEXT_TYPE});
	}
	return schema;
}

Schema inferSchema(const std::vector<ParsedGame>& games) {
	if (games.empty()) throw EmptySchemaError();
	return inferSchema(games.front());
}

std::vector<std::string> Schema::fieldNames() const {
	std::vector<std::string> names;
	for (auto& f: fields) names.push_back(f.name);
	return names;
}

void Schema::check(const ParsedGame& game) const {
	FieldList gameFields = game.fields();
	size_t n = std::min(gameFields.size(), fields.size());
	for (size_t i = 0; i < n; i++) {
		if (gameFields[i].first != fields[i].name) {
			throw SchemaViolationError("game " + game.gameId + " has field '" + gameFields[i].first
					+ "' at position " + std::to_string(i) + ", expected '" + fields[i].name + "'");
		}
	}
	if (gameFields.size() > fields.size()) {
		throw SchemaViolationError("game " + game.gameId + " has unexpected field '"
				+ gameFields[n].first + "'");
	}
	if (gameFields.size() < fields.size()) {
		throw SchemaViolationError("game " + game.gameId + " is missing field '"
				+ fields[n].name + "'");
	}
}

std::string Schema::toJson() const {
	json doc;
	doc["namespace"] = ns;
	doc["type"] = "record";
	doc["name"] = name;
	doc["fields"] = json::array();
	for (auto& f: fields) {
		doc["fields"].push_back({{"name", f.name}, {"type", f.type}});
	}
	return doc.dump(2);
}
