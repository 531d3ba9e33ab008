#ifndef PGNREC_SCHEMA_H
#define PGNREC_SCHEMA_H
#include "parseGame.h"
#include <string>
#include <vector>

const std::string SCHEMA_NAMESPACE = "pgnrec.games";
const std::string SCHEMA_NAME = "Game";
const std::string TEXT_TYPE = "string";

struct SchemaField {
	std::string name;
	std::string type;
};

struct Schema {
	std::string ns;
	std::string name;
	std::vector<SchemaField> fields;

	Schema(): ns(SCHEMA_NAMESPACE), name(SCHEMA_NAME) {};
	void check(const ParsedGame& game) const;
	std::vector<std::string> fieldNames() const;
	std::string toJson() const;
};

Schema inferSchema(const ParsedGame& first);
Schema inferSchema(const std::vector<ParsedGame>& games);

#endif
