#include <gtest/gtest.h>
#include "lib/errors.h"
#include "lib/gameId.h"
#include "lib/parseGame.h"
#include "lib/schema.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static ParsedGame parseOne(const std::string& game) {
	static SequentialIdSource ids;
	GameParser parser(ids);
	return parser.parse(game);
}

TEST(SchemaTest, InferredFromFirstGame) {
	ParsedGame pg = parseOne("[Event \"E\"]\n[Site \"S\"]\n[Result \"1-0\"]\n\n1. e4 1-0");
	Schema schema = inferSchema(pg);

	std::vector<std::string> expected = {"Event", "Site", "Result", "moves", "game_id"};
	EXPECT_EQ(schema.fieldNames(), expected);
	for (auto& f: schema.fields) {
		EXPECT_EQ(f.type, "string");
	}
	EXPECT_EQ(schema.ns, "pgnrec.games");
	EXPECT_EQ(schema.name, "Game");
	EXPECT_NO_THROW(schema.check(pg));
}

TEST(SchemaTest, FirstOfManyWins) {
	std::vector<ParsedGame> games = {
		parseOne("[Event \"E\"]\n\n1. e4 1-0"),
		parseOne("[Event \"E\"]\n[Site \"S\"]\n\n1. e4 1-0")
	};
	std::vector<std::string> expected = {"Event", "moves", "game_id"};
	EXPECT_EQ(inferSchema(games).fieldNames(), expected);
}

TEST(SchemaTest, NoGames) {
	EXPECT_THROW(inferSchema(std::vector<ParsedGame>()), EmptySchemaError);
}

TEST(SchemaTest, Violations) {
	Schema schema = inferSchema(parseOne("[Event \"E\"]\n[Site \"S\"]\n\n1. e4 1-0"));

	EXPECT_NO_THROW(schema.check(parseOne("[Event \"x\"]\n[Site \"y\"]\n\n1. d4 0-1")));
	EXPECT_THROW(schema.check(parseOne("[Event \"x\"]\n\n1. d4 0-1")), SchemaViolationError);
	EXPECT_THROW(schema.check(parseOne("[Event \"x\"]\n[Site \"y\"]\n[Round \"1\"]\n\n1. d4 0-1")), SchemaViolationError);
	EXPECT_THROW(schema.check(parseOne("[Site \"y\"]\n[Event \"x\"]\n\n1. d4 0-1")), SchemaViolationError);
}

TEST(SchemaTest, ViolationIsPipelineError) {
	Schema schema = inferSchema(parseOne("[Event \"E\"]\n\n1. e4 1-0"));
	try {
		schema.check(parseOne("[White \"W\"]\n\n1. e4 1-0"));
		FAIL() << "expected a schema violation";
	} catch (PipelineError& e) {
		EXPECT_NE(std::string(e.what()).find("White"), std::string::npos);
	}
}

TEST(SchemaTest, JsonDocument) {
	Schema schema = inferSchema(parseOne("[Event \"E\"]\n\n1. e4 1-0"));
	json doc = json::parse(schema.toJson());

	EXPECT_EQ(doc["namespace"].get<std::string>(), "pgnrec.games");
	EXPECT_EQ(doc["type"].get<std::string>(), "record");
	EXPECT_EQ(doc["name"].get<std::string>(), "Game");
	ASSERT_EQ(doc["fields"].size(), 3);
	EXPECT_EQ(doc["fields"][0]["name"].get<std::string>(), "Event");
	EXPECT_EQ(doc["fields"][1]["name"].get<std::string>(), "moves");
	EXPECT_EQ(doc["fields"][2]["name"].get<std::string>(), "game_id");
	EXPECT_EQ(doc["fields"][2]["type"].get<std::string>(), "string");
}
