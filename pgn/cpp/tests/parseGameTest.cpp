#include <gtest/gtest.h>
#include "lib/errors.h"
#include "lib/gameId.h"
#include "lib/parseGame.h"
#include "lib/schema.h"
#include <set>
#include <thread>
#include <vector>

TEST(ParseGameTest, ExtractsTagsMovesAndId) {
	RandomIdSource ids;
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"E\"]\n[Site \"S\"]\n[Date \"D\"]\n\n1. e4 e5 1-0");

	EXPECT_EQ(pg.value("Event"), "E");
	EXPECT_EQ(pg.value("Site"), "S");
	EXPECT_EQ(pg.value("Date"), "D");
	EXPECT_EQ(pg.moves.rfind("1. e4", 0), 0);
	EXPECT_EQ(pg.moves, "1. e4 e5 1-0");
	EXPECT_TRUE(isCanonicalId(pg.gameId));
	EXPECT_EQ(pg.gameId.size(), GAME_ID_LENGTH);
	EXPECT_NE(pg.gameId.find('-'), std::string::npos);
}

TEST(ParseGameTest, FieldOrder) {
	SequentialIdSource ids;
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"E\"]\n[White \"W\"]\n[Black \"B\"]\n\n1. d4 0-1");

	FieldList fields = pg.fields();
	ASSERT_EQ(fields.size(), 5);
	EXPECT_EQ(fields[0].first, "Event");
	EXPECT_EQ(fields[1].first, "White");
	EXPECT_EQ(fields[2].first, "Black");
	EXPECT_EQ(fields[3], std::make_pair(MOVES_FIELD, std::string("1. d4 0-1")));
	EXPECT_EQ(fields[4], std::make_pair(GAME_ID_FIELD, std::string("00000000-0000-4000-8000-000000000001")));
}

TEST(ParseGameTest, RepeatedTagLastWins) {
	SequentialIdSource ids;
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"first\"]\n[Site \"x\"]\n[Event \"second\"]\n\n1. e4 1-0");
	ASSERT_EQ(pg.tags.size(), 2);
	EXPECT_EQ(pg.tags[0].first, "Event");
	EXPECT_EQ(pg.value("Event"), "second");
}

TEST(ParseGameTest, IdIgnoresTags) {
	SequentialIdSource ids(42);
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"E\"]\n[game_id \"from-the-file\"]\n[moves \"nope\"]\n\n1. e4 1-0");
	EXPECT_EQ(pg.gameId, formatUuid(0x4000, 0x8000000000000000ULL | 42));
	EXPECT_EQ(pg.moves, "1. e4 1-0");
	EXPECT_EQ(pg.tags.size(), 1);
}

TEST(ParseGameTest, MovesWithoutBlankLine) {
	SequentialIdSource ids;
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"E\"]\n[Site \"S\"]\n1. e4 e5\n2. Nf3 Nc6 1-0");
	EXPECT_EQ(pg.moves, "1. e4 e5\n2. Nf3 Nc6 1-0");
}

TEST(ParseGameTest, EscapedQuotesAndCrLf) {
	SequentialIdSource ids;
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"The \\\"Big\\\" One\"]\r\n[Site \"a\\\\b\"]\r\n\r\n1. e4 e5 1-0");
	EXPECT_EQ(pg.value("Event"), "The \"Big\" One");
	EXPECT_EQ(pg.value("Site"), "a\\b");
	EXPECT_EQ(pg.moves, "1. e4 e5 1-0");
}

TEST(ParseGameTest, Latin1TagValue) {
	SequentialIdSource ids;
	GameParser parser(ids);
	ParsedGame latin1 = parser.parse("[Event \"E\"]\n[White \"Jos\xe9\"]\n\n1. e4 {Jos\xe9} 1-0");
	ParsedGame utf8 = parser.parse("[Event \"E\"]\n[White \"Jos\xc3\xa9\"]\n\n1. e4 1-0");

	ASSERT_EQ(latin1.tags.size(), 2);
	EXPECT_EQ(latin1.value("White"), "Jos\xe9");
	EXPECT_EQ(latin1.moves, "1. e4 {Jos\xe9} 1-0");
	ASSERT_EQ(utf8.tags.size(), 2);
	EXPECT_EQ(utf8.value("White"), "Jos\xc3\xa9");
	EXPECT_NO_THROW(inferSchema(utf8).check(latin1));
}

TEST(ParseGameTest, NoTagsIsMalformed) {
	SequentialIdSource ids;
	GameParser parser(ids);
	EXPECT_THROW(parser.parse("[Event broken\n\n1. e4 e5 1-0"), MalformedGameError);
	EXPECT_THROW(parser.parse("1. e4 e5 1-0"), MalformedGameError);
}

TEST(ParseGameTest, UnknownFieldThrows) {
	SequentialIdSource ids;
	GameParser parser(ids);
	ParsedGame pg = parser.parse("[Event \"E\"]\n\n1. e4 1-0");
	EXPECT_THROW(pg.value("Site"), std::out_of_range);
}

TEST(ParseGameTest, CleanMoves) {
	SequentialIdSource ids;
	GameParser parser(ids, true);
	ParsedGame pg = parser.parse("[Event \"E\"]\n\n1. e4 {This is a comment} e5\n2. Nf3   (2. d4) 1-0");
	EXPECT_EQ(pg.moves, "1. e4 e5 2. Nf3 (2. d4)");
	EXPECT_EQ(cleanMoveText("1. e4 e5 *"), "1. e4 e5");
	EXPECT_EQ(cleanMoveText("1/2-1/2"), "");
	EXPECT_EQ(cleanMoveText("1. e4 e5"), "1. e4 e5");
	EXPECT_EQ(cleanMoveText("1. e4 {Jos\xe9 \xa0 played} e5\xa0 1-0"), "1. e4 e5\xa0");
}

TEST(GameIdTest, RandomIdsAreCanonicalAndUnique) {
	RandomIdSource ids;
	std::set<std::string> seen;
	for (int i = 0; i < 10000; i++) {
		std::string id = ids.nextId();
		ASSERT_TRUE(isCanonicalId(id)) << id;
		EXPECT_EQ(id[14], '4');
		EXPECT_TRUE(seen.insert(id).second);
	}
}

TEST(GameIdTest, ThreadsDrawDistinctIds) {
	RandomIdSource ids;
	const int nThreads = 8;
	const int perThread = 2000;
	std::vector<std::vector<std::string> > drawn(nThreads);
	std::vector<std::thread> threads;
	for (int t = 0; t < nThreads; t++) {
		threads.emplace_back([&ids, &drawn, t]{
			for (int i = 0; i < perThread; i++) drawn[t].push_back(ids.nextId());
		});
	}
	for (auto& th: threads) th.join();

	std::set<std::string> seen;
	for (auto& batch: drawn) {
		for (auto& id: batch) {
			EXPECT_TRUE(isCanonicalId(id));
			EXPECT_TRUE(seen.insert(id).second) << id;
		}
	}
	EXPECT_EQ(seen.size(), size_t(nThreads*perThread));
}

TEST(GameIdTest, CanonicalCheck) {
	EXPECT_TRUE(isCanonicalId("123e4567-e89b-42d3-a456-426614174000"));
	EXPECT_FALSE(isCanonicalId("123e4567e89b42d3a456426614174000"));
	EXPECT_FALSE(isCanonicalId("123e4567-e89b-42d3-a456-42661417400z"));
	EXPECT_FALSE(isCanonicalId(""));
}
