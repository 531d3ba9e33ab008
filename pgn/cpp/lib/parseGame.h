#ifndef PGNREC_PARSE_GAME_H
#define PGNREC_PARSE_GAME_H
#include "gameId.h"
#include <string>
#include <utility>
#include <vector>

const std::string MOVES_FIELD = "moves";
const std::string GAME_ID_FIELD = "game_id";

typedef std::vector<std::pair<std::string, std::string> > FieldList;

struct ParsedGame {
	FieldList tags;
	std::string moves;
	std::string gameId;

	void setTag(const std::string& name, const std::string& value);
	// tags in order, then moves, then game_id
	FieldList fields() const;
	// throws std::out_of_range for an unknown field
	const std::string& value(const std::string& field) const;
};

class GameParser {
	IdSource& ids;
	bool cleanMoves;
public:
	GameParser(IdSource& ids, bool cleanMoves=false): ids(ids), cleanMoves(cleanMoves) {};
	ParsedGame parse(const std::string& game);
};

std::string trim(const std::string& s);
std::string cleanMoveText(const std::string& moves);

#endif
