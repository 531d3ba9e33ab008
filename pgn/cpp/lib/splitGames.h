#ifndef PGNREC_SPLIT_GAMES_H
#define PGNREC_SPLIT_GAMES_H
#include <cstdint>
#include <string>
#include <vector>

const std::string GAME_START = "[Event";
const std::string RESULT_TOKENS[] = {
	"1-0",
	"0-1",
	"1/2-1/2"
};

/*
 * Scans decompressed PGN text and yields one raw game per start/result pair.
 * Text is fed in arbitrary chunks; next() returns true while a complete game
 * is available. A game that is still open when finish() has been called and
 * the text runs out is dropped.
 */
class GameSplitter {
	enum class ScanState {
		SEEK_START,
		LINE_START,
		HEADER_LINE,
		MOVES,
		BRACE_COMMENT,
		LINE_COMMENT
	};

	std::string buf;
	size_t pos;
	size_t gameStart;
	ScanState state;
	bool finished;
	int64_t nDropped;

	bool atTokenBoundary(size_t idx);
	int matchResult(size_t& end);
	bool waitOrDrop();
public:
	GameSplitter();
	void feed(const std::string& text);
	void finish();
	bool next(std::string& game);
	int64_t droppedPartial();
};

std::vector<std::string> splitGames(const std::string& text);

#endif
