#include "parseGame.h"
#include "errors.h"
#include <re2/re2.h>
#include <stdexcept>

using namespace std;

// PGN text is ISO-8859-1 as often as UTF-8: match bytes, not code points
const re2::RE2 tagRe("\\s*\\[(\\w+)\\s+\"((?:[^\"\\\\]|\\\\.)*)\"\\s*\\]\\s*", re2::RE2::Latin1);
const re2::RE2 commentRe("\\{[^}]*\\}", re2::RE2::Latin1);
const re2::RE2 spaceRe("\\s+", re2::RE2::Latin1);

const string TRAILING_RESULTS[] = {
	"1-0",
	"0-1",
	"1/2-1/2",
	"*"
};

void ParsedGame::setTag(const string& name, const string& value) {
	for (auto& tag: tags) {
		if (tag.first == name) {
			tag.second = value;
			return;
		}
	}
	tags.push_back(make_pair(name, value));
}

FieldList ParsedGame::fields() const {
	FieldList out(tags);
	out.push_back(make_pair(MOVES_FIELD, moves));
	out.push_back(make_pair(GAME_ID_FIELD, gameId));
	return out;
}

const string& ParsedGame::value(const string& field) const {
	if (field == MOVES_FIELD) return moves;
	if (field == GAME_ID_FIELD) return gameId;
	for (auto& tag: tags) {
		if (tag.first == field) return tag.second;
	}
	throw out_of_range("no field " + field);
}

string trim(const string& s) {
	const char* ws = " \t\r\n";
	size_t start = s.find_first_not_of(ws);
	if (start == string::npos) return "";
	size_t end = s.find_last_not_of(ws);
	return s.substr(start, end - start + 1);
}

static string unescape(const string& value) {
	if (value.find('\\') == string::npos) return value;
	string out;
	out.reserve(value.size());
	for (size_t i = 0; i < value.size(); i++) {
		if (value[i] == '\\' && i+1 < value.size()) i++;
		out += value[i];
	}
	return out;
}

string cleanMoveText(const string& moves) {
	string mv = moves;
	re2::RE2::GlobalReplace(&mv, commentRe, "");
	re2::RE2::GlobalReplace(&mv, spaceRe, " ");
	mv = trim(mv);

	size_t lastSpace = mv.find_last_of(' ');
	string last = lastSpace == string::npos ? mv : mv.substr(lastSpace+1);
	for (auto& res: TRAILING_RESULTS) {
		if (last == res) {
			mv = lastSpace == string::npos ? "" : trim(mv.substr(0, lastSpace));
			break;
		}
	}
	return mv;
}

ParsedGame GameParser::parse(const string& game) {
	ParsedGame pg;
	string nonHeader;
	bool haveNonHeader = false;
	bool seenHeader = false;
	size_t movesStart = string::npos;

	size_t offset = 0;
	while (offset <= game.size()) {
		size_t nl = game.find('\n', offset);
		size_t lineEnd = nl == string::npos ? game.size() : nl;
		string line = game.substr(offset, lineEnd - offset);
		if (!line.empty() && line.back() == '\r') line.pop_back();

		if (!line.empty() && line[0] == '[') {
			seenHeader = true;
			string name, value;
			if (re2::RE2::FullMatch(line, tagRe, &name, &value)) {
				if (name != MOVES_FIELD && name != GAME_ID_FIELD) {
					pg.setTag(name, unescape(value));
				}
			}
		} else {
			if (seenHeader && movesStart == string::npos && trim(line).empty()) {
				movesStart = nl == string::npos ? game.size() : nl + 1;
			}
			if (haveNonHeader) nonHeader += '\n';
			nonHeader += line;
			haveNonHeader = true;
		}

		if (nl == string::npos) break;
		offset = nl + 1;
	}

	if (pg.tags.empty()) {
		throw MalformedGameError("no header tags in game starting with '" + game.substr(0, 40) + "'");
	}

	if (movesStart != string::npos) {
		pg.moves = trim(game.substr(movesStart));
	} else {
		pg.moves = trim(nonHeader);
	}
	if (cleanMoves) pg.moves = cleanMoveText(pg.moves);

	pg.gameId = ids.nextId();
	return pg;
}
