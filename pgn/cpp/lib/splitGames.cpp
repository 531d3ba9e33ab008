#include "splitGames.h"
#include <algorithm>

GameSplitter::GameSplitter()
	: pos(0), gameStart(0), state(ScanState::SEEK_START), finished(false), nDropped(0) {}

void GameSplitter::feed(const std::string& text) {
	size_t cut = state == ScanState::SEEK_START ? pos : gameStart;
	buf.erase(0, cut);
	pos -= cut;
	gameStart = state == ScanState::SEEK_START ? 0 : gameStart - cut;
	buf.append(text);
}

void GameSplitter::finish() {
	finished = true;
}

int64_t GameSplitter::droppedPartial() {
	return nDropped;
}

bool GameSplitter::atTokenBoundary(size_t idx) {
	if (idx == 0) return true;
	char prev = buf[idx-1];
	return prev == ' ' || prev == '\t' || prev == '\n' || prev == '\r';
}

// 1: result token at pos ending a line, end set past the token
// 0: no result token at pos
// -1: undecided until more text arrives
int GameSplitter::matchResult(size_t& end) {
	bool needMore = false;
	size_t avail = buf.size() - pos;
	for (auto& tok: RESULT_TOKENS) {
		if (avail < tok.size()) {
			if (!finished && buf.compare(pos, avail, tok, 0, avail) == 0) needMore = true;
			continue;
		}
		if (buf.compare(pos, tok.size(), tok) != 0) continue;

		size_t i = pos + tok.size();
		while (i < buf.size() && (buf[i] == ' ' || buf[i] == '\t')) i++;
		if (i == buf.size()) {
			if (!finished) {
				needMore = true;
				continue;
			}
		} else if (buf[i] != '\n' && buf[i] != '\r') {
			continue;
		}
		end = pos + tok.size();
		return 1;
	}
	return needMore ? -1 : 0;
}

bool GameSplitter::waitOrDrop() {
	if (!finished) return false;
	if (state != ScanState::SEEK_START) nDropped++;
	buf.clear();
	pos = 0;
	gameStart = 0;
	state = ScanState::SEEK_START;
	return false;
}

bool GameSplitter::next(std::string& game) {
	while (true) {
		switch (state) {
		case ScanState::SEEK_START: {
			size_t idx = buf.find(GAME_START, pos);
			if (idx == std::string::npos) {
				size_t keep = std::min(buf.size(), GAME_START.size() - 1);
				pos = std::max(pos, buf.size() - keep);
				return waitOrDrop();
			}
			gameStart = idx;
			pos = idx;
			state = ScanState::HEADER_LINE;
			break;
		}
		case ScanState::HEADER_LINE: {
			size_t nl = buf.find('\n', pos);
			if (nl == std::string::npos) {
				pos = buf.size();
				return waitOrDrop();
			}
			pos = nl + 1;
			state = ScanState::LINE_START;
			break;
		}
		case ScanState::LINE_START:
			if (pos == buf.size()) return waitOrDrop();
			state = buf[pos] == '[' ? ScanState::HEADER_LINE : ScanState::MOVES;
			break;
		case ScanState::MOVES: {
			if (pos == buf.size()) return waitOrDrop();
			char c = buf[pos];
			if (c == '{') {
				state = ScanState::BRACE_COMMENT;
			} else if (c == ';') {
				state = ScanState::LINE_COMMENT;
			} else if (c == '\n') {
				state = ScanState::LINE_START;
			} else if (atTokenBoundary(pos)) {
				size_t end;
				int m = matchResult(end);
				if (m < 0) return false;
				if (m > 0) {
					game = buf.substr(gameStart, end - gameStart);
					pos = end;
					state = ScanState::SEEK_START;
					return true;
				}
			}
			pos++;
			break;
		}
		case ScanState::BRACE_COMMENT: {
			size_t close = buf.find('}', pos);
			if (close == std::string::npos) {
				pos = buf.size();
				return waitOrDrop();
			}
			pos = close + 1;
			state = ScanState::MOVES;
			break;
		}
		case ScanState::LINE_COMMENT: {
			size_t nl = buf.find('\n', pos);
			if (nl == std::string::npos) {
				pos = buf.size();
				return waitOrDrop();
			}
			pos = nl + 1;
			state = ScanState::LINE_START;
			break;
		}
		}
	}
}

std::vector<std::string> splitGames(const std::string& text) {
	GameSplitter splitter;
	splitter.feed(text);
	splitter.finish();

	std::vector<std::string> games;
	std::string game;
	while (splitter.next(game)) {
		games.push_back(game);
	}
	return games;
}
