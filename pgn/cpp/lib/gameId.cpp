#include "gameId.h"
#include <cctype>
#include <random>

static std::mt19937_64 seededEngine() {
	std::random_device rd;
	std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
	return std::mt19937_64(seq);
}

static thread_local std::mt19937_64 idGen = seededEngine();

std::string formatUuid(uint64_t hi, uint64_t lo) {
	static const char HEX[] = "0123456789abcdef";
	std::string id;
	id.reserve(GAME_ID_LENGTH);
	for (int i = 0; i < 32; i++) {
		if (i == 8 || i == 12 || i == 16 || i == 20) id += '-';
		uint64_t word = i < 16 ? hi : lo;
		int shift = 60 - 4*(i % 16);
		id += HEX[(word >> shift) & 0xf];
	}
	return id;
}

std::string RandomIdSource::nextId() {
	uint64_t hi = idGen();
	uint64_t lo = idGen();
	hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
	lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
	return formatUuid(hi, lo);
}

std::string SequentialIdSource::nextId() {
	uint64_t n = counter.fetch_add(1);
	return formatUuid(0x0000000000004000ULL, 0x8000000000000000ULL | (n & 0x3fffffffffffffffULL));
}

bool isCanonicalId(const std::string& id) {
	if (id.size() != GAME_ID_LENGTH) return false;
	for (size_t i = 0; i < id.size(); i++) {
		if (i == 8 || i == 13 || i == 18 || i == 23) {
			if (id[i] != '-') return false;
		} else if (!std::isxdigit((unsigned char)id[i])) {
			return false;
		}
	}
	return true;
}
