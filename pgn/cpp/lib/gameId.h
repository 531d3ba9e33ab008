#ifndef PGNREC_GAME_ID_H
#define PGNREC_GAME_ID_H
#include <atomic>
#include <cstdint>
#include <string>

const size_t GAME_ID_LENGTH = 36;

class IdSource {
public:
	virtual ~IdSource() = default;
	virtual std::string nextId() = 0;
};

// Random (version 4) UUIDs. Safe to share between threads. Each thread's
// engine is seeded with 256 bits from std::random_device, but mt19937_64 is
// not a cryptographic generator: ids are unique with high probability, not
// unguessable. Duplicates that do occur are still caught by the record writer
// and the manifest.
class RandomIdSource: public IdSource {
public:
	std::string nextId() override;
};

// Deterministic UUID-shaped ids counting up from start.
class SequentialIdSource: public IdSource {
	std::atomic<uint64_t> counter;
public:
	SequentialIdSource(uint64_t start=1): counter(start) {};
	std::string nextId() override;
};

std::string formatUuid(uint64_t hi, uint64_t lo);
bool isCanonicalId(const std::string& id);

#endif
