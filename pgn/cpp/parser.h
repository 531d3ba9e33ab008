#ifndef PGNREC_PARSER_H
#define PGNREC_PARSER_H
#include "lib/decompress.h"
#include "lib/manifest.h"
#include "lib/schema.h"
#include "utils/utils.h"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

const std::string SCHEMA_FILE = "schema.json";

struct RunConfig {
	std::string zst;
	std::string name;
	std::string outdir;
	size_t chunkSize;
	int printFreq;
	ManifestMode manifestMode;
	bool skipMalformed;
	bool cleanMoves;
	bool syncEachRecord;
	std::string pgnOut;
	RunConfig()
		: outdir("."), chunkSize(DEFAULT_CHUNK_SIZE), printFreq(60), manifestMode(ManifestMode::FINAL),
		skipMalformed(false), cleanMoves(false), syncEachRecord(false) {};
};

struct RunOutput {
	int64_t ngames;
	int64_t nskipped;
	int64_t ndropped;
	Schema schema;
	std::string manifest;
	RunOutput(): ngames(0), nskipped(0), ndropped(0) {};
};

// creates outdir and removes a schema.json left by an earlier run
void prepareOutdir(const std::string& outdir);
void openPgnCopy(const RunConfig& cfg, std::ofstream& pgnCopy);
void writePgnCopy(std::ofstream& pgnCopy, const std::string& text, const RunConfig& cfg);
// writes schema.json, then moves the manifest into place
void finishRun(const RunConfig& cfg, const Schema& schema, ManifestWriter& manifest);
void printStatus(const RunConfig& cfg, int64_t ngames, float progress, tp& start, tp& lastPrintTime, int64_t& nGamesLastUpdate);

#endif
