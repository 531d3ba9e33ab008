#include "parser.h"
#include "lib/errors.h"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

void prepareOutdir(const std::string& outdir) {
	std::error_code ec;
	fs::create_directories(outdir, ec);
	if (ec) throw RecordIOError("cannot create output directory " + outdir + ": " + ec.message());
	// schema.json only describes the run that wrote it
	std::string schemaPath = outdir + "/" + SCHEMA_FILE;
	fs::remove(schemaPath, ec);
	if (ec) throw RecordIOError("cannot remove stale schema " + schemaPath + ": " + ec.message());
}

void openPgnCopy(const RunConfig& cfg, std::ofstream& pgnCopy) {
	if (cfg.pgnOut.empty()) return;
	pgnCopy.open(cfg.pgnOut, std::ios::binary | std::ios::trunc);
	if (!pgnCopy.good()) throw RecordIOError("cannot open " + cfg.pgnOut + " for writing");
}

void writePgnCopy(std::ofstream& pgnCopy, const std::string& text, const RunConfig& cfg) {
	if (!pgnCopy.is_open()) return;
	pgnCopy.write(text.data(), text.size());
	if (!pgnCopy.good()) throw RecordIOError("write failed on " + cfg.pgnOut);
}

void finishRun(const RunConfig& cfg, const Schema& schema, ManifestWriter& manifest) {
	std::string schemaPath = cfg.outdir + "/" + SCHEMA_FILE;
	std::ofstream schemaFile(schemaPath, std::ios::trunc);
	schemaFile << schema.toJson() << std::endl;
	schemaFile.close();
	if (schemaFile.fail()) throw RecordIOError("write failed on " + schemaPath);
	manifest.commit();
}

void printStatus(const RunConfig& cfg, int64_t ngames, float progress, tp& start, tp& lastPrintTime, int64_t& nGamesLastUpdate) {
	if (!ellapsedGTE(lastPrintTime, cfg.printFreq)) return;

	int64_t totalGamesEst = progress > 0 ? int64_t(ngames / progress) : 0;
	auto [eta, now] = getEta(totalGamesEst, ngames, start);
	long ellapsed = std::chrono::duration_cast<milli>(now-lastPrintTime).count();
	long gamesPerSec = ellapsed > 0 ? 1000*(ngames-nGamesLastUpdate)/ellapsed : 0;
	std::string status = cfg.name + ": wrote " + std::to_string(ngames) + \
						 " games (" + std::to_string(int(100*progress)) + \
						 "% done, games/sec: " + std::to_string(gamesPerSec) + \
						 ", eta: " + eta + ")";
	std::cout << status << std::endl;

	nGamesLastUpdate = ngames;
	lastPrintTime = now;
}
