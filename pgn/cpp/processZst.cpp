#include <algorithm>
#include <string>
#include <iostream>
#include <chrono>
#include <thread>
#include "parallelParser.h"
#include "serialParser.h"
#include "lib/decompress.h"
#include "lib/errors.h"
#include "lib/gameId.h"
#include "lib/manifest.h"
#include "profiling/profiler.h"
#include "utils/utils.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

ABSL_FLAG(std::string, zst, "", ".zst archive to decompress and convert");
ABSL_FLAG(std::string, name, "", "human-readable name for archive");
ABSL_FLAG(std::string, outdir, ".", "output directory for record files, schema.json and the games manifest");
ABSL_FLAG(bool, serial, false, "Disable parallel processing");
ABSL_FLAG(int, printFreq, 60, "Print status every printFreq seconds");
ABSL_FLAG(int, nWorkers, std::max(1, int(std::thread::hardware_concurrency())-1), "Number of game parsers/writers for parallel processing");
ABSL_FLAG(int, queueCapacity, 1024, "Maximum number of games waiting for a worker");
ABSL_FLAG(int, chunkSize, 16384, "Bytes of compressed input read per decompression step");
ABSL_FLAG(std::string, manifestMode, "final", "final: write the manifest once at the end; incremental: append each id to games.partial as it is written");
ABSL_FLAG(bool, skipMalformed, false, "Skip (and report) games after the first that have no header tags instead of aborting");
ABSL_FLAG(bool, cleanMoves, false, "Strip comments, collapse whitespace and drop the trailing result from move text");
ABSL_FLAG(bool, fsync, false, "fsync every record file after writing it");
ABSL_FLAG(std::string, pgnOut, "", "also write the decompressed PGN text to this file");
ABSL_FLAG(bool, decompressOnly, false, "only decompress the archive to --pgnOut");

int main(int argc, char *argv[]) {
	absl::SetProgramUsageMessage("Decompress a .zst PGN archive and write one self-describing record file per game plus a manifest of game ids");
	absl::ParseCommandLine(argc, argv);
	auto start = std::chrono::high_resolution_clock::now();

	RunConfig cfg;
	cfg.zst = absl::GetFlag(FLAGS_zst);
	cfg.name = absl::GetFlag(FLAGS_name);
	if (cfg.name.empty()) cfg.name = cfg.zst;
	cfg.outdir = absl::GetFlag(FLAGS_outdir);
	cfg.chunkSize = size_t(std::max(absl::GetFlag(FLAGS_chunkSize), 4));
	cfg.printFreq = absl::GetFlag(FLAGS_printFreq);
	cfg.skipMalformed = absl::GetFlag(FLAGS_skipMalformed);
	cfg.cleanMoves = absl::GetFlag(FLAGS_cleanMoves);
	cfg.syncEachRecord = absl::GetFlag(FLAGS_fsync);
	cfg.pgnOut = absl::GetFlag(FLAGS_pgnOut);

	try {
		cfg.manifestMode = parseManifestMode(absl::GetFlag(FLAGS_manifestMode));

		if (absl::GetFlag(FLAGS_decompressOnly)) {
			if (cfg.pgnOut.empty()) {
				std::cerr << "--decompressOnly requires --pgnOut" << std::endl;
				return 1;
			}
			uintmax_t nbytes = decompressFile(cfg.zst, cfg.pgnOut, cfg.chunkSize);
			std::cout << cfg.name << ": wrote " << nbytes << " bytes to " << cfg.pgnOut << std::endl;
			return 0;
		}

		RandomIdSource ids;
		std::shared_ptr<RunOutput> res;
		if (absl::GetFlag(FLAGS_serial)) {
			res = processSerial(cfg, ids);
		} else {
			ParallelParser parser(absl::GetFlag(FLAGS_nWorkers), size_t(std::max(absl::GetFlag(FLAGS_queueCapacity), 1)));
			res = parser.parse(cfg, ids);
		}

		auto stop = std::chrono::high_resolution_clock::now();
		std::cout << cfg.name << ": wrote " << res->ngames << " records (" << res->schema.fields.size()
			<< " fields, " << res->nskipped << " skipped, " << res->ndropped << " dropped) in "
			<< getEllapsedStr(start, stop) << ", manifest " << res->manifest << std::endl;
	} catch (std::exception& e) {
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	}
	profiler.report();
	return 0;
}
