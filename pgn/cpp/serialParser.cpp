#include "serialParser.h"
#include "lib/decompress.h"
#include "lib/errors.h"
#include "lib/parseGame.h"
#include "lib/recordWriter.h"
#include "lib/splitGames.h"
#include "profiling/profiler.h"
#include "utils/utils.h"
#include <iostream>

std::shared_ptr<RunOutput> processSerial(const RunConfig& cfg, IdSource& ids) {

	DecompressStream decompressor(cfg.zst, cfg.chunkSize);
	prepareOutdir(cfg.outdir);
	ManifestWriter manifest(cfg.outdir, cfg.manifestMode);

	GameSplitter splitter;
	GameParser parser(ids, cfg.cleanMoves);
	std::unique_ptr<RecordWriter> writer;
	auto output = std::make_shared<RunOutput>();
	output->manifest = manifest.getPath();

	profiler.init("decompress");
	profiler.init("split");
	profiler.init("parse");
	profiler.init("serialize");

	auto start = hrc::now();
	auto lastPrintTime = start;
	int64_t nGamesLastUpdate = 0;
	try {
		std::ofstream pgnCopy;
		openPgnCopy(cfg, pgnCopy);

		std::string text;
		std::string game;
		bool more = true;
		while (more) {
			profiler.start("decompress");
			more = decompressor.decompressChunk() != 0;
			profiler.stop("decompress");
			if (more) {
				decompressor.getOutput(text);
				writePgnCopy(pgnCopy, text, cfg);
				splitter.feed(text);
			} else {
				splitter.finish();
			}

			while (true) {
				profiler.start("split");
				bool found = splitter.next(game);
				profiler.stop("split");
				if (!found) break;

				ParsedGame pg;
				profiler.start("parse");
				try {
					pg = parser.parse(game);
				} catch (MalformedGameError& e) {
					profiler.stop("parse");
					if (!writer) {
						throw MalformedGameError(std::string("first game blocks schema inference (") + e.what() + ")");
					}
					if (!cfg.skipMalformed) throw;
					std::cerr << "skipping " << e.what() << std::endl;
					output->nskipped++;
					continue;
				}
				profiler.stop("parse");

				if (!writer) {
					output->schema = inferSchema(pg);
					writer = std::make_unique<RecordWriter>(cfg.outdir, output->schema, cfg.syncEachRecord);
				}
				profiler.start("serialize");
				writer->write(pg);
				profiler.stop("serialize");
				manifest.add(pg.gameId);
				output->ngames++;

				printStatus(cfg, output->ngames, decompressor.getProgress(), start, lastPrintTime, nGamesLastUpdate);
			}
		}
		if (!writer) throw EmptySchemaError();
		output->ndropped = splitter.droppedPartial();
		if (output->ndropped > 0) {
			std::cerr << "dropped " << output->ndropped << " unterminated game at end of archive" << std::endl;
		}
		finishRun(cfg, output->schema, manifest);
	} catch (...) {
		manifest.abandon();
		throw;
	}
	return output;
}
