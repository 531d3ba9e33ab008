#include "parallelParser.h"
#include "lib/decompress.h"
#include "lib/errors.h"
#include "lib/parseGame.h"
#include "lib/splitGames.h"
#include "utils/utils.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

void PipelineState::push(std::shared_ptr<RecordData> rd) {
	{
		std::lock_guard<std::mutex> lock(outputMtx);
		outputQ.push(rd);
	}
	outputCv.notify_one();
}

void PipelineState::abort() {
	{
		std::lock_guard<std::mutex> lock(gamesMtx);
		aborted = true;
	}
	spaceCv.notify_all();
	gamesCv.notify_all();
}

void loadGamesZst(
		std::shared_ptr<PipelineState> ps,
		std::shared_ptr<DecompressStream> decompressor,
		GameParser* parser,
		const RunConfig cfg,
		int nWorkers) {
	int64_t nDropped = 0;
	try {
		std::ofstream pgnCopy;
		openPgnCopy(cfg, pgnCopy);

		GameSplitter splitter;
		std::string text;
		std::string game;
		bool more = true;
		while (more && !ps->aborted) {
			more = decompressor->decompressChunk() != 0;
			if (more) {
				decompressor->getOutput(text);
				writePgnCopy(pgnCopy, text, cfg);
				splitter.feed(text);
			} else {
				splitter.finish();
			}

			while (!ps->aborted && splitter.next(game)) {
				float progress = decompressor->getProgress();
				if (!ps->writer) {
					ParsedGame pg;
					try {
						pg = parser->parse(game);
					} catch (MalformedGameError& e) {
						throw MalformedGameError(std::string("first game blocks schema inference (") + e.what() + ")");
					}
					auto writer = std::make_shared<const RecordWriter>(cfg.outdir, inferSchema(pg), cfg.syncEachRecord);
					writer->write(pg);
					{
						std::lock_guard<std::mutex> lock(ps->gamesMtx);
						ps->writer = writer;
					}
					ps->push(std::make_shared<RecordData>("RECORD", pg.gameId, progress));
					continue;
				}

				std::unique_lock<std::mutex> lock(ps->gamesMtx);
				ps->spaceCv.wait(lock, [&]{ return ps->gamesQ.size() < ps->queueCapacity || ps->aborted; });
				if (ps->aborted) break;
				ps->gamesQ.push(std::make_shared<GameData>("GAME", game, progress));
				lock.unlock();
				ps->gamesCv.notify_one();
			}
		}
		if (!ps->aborted && !ps->writer) throw EmptySchemaError();
		nDropped = splitter.droppedPartial();
	} catch (std::exception& e) {
		ps->push(std::make_shared<RecordData>(std::current_exception()));
	}

	auto done = std::make_shared<RecordData>("READER_DONE");
	done->count = nDropped;
	ps->push(done);
	{
		std::lock_guard<std::mutex> lock(ps->gamesMtx);
		for (int i=0; i<nWorkers; i++) {
			ps->gamesQ.push(std::make_shared<GameData>("FILE_DONE"));
		}
	}
	ps->gamesCv.notify_all();
}

void processGames(std::shared_ptr<PipelineState> ps, GameParser* parser, bool skipMalformed) {
	while(true) {
		std::shared_ptr<GameData> gd;
		{
			std::unique_lock<std::mutex> lock(ps->gamesMtx);
			ps->gamesCv.wait(lock, [&]{return !ps->gamesQ.empty();});
			gd = ps->gamesQ.front();
			ps->gamesQ.pop();
		}
		ps->spaceCv.notify_one();

		if (gd->info == "FILE_DONE") {
			ps->push(std::make_shared<RecordData>("DONE"));
			break;
		}
		if (ps->aborted) continue;

		try {
			ParsedGame pg = parser->parse(gd->game);
			ps->writer->write(pg);
			ps->push(std::make_shared<RecordData>("RECORD", pg.gameId, gd->progress));
		} catch (MalformedGameError& e) {
			if (skipMalformed) {
				auto rd = std::make_shared<RecordData>("SKIPPED");
				rd->message = e.what();
				ps->push(rd);
			} else {
				ps->push(std::make_shared<RecordData>(std::current_exception()));
			}
		} catch (std::exception& e) {
			ps->push(std::make_shared<RecordData>(std::current_exception()));
		}
	}
}

ParallelParser::ParallelParser(int nWorkers, size_t queueCapacity)
	: nWorkers(std::max(nWorkers, 1)), queueCapacity(std::max(queueCapacity, size_t(1))) {};

ParallelParser::~ParallelParser() {
	join();
}

void ParallelParser::join() {
	if (readerThread && readerThread->joinable()) readerThread->join();
	for (auto wt: workerThreads) {
		if (wt->joinable()) wt->join();
	}
	readerThread.reset();
	workerThreads.clear();
}

std::shared_ptr<RunOutput> ParallelParser::parse(const RunConfig& cfg, IdSource& ids) {
	auto decompressor = std::make_shared<DecompressStream>(cfg.zst, cfg.chunkSize);
	prepareOutdir(cfg.outdir);
	ManifestWriter manifest(cfg.outdir, cfg.manifestMode);

	auto output = std::make_shared<RunOutput>();
	output->manifest = manifest.getPath();
	auto ps = std::make_shared<PipelineState>(queueCapacity);
	GameParser parser(ids, cfg.cleanMoves);

	for (int i=0; i<nWorkers; i++) {
		workerThreads.push_back(std::make_shared<std::thread>(processGames, ps, &parser, cfg.skipMalformed));
	}
	readerThread = std::make_shared<std::thread>(loadGamesZst, ps, decompressor, &parser, cfg, nWorkers);

	std::exception_ptr err;
	int nFinished = 0;
	bool readerDone = false;
	auto start = hrc::now();
	auto lastPrintTime = start;
	int64_t nGamesLastUpdate = 0;
	while (nFinished < nWorkers || !readerDone) {
		std::shared_ptr<RecordData> rd;
		{
			std::unique_lock<std::mutex> lock(ps->outputMtx);
			ps->outputCv.wait(lock, [&]{return !ps->outputQ.empty();});
			rd = ps->outputQ.front();
			ps->outputQ.pop();
		}
		if (rd->info == "DONE") {
			nFinished++;
		} else if (rd->info == "READER_DONE") {
			readerDone = true;
			output->ndropped = rd->count;
		} else if (rd->info == "ERROR") {
			if (!err) {
				err = rd->err;
				ps->abort();
			}
		} else if (rd->info == "SKIPPED") {
			std::cerr << "skipping " << rd->message << std::endl;
			output->nskipped++;
		} else if (rd->info == "RECORD") {
			if (err) continue;
			try {
				manifest.add(rd->gameId);
			} catch (std::exception& e) {
				err = std::current_exception();
				ps->abort();
				continue;
			}
			output->ngames++;
			printStatus(cfg, output->ngames, rd->progress, start, lastPrintTime, nGamesLastUpdate);
		} else if (!err) {
			err = std::make_exception_ptr(std::runtime_error("invalid code: " + rd->info));
			ps->abort();
		}
	}
	join();

	if (err) {
		manifest.abandon();
		std::rethrow_exception(err);
	}
	if (output->ndropped > 0) {
		std::cerr << "dropped " << output->ndropped << " unterminated game at end of archive" << std::endl;
	}
	try {
		output->schema = ps->writer->getSchema();
		finishRun(cfg, output->schema, manifest);
	} catch (...) {
		manifest.abandon();
		throw;
	}
	return output;
}
