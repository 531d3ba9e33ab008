#ifndef PGNREC_PARALLEL_PARSER_H
#define PGNREC_PARALLEL_PARSER_H
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "parser.h"
#include "lib/gameId.h"
#include "lib/recordWriter.h"

struct GameData {
	std::string info;
	std::string game;
	float progress;
	GameData(std::string info): info(info), progress(0.0f) {};
	GameData(std::string info, std::string game, float progress): info(info), game(game), progress(progress) {};
};

struct RecordData {
	std::string info;
	std::string gameId;
	std::string message;
	float progress;
	int64_t count;
	std::exception_ptr err;
	RecordData(std::string info): info(info), progress(0.0f), count(0) {};
	RecordData(std::string info, std::string gameId, float progress)
		: info(info), gameId(gameId), progress(progress), count(0) {};
	RecordData(std::exception_ptr err): info("ERROR"), progress(0.0f), count(0), err(err) {};
};

struct PipelineState {
	std::queue<std::shared_ptr<GameData> > gamesQ;
	std::queue<std::shared_ptr<RecordData> > outputQ;
	std::mutex gamesMtx;
	std::mutex outputMtx;
	std::condition_variable gamesCv;
	std::condition_variable spaceCv;
	std::condition_variable outputCv;
	size_t queueCapacity;
	std::atomic<bool> aborted;
	// set by the reader before the first game is queued, read-only afterwards
	std::shared_ptr<const RecordWriter> writer;
	PipelineState(size_t queueCapacity): queueCapacity(queueCapacity), aborted(false) {};
	void push(std::shared_ptr<RecordData> rd);
	void abort();
};

/*
 * One reader thread decompresses and splits the archive into a bounded
 * queue; nWorkers threads parse and write records; the calling thread
 * collects ids into the manifest. The reader handles the first game itself so
 * the schema is fixed before any worker sees a game.
 */
class ParallelParser {
	int nWorkers;
	size_t queueCapacity;
	std::vector<std::shared_ptr<std::thread> > workerThreads;
	std::shared_ptr<std::thread> readerThread;
	void join();
public:
	ParallelParser(int nWorkers, size_t queueCapacity=1024);
	~ParallelParser();
	std::shared_ptr<RunOutput> parse(const RunConfig& cfg, IdSource& ids);
};

#endif
