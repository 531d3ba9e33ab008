#ifndef PGNREC_DECOMPRESS_H
#define PGNREC_DECOMPRESS_H
#include "zstd.h"
#include <istream>
#include <memory>
#include <string>
#include <vector>

const size_t DEFAULT_CHUNK_SIZE = 16*1024;

/*
 * Streams a zstd archive (one or more frames) as a single run of text.
 * Each call to decompressChunk reads at most chunkSize compressed bytes and
 * decodes all of them before returning.
 */
class DecompressStream {
	ZSTD_DCtx* dctx;
	ZSTD_inBuffer in;
	ZSTD_outBuffer out;
	std::vector<char> inMem;
	std::vector<char> outMem;
	std::unique_ptr<std::istream> infile;
	std::string decoded;
	size_t zstdRet;
	size_t chunkSize;
	uintmax_t bytesRead;
	uintmax_t totalBytes;
	std::string magic;

	void init();
	void checkMagic();
public:
	DecompressStream(std::string zstfn, size_t chunkSize=DEFAULT_CHUNK_SIZE);
	DecompressStream(std::unique_ptr<std::istream> source, size_t chunkSize=DEFAULT_CHUNK_SIZE);
	~DecompressStream();
	DecompressStream(const DecompressStream&) = delete;
	DecompressStream& operator=(const DecompressStream&) = delete;

	// returns the number of compressed bytes consumed, 0 at end of input
	std::streamsize decompressChunk();
	void getOutput(std::string& text);
	size_t getChunkSize();
	uintmax_t getBytesRead();
	float getProgress();
};

void checkArchivePath(const std::string& zstfn);
uintmax_t decompressFile(std::string zstfn, std::string outfn, size_t chunkSize=DEFAULT_CHUNK_SIZE);

#endif
