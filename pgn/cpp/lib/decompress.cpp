#include "decompress.h"
#include "errors.h"
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

void checkArchivePath(const std::string& zstfn) {
	fs::path p(zstfn);
	if (p.extension() != ".zst") {
		throw InvalidInputFormat(zstfn + " is not a .zst archive");
	}
	if (!fs::is_regular_file(p)) {
		throw InvalidInputFormat(zstfn + " does not exist or is not a file");
	}
}

DecompressStream::DecompressStream(std::string zstfn, size_t chunkSize)
	: dctx(nullptr), zstdRet(0), chunkSize(chunkSize), bytesRead(0), totalBytes(0) {
	checkArchivePath(zstfn);
	infile = std::make_unique<std::ifstream>(zstfn, std::ios::binary);
	if (!infile->good()) throw InvalidInputFormat("cannot open " + zstfn);
	totalBytes = fs::file_size(zstfn);
	init();
}

DecompressStream::DecompressStream(std::unique_ptr<std::istream> source, size_t chunkSize)
	: dctx(nullptr), infile(std::move(source)), zstdRet(0), chunkSize(chunkSize), bytesRead(0), totalBytes(0) {
	if (!infile || !infile->good()) throw InvalidInputFormat("compressed source is not readable");
	init();
}

void DecompressStream::init() {
	if (chunkSize < 4) chunkSize = 4;
	inMem.resize(chunkSize);
	outMem.resize(ZSTD_DStreamOutSize());
	in = {inMem.data(), 0, 0};
	out = {outMem.data(), outMem.size(), 0};

	checkMagic();
	dctx = ZSTD_createDCtx();
	if (dctx == nullptr) throw DecompressionError("ZSTD_createDCtx failed");
}

DecompressStream::~DecompressStream() {
	ZSTD_freeDCtx(dctx);
}

void DecompressStream::checkMagic() {
	char buf[4];
	infile->read(buf, 4);
	if (infile->gcount() < 4) {
		throw InvalidInputFormat("archive is empty or shorter than a zstd frame header");
	}
	uint32_t m = uint32_t((unsigned char)buf[0])
		| uint32_t((unsigned char)buf[1]) << 8
		| uint32_t((unsigned char)buf[2]) << 16
		| uint32_t((unsigned char)buf[3]) << 24;
	bool isFrame = m == ZSTD_MAGICNUMBER;
	bool isSkippable = (m & ZSTD_MAGIC_SKIPPABLE_MASK) == ZSTD_MAGIC_SKIPPABLE_START;
	if (!isFrame && !isSkippable) {
		throw InvalidInputFormat("missing zstd magic number");
	}
	magic.assign(buf, 4);
}

std::streamsize DecompressStream::decompressChunk() {
	size_t offset = magic.size();
	if (offset > 0) {
		std::memcpy(inMem.data(), magic.data(), offset);
		magic.clear();
	}
	infile->read(inMem.data() + offset, chunkSize - offset);
	if (infile->bad()) throw DecompressionError("read error on compressed source");
	std::streamsize nread = infile->gcount() + offset;
	bytesRead += nread;

	if (nread == 0) {
		if (zstdRet != 0) throw DecompressionError("truncated input, last frame is incomplete");
		return 0;
	}

	in.src = inMem.data();
	in.size = nread;
	in.pos = 0;
	do {
		out.pos = 0;
		zstdRet = ZSTD_decompressStream(dctx, &out, &in);
		if (ZSTD_isError(zstdRet)) throw DecompressionError(ZSTD_getErrorName(zstdRet));
		decoded.append(outMem.data(), out.pos);
	} while (in.pos < in.size || out.pos == out.size);

	return nread;
}

void DecompressStream::getOutput(std::string& text) {
	text.swap(decoded);
	decoded.clear();
}

size_t DecompressStream::getChunkSize() {
	return chunkSize;
}

uintmax_t DecompressStream::getBytesRead() {
	return bytesRead;
}

float DecompressStream::getProgress() {
	if (totalBytes == 0) return 0.0f;
	return float(bytesRead) / totalBytes;
}

uintmax_t decompressFile(std::string zstfn, std::string outfn, size_t chunkSize) {
	DecompressStream decompressor(zstfn, chunkSize);
	std::ofstream outfile(outfn, std::ios::binary | std::ios::trunc);
	if (!outfile.good()) throw RecordIOError("cannot open " + outfn + " for writing");

	uintmax_t nwritten = 0;
	std::string text;
	while (decompressor.decompressChunk() != 0) {
		decompressor.getOutput(text);
		outfile.write(text.data(), text.size());
		if (!outfile.good()) throw RecordIOError("write failed on " + outfn);
		nwritten += text.size();
	}
	outfile.close();
	if (outfile.fail()) throw RecordIOError("close failed on " + outfn);
	return nwritten;
}
