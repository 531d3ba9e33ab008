#include <gtest/gtest.h>
#include "lib/decompress.h"
#include "lib/errors.h"
#include "testUtils.h"
#include <sstream>

static std::string drain(DecompressStream& decompressor) {
	std::string all;
	std::string text;
	while (decompressor.decompressChunk() != 0) {
		decompressor.getOutput(text);
		all += text;
	}
	return all;
}

static std::string sampleText(int ngames) {
	std::string text;
	for (int i = 0; i < ngames; i++) {
		text += "[Event \"Rated Blitz game " + std::to_string(i) + "\"]\n[Site \"https://lichess.org\"]\n\n";
		text += "1. e4 e5 2. Nf3 Nc6 3. Bb5 a6 { [%clk 0:03:00] } 1-0\n\n";
	}
	return text;
}

TEST(DecompressTest, SingleFrameRoundTrip) {
	TempDir dir;
	std::string text = sampleText(50);
	writeFile(dir.path / "games.pgn.zst", compressZst(text));

	DecompressStream decompressor(dir.str("games.pgn.zst"));
	EXPECT_EQ(drain(decompressor), text);
	EXPECT_FLOAT_EQ(decompressor.getProgress(), 1.0f);
}

TEST(DecompressTest, MultiFrameIsOneStream) {
	TempDir dir;
	std::string first = sampleText(10);
	std::string second = "[Event \"second frame\"]\n\n1. d4 d5 0-1\n";
	writeFile(dir.path / "multi.zst", compressZst(first) + compressZst(second, 19));

	DecompressStream decompressor(dir.str("multi.zst"));
	EXPECT_EQ(drain(decompressor), first + second);
}

TEST(DecompressTest, SkippableFrameIsIgnored) {
	TempDir dir;
	std::string text = sampleText(3);
	std::string skippable("\x50\x2a\x4d\x18\x04\x00\x00\x00meta", 12);
	writeFile(dir.path / "skip.zst", skippable + compressZst(text));

	DecompressStream decompressor(dir.str("skip.zst"));
	EXPECT_EQ(drain(decompressor), text);
}

TEST(DecompressTest, TinyChunksDecodeEverything) {
	TempDir dir;
	std::string text = sampleText(200);
	writeFile(dir.path / "tiny.zst", compressZst(text) + compressZst(text));

	DecompressStream decompressor(dir.str("tiny.zst"), 7);
	EXPECT_EQ(drain(decompressor), text + text);
}

TEST(DecompressTest, ReadsFromStream) {
	std::string text = sampleText(5);
	auto source = std::make_unique<std::istringstream>(compressZst(text));
	DecompressStream decompressor(std::move(source));
	EXPECT_EQ(drain(decompressor), text);
}

TEST(DecompressTest, RejectsPlainText) {
	TempDir dir;
	writeFile(dir.path / "plain.zst", sampleText(1));
	EXPECT_THROW(DecompressStream(dir.str("plain.zst")), InvalidInputFormat);
}

TEST(DecompressTest, RejectsEmptyArchive) {
	TempDir dir;
	writeFile(dir.path / "empty.zst", "");
	EXPECT_THROW(DecompressStream(dir.str("empty.zst")), InvalidInputFormat);
}

TEST(DecompressTest, RejectsWrongSuffix) {
	TempDir dir;
	writeFile(dir.path / "games.pgn", compressZst(sampleText(1)));
	EXPECT_THROW(DecompressStream(dir.str("games.pgn")), InvalidInputFormat);
	EXPECT_THROW(DecompressStream(dir.str("missing.zst")), InvalidInputFormat);
}

TEST(DecompressTest, TruncatedArchiveFails) {
	TempDir dir;
	std::string compressed = compressZst(sampleText(100));
	writeFile(dir.path / "cut.zst", compressed.substr(0, compressed.size() / 2));

	DecompressStream decompressor(dir.str("cut.zst"));
	EXPECT_THROW(drain(decompressor), DecompressionError);
}

TEST(DecompressTest, CorruptFrameHeaderFails) {
	TempDir dir;
	std::string bad("\x28\xb5\x2f\xfd", 4);
	bad += std::string(64, '\xff');
	writeFile(dir.path / "bad.zst", bad);

	DecompressStream decompressor(dir.str("bad.zst"));
	EXPECT_THROW(drain(decompressor), DecompressionError);
}

TEST(DecompressTest, DecompressFileWritesPgn) {
	TempDir dir;
	std::string text = sampleText(20);
	writeFile(dir.path / "games.pgn.zst", compressZst(text));

	uintmax_t n = decompressFile(dir.str("games.pgn.zst"), dir.str("games.pgn"));
	EXPECT_EQ(n, text.size());
	EXPECT_EQ(readFile(dir.path / "games.pgn"), text);
}
