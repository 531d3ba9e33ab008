#include "manifest.h"
#include "errors.h"
#include <filesystem>

namespace fs = std::filesystem;

ManifestMode parseManifestMode(const std::string& mode) {
	if (mode == "final") return ManifestMode::FINAL;
	if (mode == "incremental") return ManifestMode::INCREMENTAL;
	throw std::invalid_argument("unknown manifest mode '" + mode + "' (expected final or incremental)");
}

ManifestWriter::ManifestWriter(std::string outdir, ManifestMode mode)
	: path(outdir + "/" + MANIFEST_NAME), partialPath(path + PARTIAL_SUFFIX), mode(mode), closed(false) {
	std::error_code ec;
	fs::remove(path, ec);
	if (ec) throw RecordIOError("cannot remove stale manifest " + path + ": " + ec.message());
	fs::remove(partialPath, ec);
	if (ec) throw RecordIOError("cannot remove stale manifest " + partialPath + ": " + ec.message());

	if (mode == ManifestMode::INCREMENTAL) {
		partial.open(partialPath, std::ios::trunc);
		if (!partial.good()) throw RecordIOError("cannot open " + partialPath);
	}
}

void ManifestWriter::add(const std::string& gameId) {
	std::lock_guard<std::mutex> lock(mtx);
	if (closed) throw RecordIOError("manifest " + path + " is already closed");
	if (!seen.insert(gameId).second) throw DuplicateIdentifierError(gameId);

	if (mode == ManifestMode::INCREMENTAL) {
		partial << gameId << '\n';
		partial.flush();
		if (!partial.good()) throw RecordIOError("write failed on " + partialPath);
	} else {
		ids.push_back(gameId);
	}
}

void ManifestWriter::commit() {
	std::lock_guard<std::mutex> lock(mtx);
	if (closed) throw RecordIOError("manifest " + path + " is already closed");
	closed = true;

	if (mode == ManifestMode::FINAL) {
		partial.open(partialPath, std::ios::trunc);
		if (!partial.good()) throw RecordIOError("cannot open " + partialPath);
		for (auto& id: ids) {
			partial << id << '\n';
		}
	}
	partial.close();
	if (partial.fail()) throw RecordIOError("write failed on " + partialPath);

	std::error_code ec;
	fs::rename(partialPath, path, ec);
	if (ec) throw RecordIOError("cannot rename " + partialPath + " to " + path + ": " + ec.message());
}

void ManifestWriter::abandon() {
	std::lock_guard<std::mutex> lock(mtx);
	if (closed) return;
	closed = true;
	if (partial.is_open()) partial.close();
}

size_t ManifestWriter::size() {
	std::lock_guard<std::mutex> lock(mtx);
	return seen.size();
}

std::string ManifestWriter::getPath() {
	return path;
}

std::vector<std::string> readManifest(const std::string& path) {
	std::ifstream infile(path);
	if (!infile.good()) throw RecordIOError("cannot open manifest " + path);
	std::vector<std::string> ids;
	std::string line;
	while (std::getline(infile, line)) {
		if (!line.empty()) ids.push_back(line);
	}
	return ids;
}
