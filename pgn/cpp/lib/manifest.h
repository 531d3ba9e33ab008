#ifndef PGNREC_MANIFEST_H
#define PGNREC_MANIFEST_H
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

const std::string MANIFEST_NAME = "games";
const std::string PARTIAL_SUFFIX = ".partial";

enum class ManifestMode {
	FINAL,
	INCREMENTAL
};

ManifestMode parseManifestMode(const std::string& mode);

/*
 * Collects the ids of every record written in a run. The manifest file only
 * appears under its final name once commit() succeeds; any manifest left in
 * the directory by an earlier run is removed at construction.
 */
class ManifestWriter {
	std::string path;
	std::string partialPath;
	ManifestMode mode;
	std::vector<std::string> ids;
	std::unordered_set<std::string> seen;
	std::ofstream partial;
	std::mutex mtx;
	bool closed;
public:
	ManifestWriter(std::string outdir, ManifestMode mode=ManifestMode::FINAL);
	void add(const std::string& gameId);
	void commit();
	void abandon();
	size_t size();
	std::string getPath();
};

std::vector<std::string> readManifest(const std::string& path);

#endif
