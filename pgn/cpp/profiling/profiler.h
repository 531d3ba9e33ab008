#ifndef PGNREC_PROFILER_H
#define PGNREC_PROFILER_H
#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

struct Block {
	std::chrono::time_point<std::chrono::high_resolution_clock> start;
	long total_nano;
	long count;
	Block(): total_nano(0), count(0) {};
};

// Accumulates wall time per named block. Not thread safe: only the serial
// pipeline times itself.
#ifdef PROFILE_ENABLE
class Profiler {
	std::unordered_map<std::string,Block> blocks;
	std::vector<std::string> names;
public:
	void init(std::string name) {
		if (this->blocks.find(name) != this->blocks.end()) return;
		this->names.push_back(name);
		this->blocks[name] = Block();
	}
	inline void start(const std::string& name) {
		this->blocks[name].start = std::chrono::high_resolution_clock::now();
	}
	inline void stop(const std::string& name) {
		auto stop = std::chrono::high_resolution_clock::now();
		Block& block = this->blocks[name];
		block.total_nano += std::chrono::duration_cast<std::chrono::nanoseconds>(stop-block.start).count();
		block.count++;
	}
	void report() {
		for (auto& name: this->names) {
			Block& block = this->blocks[name];
			char buf[128];
			std::snprintf(buf, sizeof(buf), "%.3f s total, %ld calls", block.total_nano/1e9, block.count);
			std::cout << name << ": " << buf << std::endl;
		}
	}
};
#else
class Profiler {
public:
	void init(std::string name) {
		return;
	}
	inline void start(const std::string& name) {
		return;
	}
	inline void stop(const std::string& name) {
		return;
	}
	void report() {
		return;
	}
};
#endif

extern Profiler profiler;

#endif
