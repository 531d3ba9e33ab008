#ifndef PGNREC_UTILS_H
#define PGNREC_UTILS_H
#include <chrono>
#include <cstdint>
#include <string>
#include <tuple>

using hrc = std::chrono::high_resolution_clock;
using tp = std::chrono::time_point<std::chrono::high_resolution_clock>;
using milli = std::chrono::milliseconds;

// eta string and the time it was computed at
std::tuple<std::string, tp> getEta(uintmax_t total, uintmax_t soFar, tp& start);
bool ellapsedGTE(tp& start, int seconds);
std::string zfill(int time);
std::string getEllapsedStr(tp& start, tp& stop);
std::string getEllapsedStr(int ellapsed);

#endif
