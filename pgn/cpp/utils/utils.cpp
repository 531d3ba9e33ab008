#include "utils.h"

std::string zfill(int time) {
	std::string timeStr = std::to_string(time);
	if (timeStr.size() == 1) timeStr = "0" + timeStr;
	return timeStr;
}

std::tuple<std::string, tp> getEta(uintmax_t total, uintmax_t soFar, tp& start) {
	auto stop = hrc::now();
	if (soFar == 0 || total < soFar) {
		return std::make_tuple("tbd", stop);
	}
	long ellapsed = std::chrono::duration_cast<milli>(stop-start).count();
	long remaining_ms = (total-soFar) * ellapsed / soFar;
	return std::make_tuple(getEllapsedStr(int(remaining_ms/1e3)), stop);
}

bool ellapsedGTE(tp& start, int seconds) {
	auto now = hrc::now();
	return std::chrono::duration_cast<std::chrono::seconds>(now-start).count() >= seconds;
}

std::string getEllapsedStr(int ellapsed) {
	int hrs = ellapsed/3600;
	int minutes = (ellapsed % 3600) / 60;
	int secs = ellapsed % 60;
	return std::to_string(hrs) + ":" + zfill(minutes) + ":" + zfill(secs);
}

std::string getEllapsedStr(tp& start, tp& stop) {
	int ellapsed = std::chrono::duration_cast<std::chrono::seconds>(stop-start).count();
	return getEllapsedStr(ellapsed);
}
