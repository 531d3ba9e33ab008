#include <iostream>
#include <string>
#include <vector>
#include "lib/errors.h"
#include "lib/recordWriter.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

ABSL_FLAG(bool, schema, false, "also print the schema embedded in each record");

int main(int argc, char *argv[]) {
	absl::SetProgramUsageMessage("Print the fields of one or more game record files: recordInfo [--schema] <file>...");
	std::vector<char*> args = absl::ParseCommandLine(argc, argv);
	if (args.size() < 2) {
		std::cerr << "usage: recordInfo [--schema] <record file>..." << std::endl;
		return 1;
	}
	int status = 0;
	for (size_t i = 1; i < args.size(); i++) {
		std::string path = args[i];
		try {
			pgnrec::GameRecord record = readRecord(path);
			std::cout << path << std::endl;
			if (absl::GetFlag(FLAGS_schema)) {
				std::cout << "  schema " << record.schema().ns() << "." << record.schema().name() << std::endl;
				for (auto& f: record.schema().fields()) {
					std::cout << "    " << f.name() << ": " << f.type() << std::endl;
				}
			}
			for (auto& [name, value]: recordFields(record)) {
				std::cout << "  " << name << " = " << value << std::endl;
			}
		} catch (PipelineError& e) {
			std::cerr << "error: " << e.what() << std::endl;
			status = 1;
		}
	}
	return status;
}
