#ifndef PGNREC_RECORD_WRITER_H
#define PGNREC_RECORD_WRITER_H
#include "parseGame.h"
#include "schema.h"
#include "gameRecord.pb.h"
#include <string>

const std::string RECORD_MAGIC = "PGNR";
const std::string RECORD_EXT = ".pb";

/*
 * Writes each game to <outdir>/<game_id>.pb. A record file holds the magic,
 * a varint32 length and one GameRecord message carrying its own schema, so
 * a single file can be read without any other output of the run.
 * write() is safe to call from several threads at once.
 */
class RecordWriter {
	std::string outdir;
	Schema schema;
	pgnrec::RecordSchema schemaMsg;
	bool syncEachRecord;
public:
	RecordWriter(std::string outdir, const Schema& schema, bool syncEachRecord=false);
	std::string write(const ParsedGame& game) const;
	std::string recordPath(const std::string& gameId) const;
	const Schema& getSchema() const { return schema; };
};

pgnrec::GameRecord readRecord(const std::string& path);
FieldList recordFields(const pgnrec::GameRecord& record);

#endif
