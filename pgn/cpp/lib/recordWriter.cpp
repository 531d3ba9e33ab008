#include "recordWriter.h"
#include "errors.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace pio = google::protobuf::io;

static std::string errnoStr(int err) {
	return std::string(std::strerror(err));
}

RecordWriter::RecordWriter(std::string outdir, const Schema& schema, bool syncEachRecord)
	: outdir(outdir), schema(schema), syncEachRecord(syncEachRecord) {
	schemaMsg.set_ns(schema.ns);
	schemaMsg.set_name(schema.name);
	for (auto& f: schema.fields) {
		pgnrec::FieldSchema* fs = schemaMsg.add_fields();
		fs->set_name(f.name);
		fs->set_type(f.type);
	}
}

std::string RecordWriter::recordPath(const std::string& gameId) const {
	return outdir + "/" + gameId + RECORD_EXT;
}

std::string RecordWriter::write(const ParsedGame& game) const {
	schema.check(game);

	pgnrec::GameRecord record;
	*record.mutable_schema() = schemaMsg;
	for (auto& [name, value]: game.fields()) {
		pgnrec::Field* field = record.add_fields();
		field->set_name(name);
		field->set_value(value);
	}

	std::string path = recordPath(game.gameId);
	int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
	if (fd < 0) {
		if (errno == EEXIST) throw DuplicateIdentifierError(game.gameId);
		throw RecordIOError("cannot create " + path + ": " + errnoStr(errno));
	}

	pio::FileOutputStream wrapped(fd);
	bool ok;
	{
		pio::CodedOutputStream coded(&wrapped);
		coded.WriteRaw(RECORD_MAGIC.data(), RECORD_MAGIC.size());
		coded.WriteVarint32(static_cast<uint32_t>(record.ByteSizeLong()));
		ok = record.SerializeToCodedStream(&coded) && !coded.HadError();
	}
	ok = ok && wrapped.Flush();
	if (ok && syncEachRecord && ::fsync(fd) != 0) {
		int err = errno;
		wrapped.Close();
		::unlink(path.c_str());
		throw RecordIOError("fsync failed on " + path + ": " + errnoStr(err));
	}
	if (!ok) {
		int err = wrapped.GetErrno();
		wrapped.Close();
		::unlink(path.c_str());
		throw RecordIOError("write failed on " + path + ": " + errnoStr(err));
	}
	if (!wrapped.Close()) {
		throw RecordIOError("close failed on " + path + ": " + errnoStr(wrapped.GetErrno()));
	}
	return path;
}

pgnrec::GameRecord readRecord(const std::string& path) {
	int fd = ::open(path.c_str(), O_RDONLY);
	if (fd < 0) throw RecordIOError("cannot open " + path + ": " + errnoStr(errno));

	pio::FileInputStream wrapped(fd);
	wrapped.SetCloseOnDelete(true);
	pio::CodedInputStream coded(&wrapped);

	std::string magic;
	if (!coded.ReadString(&magic, RECORD_MAGIC.size()) || magic != RECORD_MAGIC) {
		throw RecordIOError(path + " is not a game record");
	}
	uint32_t size;
	if (!coded.ReadVarint32(&size)) throw RecordIOError(path + " has no record length");

	pgnrec::GameRecord record;
	pio::CodedInputStream::Limit limit = coded.PushLimit(size);
	if (!record.ParseFromCodedStream(&coded) || coded.BytesUntilLimit() != 0) {
		throw RecordIOError(path + " holds a truncated or corrupt record");
	}
	coded.PopLimit(limit);
	return record;
}

FieldList recordFields(const pgnrec::GameRecord& record) {
	FieldList out;
	for (auto& f: record.fields()) {
		out.push_back(std::make_pair(f.name(), f.value()));
	}
	return out;
}
