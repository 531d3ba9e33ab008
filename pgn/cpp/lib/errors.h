#ifndef PGNREC_ERRORS_H
#define PGNREC_ERRORS_H
#include <stdexcept>
#include <string>

struct PipelineError: std::runtime_error {
	PipelineError(const std::string& what): std::runtime_error(what) {};
};

struct InvalidInputFormat: PipelineError {
	InvalidInputFormat(const std::string& what): PipelineError("invalid input format: " + what) {};
};

struct DecompressionError: PipelineError {
	DecompressionError(const std::string& what): PipelineError("decompression failed: " + what) {};
};

struct MalformedGameError: PipelineError {
	MalformedGameError(const std::string& what): PipelineError("malformed game: " + what) {};
};

struct SchemaViolationError: PipelineError {
	SchemaViolationError(const std::string& what): PipelineError("schema violation: " + what) {};
};

struct EmptySchemaError: PipelineError {
	EmptySchemaError(): PipelineError("no games available to infer a schema from") {};
};

struct DuplicateIdentifierError: PipelineError {
	DuplicateIdentifierError(const std::string& id): PipelineError("duplicate game id: " + id) {};
};

struct RecordIOError: PipelineError {
	RecordIOError(const std::string& what): PipelineError("record i/o: " + what) {};
};

#endif
