#ifndef PGNREC_SERIAL_PARSER_H
#define PGNREC_SERIAL_PARSER_H
#include "parser.h"
#include "lib/gameId.h"
#include <memory>

std::shared_ptr<RunOutput> processSerial(const RunConfig& cfg, IdSource& ids);

#endif
