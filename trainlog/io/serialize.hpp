#pragma once

#include <ostream>
#include <string>
#include <trainlog/io/trainlog.pb.h>
#include <trainlog/model/exercise.hpp>
#include <trainlog/model/standardize.hpp>
#include <trainlog/session/session.hpp>
#include <vector>

namespace trainlog {

const char* const WORKOUT_TYPE = "set-centric";
const char* const DEFAULT_EQUIPMENT = "other";

// "2024-01-15" becomes "w_20240115_000000" and "2024-01-15T08:30:00Z"
// becomes "w_20240115_083000".
std::string workout_id(const std::string& date);

// Current UTC time as ISO 8601, e.g. "2024-01-15T08:30:00Z".
std::string utc_timestamp();

void dump(const Exercise& exercise, protobuf::Exercise& message);
// A session without a date is dated by the current UTC time.
void dump(const ParsedSession& session, protobuf::Workout& message);
void dump(const std::vector<ParsedSession>& sessions,
          const std::string& timestamp, protobuf::Export& message);

void dump(const std::vector<Synonym>& entries, protobuf::SynonymTable& message);
std::vector<Synonym> load(const protobuf::SynonymTable& message);

// Reads extra synonyms from the JSON file named by TRAINLOG_SYNONYMS, if set.
std::vector<Synonym> load_synonyms_from_env();

//----------------------------------------------------------------------------
// tsv

// Prints an amount with one decimal and a comma, e.g. 62.5 -> "62,5".
std::string format_tsv_weight(double amount);

void write_tsv_header(std::ostream& o);

// One row per run of equal-weight sets, reps averaged and truncated.
void write_tsv_rows(std::ostream& o, const ParsedSession& session);

}  // namespace trainlog
