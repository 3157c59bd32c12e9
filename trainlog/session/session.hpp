#pragma once

#include <string>
#include <trainlog/model/exercise.hpp>
#include <trainlog/model/standardize.hpp>
#include <trainlog/util/util.hpp>
#include <vector>

namespace trainlog {

struct SessionLine {
    size_t line_number;  // 1-based, in the input file
    std::string text;
};

// One training day as written: a date line, '#' notes and exercise lines.
struct RawSession {
    std::string date;
    std::vector<std::string> notes;
    std::vector<SessionLine> lines;
};

// Splits a multi-session log into blocks separated by blank lines.
// The first non-note line of a block is its date. A block that holds only
// notes is dropped with a warning.
std::vector<RawSession> group_sessions(const std::vector<std::string>& lines);

// Reads a file holding a single session. Blank lines and YYYY-MM-DD lines
// are dropped; the first date seen becomes the session date.
RawSession filter_single_session(const std::vector<std::string>& lines);

bool is_date_line(const std::string& line);

//----------------------------------------------------------------------------
// parsing

enum ErrorPolicy { SKIP_BAD_LINES, ABORT_ON_BAD_LINE };

const char* const DEFAULT_ON_ERROR = "skip";

// Reads TRAINLOG_ON_ERROR, one of "skip" or "abort".
ErrorPolicy error_policy_from_env();

struct LineFailure {
    size_t line_number;
    std::string text;
    std::string message;
};

struct ParsedSession {
    std::string date;
    std::vector<std::string> notes;
    std::vector<Exercise> exercises;
    std::vector<LineFailure> failures;
};

class SessionParser : noncopyable {
   public:
    SessionParser(const NameStandardizer& standardizer, ErrorPolicy policy)
        : m_standardizer(standardizer), m_policy(policy) {}

    // Under SKIP_BAD_LINES a bad line is logged and recorded in failures.
    // Under ABORT_ON_BAD_LINE the first bad line throws a LineError.
    ParsedSession parse(const RawSession& raw) const;

    ErrorPolicy policy() const { return m_policy; }

   private:
    void fail(ParsedSession& session, const SessionLine& line,
              const std::string& message) const;

    const NameStandardizer& m_standardizer;
    const ErrorPolicy m_policy;
};

}  // namespace trainlog
