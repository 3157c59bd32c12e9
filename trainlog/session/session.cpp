#include <cstring>
#include <trainlog/model/syntax.hpp>
#include <trainlog/parser/line_parser.hpp>
#include <trainlog/session/session.hpp>

namespace trainlog {

bool is_date_line(const std::string& line) {
    const std::string text = trim(line);
    if (text.size() != 10) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i == 4 or i == 7) {
            if (c != '-') return false;
        } else if (c < '0' or '9' < c) {
            return false;
        }
    }
    return true;
}

std::vector<RawSession> group_sessions(const std::vector<std::string>& lines) {
    std::vector<RawSession> sessions;
    RawSession current;
    bool open = false;

    auto close = [&]() {
        if (not open) return;
        if (current.date.empty()) {
            TRAINLOG_WARN("dropping session without date, "
                          << current.notes.size() << " notes");
        } else {
            sessions.push_back(current);
        }
        current = RawSession();
        open = false;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string text = trim(lines[i]);
        if (text.empty()) {
            close();
            continue;
        }
        open = true;
        if (text[0] == '#') {
            current.notes.push_back(text);
        } else if (current.date.empty()) {
            current.date = text;
        } else {
            current.lines.push_back({i + 1, text});
        }
    }
    close();

    TRAINLOG_INFO("grouped " << lines.size() << " lines into "
                             << sessions.size() << " sessions");
    return sessions;
}

RawSession filter_single_session(const std::vector<std::string>& lines) {
    RawSession session;
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string text = trim(lines[i]);
        if (text.empty()) continue;
        if (is_date_line(text)) {
            if (session.date.empty()) {
                session.date = text;
            }
            continue;
        }
        if (text[0] == '#') {
            session.notes.push_back(text);
        } else {
            session.lines.push_back({i + 1, text});
        }
    }
    return session;
}

//----------------------------------------------------------------------------
// parsing

ErrorPolicy error_policy_from_env() {
    const char* value = getenv_default("TRAINLOG_ON_ERROR", DEFAULT_ON_ERROR);
    if (strcmp(value, "skip") == 0) return SKIP_BAD_LINES;
    if (strcmp(value, "abort") == 0) return ABORT_ON_BAD_LINE;
    TRAINLOG_ERROR("bad TRAINLOG_ON_ERROR: " << value
                                             << ", expected skip or abort");
}

void SessionParser::fail(ParsedSession& session, const SessionLine& line,
                         const std::string& message) const {
    TRAINLOG_WARN("line " << line.line_number << ": " << message);
    session.failures.push_back({line.line_number, line.text, message});
}

ParsedSession SessionParser::parse(const RawSession& raw) const {
    ParsedSession session;
    session.date = raw.date;
    session.notes = raw.notes;

    SetExprPool pool;
    std::vector<std::string> error_log;
    LineParser parser(pool, error_log);

    for (const auto& line : raw.lines) {
        ParsedLine parsed;
        error_log.clear();
        if (not parser.parse(line.text, parsed)) {
            std::ostringstream message;
            for (size_t i = 0; i < error_log.size(); ++i) {
                message << (i ? "; " : "") << error_log[i];
            }
            if (m_policy == ABORT_ON_BAD_LINE) {
                throw LineError("line " + std::to_string(line.line_number) +
                                ": " + message.str());
            }
            fail(session, line, message.str());
            continue;
        }

        try {
            session.exercises.push_back(
                assemble_exercise(parsed.name, *parsed.root, m_standardizer));
        } catch (const LineError& error) {
            if (m_policy == ABORT_ON_BAD_LINE) {
                TRAINLOG_WARN("line " << line.line_number << ": "
                                      << error.what());
                throw;
            }
            fail(session, line, error.what());
        }
    }

    TRAINLOG_ASSERT_EQ(session.exercises.size() + session.failures.size(),
                       raw.lines.size());
    TRAINLOG_DEBUG(session.date << ": " << session.exercises.size()
                                << " exercises, " << session.failures.size()
                                << " failures");
    return session;
}

}  // namespace trainlog
