#pragma once

#include <string>
#include <trainlog/model/syntax.hpp>
#include <trainlog/util/util.hpp>
#include <vector>

namespace trainlog {

struct ParsedLine {
    std::string name;
    const SetExpr* root;

    ParsedLine() : name(), root(nullptr) {}
};

// LineParser turns one exercise line into a name and a set expression.
//
// Notation, after the name:
//   75k: 4, 4x5          weight scope over a bare count and 4 sets of 5
//   4x5x75k              4 sets of 5 at 75kg, ignoring any scope
//   10xx75k,80k,85k      10 reps at each listed weight
//   75: 4                a bare number followed by ':' is a weight
//   20k                  a lone weight is one set of 1 rep
//   100k 12 10 8         commas between notations are optional
// A new weight starts a new scope that runs to the next weight or the end.
class LineParser : noncopyable {
   public:
    // LineParser agrees not to touch pool or error_log until parse().
    LineParser(SetExprPool& pool, std::vector<std::string>& error_log)
        : m_pool(pool), m_error_log(error_log), m_tokens(), m_cursor(0) {}

    // Returns false and appends to the error log on a syntax error.
    bool parse(const std::string& line, ParsedLine& result);

   private:
    struct Token {
        enum Type { NUMBER, WEIGHT, TIMES, TIMES_TIMES, COLON, COMMA, END };
        Type type;
        std::string text;
        double value;
        size_t pos;
    };
    struct SyntaxError {
        std::string message;
    };

    static size_t find_notation_start(const std::string& line);
    void tokenize(const std::string& line, size_t pos);

    const Token& peek(size_t offset = 0) const;
    const Token& next();
    bool at_weight_start(size_t offset = 0) const;

    const SetExpr* parse_segment();
    const SetExpr* parse_notations();
    const SetExpr* parse_notation();
    int64_t parse_count();
    double parse_weight();

    void fail(const std::string& message) const;

    SetExprPool& m_pool;
    std::vector<std::string>& m_error_log;
    std::vector<Token> m_tokens;
    size_t m_cursor;
};

}  // namespace trainlog
