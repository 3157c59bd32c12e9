#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <trainlog/parser/line_parser.hpp>

namespace trainlog {

namespace {

inline bool is_digit(char c) { return '0' <= c and c <= '9'; }

}  // namespace

void LineParser::fail(const std::string& message) const {
    throw SyntaxError{message};
}

size_t LineParser::find_notation_start(const std::string& line) {
    for (size_t pos = 0; pos < line.size(); ++pos) {
        if (is_digit(line[pos]) and (pos == 0 or is_space(line[pos - 1]))) {
            return pos;
        }
    }
    return std::string::npos;
}

void LineParser::tokenize(const std::string& line, size_t pos) {
    m_tokens.clear();
    m_cursor = 0;

    const size_t size = line.size();
    while (pos < size) {
        const char c = line[pos];
        if (is_space(c)) {
            ++pos;
            continue;
        }

        Token token;
        token.pos = pos;
        token.value = 0;
        if (is_digit(c)) {
            while (pos < size and is_digit(line[pos])) ++pos;
            if (pos + 1 < size and line[pos] == '.' and is_digit(line[pos + 1])) {
                ++pos;
                while (pos < size and is_digit(line[pos])) ++pos;
            }
            token.text = line.substr(token.pos, pos - token.pos);
            token.value = strtod(token.text.c_str(), nullptr);
            token.type = Token::NUMBER;
            if (pos < size and (line[pos] == 'k' or line[pos] == 'K')) {
                ++pos;
                if (pos < size and (line[pos] == 'g' or line[pos] == 'G')) {
                    ++pos;
                }
                token.type = Token::WEIGHT;
            }
        } else if (c == 'x' or c == 'X') {
            ++pos;
            token.type = Token::TIMES;
            if (pos < size and (line[pos] == 'x' or line[pos] == 'X')) {
                ++pos;
                token.type = Token::TIMES_TIMES;
            }
        } else if (c == ':') {
            ++pos;
            token.type = Token::COLON;
        } else if (c == ',') {
            ++pos;
            token.type = Token::COMMA;
        } else {
            fail(std::string("unexpected character '") + c + "' at column " +
                 std::to_string(pos + 1) + " in: " + line);
        }
        if (token.text.empty()) {
            token.text = line.substr(token.pos, pos - token.pos);
        }
        m_tokens.push_back(token);
    }

    Token end;
    end.type = Token::END;
    end.text = "end of line";
    end.value = 0;
    end.pos = size;
    m_tokens.push_back(end);
}

const LineParser::Token& LineParser::peek(size_t offset) const {
    const size_t index = min(m_cursor + offset, m_tokens.size() - 1);
    return m_tokens[index];
}

const LineParser::Token& LineParser::next() {
    const Token& token = peek();
    if (token.type != Token::END) {
        ++m_cursor;
    }
    return token;
}

// A weight is either k-suffixed or a bare number followed by ':'.
bool LineParser::at_weight_start(size_t offset) const {
    const Token& token = peek(offset);
    return token.type == Token::WEIGHT or
           (token.type == Token::NUMBER and
            peek(offset + 1).type == Token::COLON);
}

bool LineParser::parse(const std::string& line, ParsedLine& result) {
    try {
        const size_t start = find_notation_start(line);
        if (start == std::string::npos) {
            fail("no sets in: " + line);
        }
        std::string name = trim(line.substr(0, start));
        while (not name.empty() and name.back() == ':') {
            name.pop_back();
        }
        name = trim(name);
        if (name.empty()) {
            fail("missing exercise name in: " + line);
        }

        tokenize(line, start);
        const SetExpr* root = nullptr;
        while (peek().type != Token::END) {
            const SetExpr* segment = parse_segment();
            root = root ? m_pool.combine(root, segment) : segment;
        }

        result.name = name;
        result.root = root;
        return true;
    } catch (const SyntaxError& error) {
        m_error_log.push_back(error.message);
        TRAINLOG_WARN(error.message);
        return false;
    }
}

const SetExpr* LineParser::parse_segment() {
    if (not at_weight_start()) {
        return parse_notations();
    }

    const double amount = parse_weight();
    if (peek().type == Token::COLON) {
        next();
    }
    if (peek().type == Token::END or at_weight_start()) {
        return m_pool.weight_scoped(amount);
    }
    if (peek().type == Token::COMMA and at_weight_start(1)) {
        next();
        return m_pool.weight_scoped(amount);
    }
    return m_pool.weight_scoped(amount, parse_notations());
}

const SetExpr* LineParser::parse_notations() {
    // Notations are separated by commas or by whitespace alone, and run to
    // the next weight.
    const SetExpr* expr = parse_notation();
    while (true) {
        if (peek().type == Token::COMMA) {
            if (at_weight_start(1)) {
                next();
                break;
            }
            next();
        } else if (peek().type != Token::NUMBER or at_weight_start()) {
            break;
        }
        expr = m_pool.combine(expr, parse_notation());
    }
    if (peek().type != Token::END and not at_weight_start()) {
        fail("unexpected '" + peek().text + "' at column " +
             std::to_string(peek().pos + 1));
    }
    return expr;
}

const SetExpr* LineParser::parse_notation() {
    const int64_t first = parse_count();

    if (peek().type == Token::TIMES_TIMES) {
        next();
        std::vector<double> amounts;
        amounts.push_back(parse_weight());
        // The list runs on while commas are followed by k-suffixed weights
        // that do not open a new scope.
        while (peek().type == Token::COMMA and
               peek(1).type == Token::WEIGHT and
               peek(2).type != Token::COLON) {
            next();
            amounts.push_back(parse_weight());
        }
        return m_pool.fixed_reps_multi_weight(first, amounts);
    }

    if (peek().type == Token::TIMES) {
        next();
        const int64_t second = parse_count();
        if (peek().type == Token::TIMES) {
            next();
            return m_pool.whole_set(first, second, parse_weight());
        }
        return m_pool.count_by_count(first, second);
    }

    return m_pool.bare_count(first);
}

int64_t LineParser::parse_count() {
    const Token& token = next();
    if (token.type != Token::NUMBER) {
        fail("expected a count but found '" + token.text + "' at column " +
             std::to_string(token.pos + 1));
    }
    if (token.text.find('.') != std::string::npos) {
        fail("fractional count '" + token.text + "' at column " +
             std::to_string(token.pos + 1));
    }
    errno = 0;
    const long long count = strtoll(token.text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        fail("count too large '" + token.text + "' at column " +
             std::to_string(token.pos + 1));
    }
    return count;
}

double LineParser::parse_weight() {
    const Token& token = next();
    if (token.type != Token::WEIGHT and token.type != Token::NUMBER) {
        fail("expected a weight but found '" + token.text + "' at column " +
             std::to_string(token.pos + 1));
    }
    return token.value;
}

}  // namespace trainlog
