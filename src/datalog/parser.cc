#include "evalbox/datalog/parser.hh"
#include "evalbox/concat_tostr.hh"
#include "evalbox/errors.hh"

#include <charconv>
#include <string>
#include <utility>

namespace {

using evalbox::datalog::Clause;
using evalbox::datalog::Literal;
using evalbox::datalog::Program;
using evalbox::datalog::Statement;
using evalbox::datalog::Term;

constexpr bool is_lower(char c) noexcept { return c >= 'a' and c <= 'z'; }

constexpr bool is_upper(char c) noexcept { return c >= 'A' and c <= 'Z'; }

constexpr bool is_digit(char c) noexcept { return c >= '0' and c <= '9'; }

constexpr bool is_name_char(char c) noexcept {
    return is_lower(c) or is_upper(c) or is_digit(c) or c == '_';
}

struct Token {
    enum class Kind {
        NAME,
        VARIABLE,
        STRING,
        INTEGER,
        LPAREN,
        RPAREN,
        COMMA,
        DOT,
        TILDE,
        QUESTION_MARK,
        IMPLIES,
        END,
    };

    Kind kind;
    std::string text; // name, variable, string contents or integer digits
    size_t line;
    size_t column;
};

const char* token_kind_name(Token::Kind kind) noexcept {
    using enum Token::Kind;
    switch (kind) {
    case NAME: return "name";
    case VARIABLE: return "variable";
    case STRING: return "string";
    case INTEGER: return "integer";
    case LPAREN: return "'('";
    case RPAREN: return "')'";
    case COMMA: return "','";
    case DOT: return "'.'";
    case TILDE: return "'~'";
    case QUESTION_MARK: return "'?'";
    case IMPLIES: return "':-'";
    case END: return "end of input";
    }
    return "unknown token";
}

class Lexer {
    std::string_view src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[noreturn]] void error(size_t line, size_t column, std::string_view msg) const {
        throw evalbox::SyntaxError{concat_tostr(line, ':', column, ": ", msg)};
    }

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }

    [[nodiscard]] char peek(size_t offset = 0) const noexcept {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    char advance() noexcept {
        char c = src_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    void skip_whitespace_and_comments() noexcept {
        while (not at_end()) {
            char c = peek();
            if (c == '%') {
                while (not at_end() and peek() != '\n') {
                    advance();
                }
            } else if (c == ' ' or c == '\t' or c == '\n' or c == '\r') {
                advance();
            } else {
                return;
            }
        }
    }

    std::string lex_string(size_t line, size_t column) {
        std::string res;
        for (;;) {
            if (at_end()) {
                error(line, column, "unterminated string");
            }
            char c = advance();
            if (c == '"') {
                return res;
            }
            if (c == '\n') {
                error(line, column, "unterminated string");
            }
            if (c != '\\') {
                res += c;
                continue;
            }
            if (at_end()) {
                error(line, column, "unterminated string");
            }
            size_t esc_line = line_;
            size_t esc_column = column_ - 1;
            switch (advance()) {
            case '"': res += '"'; break;
            case '\\': res += '\\'; break;
            case 'n': res += '\n'; break;
            case 't': res += '\t'; break;
            default: error(esc_line, esc_column, "invalid escape sequence");
            }
        }
    }

public:
    explicit Lexer(std::string_view src) noexcept : src_{src} {}

    Token next() {
        skip_whitespace_and_comments();
        size_t line = line_;
        size_t column = column_;
        auto token = [&](Token::Kind kind, std::string text = {}) {
            return Token{.kind = kind, .text = std::move(text), .line = line, .column = column};
        };
        if (at_end()) {
            return token(Token::Kind::END);
        }

        char c = peek();
        if (is_lower(c) or is_upper(c) or c == '_') {
            size_t beg = pos_;
            while (not at_end() and is_name_char(peek())) {
                advance();
            }
            auto kind = is_lower(c) ? Token::Kind::NAME : Token::Kind::VARIABLE;
            return token(kind, std::string{src_.substr(beg, pos_ - beg)});
        }
        if (is_digit(c) or (c == '-' and is_digit(peek(1)))) {
            size_t beg = pos_;
            advance();
            while (not at_end() and is_digit(peek())) {
                advance();
            }
            return token(Token::Kind::INTEGER, std::string{src_.substr(beg, pos_ - beg)});
        }
        if (c == ':' and peek(1) == '-') {
            advance();
            advance();
            return token(Token::Kind::IMPLIES);
        }

        advance();
        switch (c) {
        case '"': return token(Token::Kind::STRING, lex_string(line, column));
        case '(': return token(Token::Kind::LPAREN);
        case ')': return token(Token::Kind::RPAREN);
        case ',': return token(Token::Kind::COMMA);
        case '.': return token(Token::Kind::DOT);
        case '~': return token(Token::Kind::TILDE);
        case '?': return token(Token::Kind::QUESTION_MARK);
        }
        auto code = static_cast<unsigned char>(c);
        if (code < 0x20 or code >= 0x7f) {
            error(line, column, concat_tostr("unexpected character with code ", int{code}));
        }
        error(line, column, concat_tostr("unexpected character '", c, '\''));
    }
};

class Parser {
    Lexer lexer_;
    Token curr_;

    [[noreturn]] static void error(const Token& tok, std::string_view msg) {
        throw evalbox::SyntaxError{concat_tostr(tok.line, ':', tok.column, ": ", msg)};
    }

    [[noreturn]] static void unexpected(const Token& tok, std::string_view expected) {
        error(tok, concat_tostr("expected ", expected, ", found ", token_kind_name(tok.kind)));
    }

    Token consume() { return std::exchange(curr_, lexer_.next()); }

    Token expect(Token::Kind kind) {
        if (curr_.kind != kind) {
            unexpected(curr_, token_kind_name(kind));
        }
        return consume();
    }

    Term parse_term() {
        switch (curr_.kind) {
        case Token::Kind::VARIABLE: return Term::variable(consume().text);
        case Token::Kind::NAME: return Term::name(consume().text);
        case Token::Kind::STRING: return Term::string(consume().text);
        case Token::Kind::INTEGER: {
            auto tok = consume();
            int64_t x{};
            auto [ptr, ec] = std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), x);
            if (ec != std::errc{} or ptr != tok.text.data() + tok.text.size()) {
                error(tok, concat_tostr("integer out of range: ", tok.text));
            }
            return Term::integer_of(x);
        }
        default: unexpected(curr_, "term");
        }
    }

    Literal parse_literal() {
        Literal lit{.predicate = expect(Token::Kind::NAME).text, .args = {}};
        if (curr_.kind == Token::Kind::LPAREN) {
            consume();
            lit.args.emplace_back(parse_term());
            while (curr_.kind == Token::Kind::COMMA) {
                consume();
                lit.args.emplace_back(parse_term());
            }
            expect(Token::Kind::RPAREN);
        }
        return lit;
    }

    Statement parse_statement() {
        size_t line = curr_.line;
        size_t column = curr_.column;
        Clause clause{.head = parse_literal(), .body = {}};
        if (curr_.kind == Token::Kind::IMPLIES) {
            consume();
            clause.body.emplace_back(parse_literal());
            while (curr_.kind == Token::Kind::COMMA) {
                consume();
                clause.body.emplace_back(parse_literal());
            }
            expect(Token::Kind::DOT);
            return {
                .kind = Statement::Kind::ASSERTION,
                .clause = std::move(clause),
                .line = line,
                .column = column,
            };
        }

        Statement::Kind kind{};
        switch (curr_.kind) {
        case Token::Kind::DOT: kind = Statement::Kind::ASSERTION; break;
        case Token::Kind::TILDE: kind = Statement::Kind::RETRACTION; break;
        case Token::Kind::QUESTION_MARK: kind = Statement::Kind::QUERY; break;
        default: unexpected(curr_, "'.', '~', '?' or ':-'");
        }
        consume();
        return {.kind = kind, .clause = std::move(clause), .line = line, .column = column};
    }

public:
    explicit Parser(std::string_view src) : lexer_{src}, curr_{lexer_.next()} {}

    Program parse_program() {
        Program program;
        while (curr_.kind != Token::Kind::END) {
            program.emplace_back(parse_statement());
        }
        return program;
    }
};

} // namespace

namespace evalbox::datalog {

Program parse(std::string_view source) { return Parser{source}.parse_program(); }

} // namespace evalbox::datalog
