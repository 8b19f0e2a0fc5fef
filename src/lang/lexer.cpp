#include <pcomb/lang/lexer.hpp>
#include <cctype>

namespace pcomb {

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    size_t line;
    size_t col;

    std::vector<ItemToken> tokens;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    // Token covering columns [start_col, col) on the current line
    void emit(ItemTokenType type, size_t start_line, size_t start_col) {
        size_t end_col = col > start_col ? col - 1 : start_col;
        tokens.push_back({std::move(type), Span(start_line, start_col, end_col)});
    }

    PcombError error_at(const std::string& msg, const std::string& hint,
                        size_t at_line, size_t at_col) const {
        return PcombError{PcombError::Parse, msg, hint, filename,
                          static_cast<int>(at_line), static_cast<int>(at_col)};
    }

    Result<std::vector<ItemToken>> run() {
        while (!at_end()) {
            skip_whitespace();
            if (at_end()) break;

            char c = peek();

            if (c == '#') {
                skip_comment();
                continue;
            }

            if (c == '"') {
                auto r = lex_string();
                if (r.is_err()) return std::move(r).error();
                continue;
            }

            if (is_ident_start(c)) {
                lex_identifier();
                continue;
            }

            auto r = lex_punct();
            if (r.is_err()) return std::move(r).error();
        }

        emit(ItemTokenType::of(ItemKind::Eoi), line, col);
        return Result<std::vector<ItemToken>>::ok(std::move(tokens));
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                advance();
            } else {
                break;
            }
        }
    }

    void skip_comment() {
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    static bool is_ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               c == '_' || c == '.' || c == '-';
    }

    void lex_identifier() {
        size_t start_col = col;
        std::string text;
        while (!at_end() && is_ident_char(peek())) {
            text += advance();
        }
        emit(ItemTokenType::id(std::move(text)), line, start_col);
    }

    // Strings may not span lines; \" and \\ are the only escapes.
    Status lex_string() {
        size_t start_line = line;
        size_t start_col = col;
        advance(); // opening "

        std::string text;
        while (true) {
            if (at_end() || peek() == '\n') {
                return error_at("unterminated string literal",
                                "close the string with '\"' on the same line",
                                start_line, start_col);
            }
            char c = advance();
            if (c == '"') break;
            if (c == '\\' && !at_end() && (peek() == '"' || peek() == '\\')) {
                text += advance();
                continue;
            }
            text += c;
        }

        emit(ItemTokenType::str(std::move(text)), start_line, start_col);
        return ok_status();
    }

    Status lex_punct() {
        size_t start_col = col;
        char c = peek();

        ItemKind kind;
        switch (c) {
        case ';': kind = ItemKind::Semicolon; break;
        case '$': kind = ItemKind::Dollar;    break;
        case '|': kind = ItemKind::Or;        break;
        case '^': kind = ItemKind::Caret;     break;
        case '[': kind = ItemKind::LBracket;  break;
        case ']': kind = ItemKind::RBracket;  break;
        case '=': kind = ItemKind::Equals;    break;
        case '(': kind = ItemKind::LParen;    break;
        case ')': kind = ItemKind::RParen;    break;
        default:
            return error_at(std::string("unexpected character '") + c + "'",
                            "", line, start_col);
        }

        advance();
        emit(ItemTokenType::of(kind), line, start_col);
        return ok_status();
    }
};

} // anonymous namespace

Result<std::vector<ItemToken>> lex_items(const std::string& source,
                                         const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace pcomb
