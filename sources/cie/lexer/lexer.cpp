//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/lexer/lexer.hpp"

#include <array>
#include <cctype>

namespace cie::lexer {

    namespace {
        constexpr std::array<std::string_view, 6> kThreeCharOperators = {
            "<<=", ">>=", "...", "..=", "->*", "<=>"
        };

        constexpr std::array<std::string_view, 24> kTwoCharOperators = {
            "::", "->", "=>", "==", "!=", "<=", ">=", "&&", "||", "+=", "-=", "*=",
            "/=", "%=", "&=", "|=", "^=", "<<", ">>", "++", "--", "..", "##", ".*"
        };

        bool is_ident_start(const char c) noexcept {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_ident_char(const char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_digit(const char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_space(const char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        /**
         * Single-character operators accepted by a dialect. Anything else
         * that starts no other token is Unknown.
         */
        bool is_operator_char(const Language language, const char c) noexcept {
            switch (c) {
                case '+': case '-': case '*': case '/': case '%': case '=': case '<':
                case '>': case '!': case '&': case '|': case '^': case '~': case '?':
                case ':': case ';': case ',': case '.': case '(': case ')': case '{':
                case '}': case '[': case ']':
                    return true;
                case '#':
                    return true;
                case '@':
                case '$':
                    return language == Language::Rust || language == Language::Assembly;
                case '\\':
                    // line continuation inside preprocessor macros
                    return language != Language::Rust && language != Language::Assembly;
                default:
                    return false;
            }
        }

        /**
         * Byte length of the UTF-8 sequence starting with lead, clamped so a
         * malformed sequence still advances.
         */
        std::size_t utf8_length(const unsigned char lead) noexcept {
            if (lead < 0x80) return 1;
            if ((lead >> 5) == 0x6) return 2;
            if ((lead >> 4) == 0xE) return 3;
            if ((lead >> 3) == 0x1E) return 4;
            return 1;
        }

        class Scanner {
        public:
            Scanner(const std::string_view source, const Language language, const std::string& file_path)
                : source_(source)
                , language_(language)
                , file_path_(file_path) {}

            LexResult run() {
                while (!at_end()) {
                    const char c = peek();
                    if (is_space(c)) {
                        advance();
                        continue;
                    }
                    begin_token();
                    scan_token();
                }
                return std::move(result_);
            }

        private:
            [[nodiscard]] bool at_end() const noexcept {
                return pos_ >= source_.size();
            }

            [[nodiscard]] char peek(const std::size_t ahead = 0) const noexcept {
                return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
            }

            [[nodiscard]] bool lookahead(const std::string_view text) const noexcept {
                return source_.substr(pos_, text.size()) == text;
            }

            void advance(std::size_t count = 1) noexcept {
                while (count-- > 0 && !at_end()) {
                    if (source_[pos_] == '\n') {
                        ++line_;
                        col_ = 0;
                    } else {
                        ++col_;
                    }
                    ++pos_;
                }
            }

            void begin_token() noexcept {
                start_pos_ = pos_;
                start_line_ = line_;
                start_col_ = col_;
            }

            void emit(const TokenType type) {
                Token token;
                token.type = type;
                token.value = std::string(source_.substr(start_pos_, pos_ - start_pos_));
                token.line = start_line_;
                token.start_col = start_col_;
                token.end_line = line_;
                token.end_col = col_;
                token.offset = start_pos_;
                token.length = pos_ - start_pos_;
                result_.tokens.push_back(std::move(token));
            }

            void report(const DiagnosticLevel level, std::string code, std::string message) {
                result_.diagnostics.push_back(Diagnostic{
                    level, std::move(code), std::move(message),
                    CodeLocation{file_path_, start_line_, start_col_}
                });
            }

            void scan_token() {
                const char c = peek();

                if (language_ == Language::Assembly && (c == ';' || (c == '#' && !is_digit(peek(1)) && peek(1) != '-'))) {
                    scan_line_comment();
                    return;
                }
                if (lookahead("//")) {
                    scan_line_comment();
                    return;
                }
                if (lookahead("/*")) {
                    scan_block_comment();
                    return;
                }
                if (try_scan_prefixed_string()) {
                    return;
                }
                if (c == '"') {
                    scan_string();
                    return;
                }
                if (c == '\'') {
                    scan_quote();
                    return;
                }
                if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                    scan_number();
                    return;
                }
                if (is_ident_start(c) || (language_ == Language::Assembly && c == '.' && is_ident_start(peek(1)))) {
                    scan_identifier();
                    return;
                }
                if (is_operator_char(language_, c)) {
                    scan_operator();
                    return;
                }
                scan_unknown();
            }

            void scan_line_comment() {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                emit(TokenType::Comment);
            }

            void scan_block_comment() {
                advance(2);
                int depth = 1;
                while (!at_end()) {
                    if (language_ == Language::Rust && lookahead("/*")) {
                        ++depth;
                        advance(2);
                        continue;
                    }
                    if (lookahead("*/")) {
                        advance(2);
                        if (--depth == 0) {
                            emit(TokenType::Comment);
                            return;
                        }
                        continue;
                    }
                    advance();
                }
                emit(TokenType::Comment);
                report(DiagnosticLevel::Warning, "lex.unterminated-comment",
                       "Block comment is not closed before end of file");
            }

            /**
             * Handles string prefixes: Rust r"", r#""#, b"", br"" and C/C++
             * L"", u"", U"", u8"" and raw R"delim(...)delim".
             */
            bool try_scan_prefixed_string() {
                if (language_ == Language::Rust) {
                    std::size_t i = 0;
                    if (peek(i) == 'b') ++i;
                    if (peek(i) == 'r') {
                        std::size_t hashes = 0;
                        while (peek(i + 1 + hashes) == '#') ++hashes;
                        if (peek(i + 1 + hashes) == '"') {
                            advance(i + 2 + hashes);
                            scan_rust_raw_string(hashes);
                            return true;
                        }
                        return false;
                    }
                    if (i == 1 && peek(1) == '"') {
                        advance();
                        scan_string();
                        return true;
                    }
                    if (i == 1 && peek(1) == '\'') {
                        advance();
                        scan_quote();
                        return true;
                    }
                    return false;
                }

                if (language_ == Language::Assembly) {
                    return false;
                }

                std::size_t i = 0;
                if (lookahead("u8")) {
                    i = 2;
                } else if (peek() == 'L' || peek() == 'u' || peek() == 'U') {
                    i = 1;
                }
                if (peek(i) == 'R' && peek(i + 1) == '"') {
                    advance(i + 2);
                    scan_cpp_raw_string();
                    return true;
                }
                if (i > 0 && peek(i) == '"') {
                    advance(i);
                    scan_string();
                    return true;
                }
                if (i > 0 && peek(i) == '\'') {
                    advance(i);
                    scan_quote();
                    return true;
                }
                return false;
            }

            void scan_rust_raw_string(const std::size_t hashes) {
                while (!at_end()) {
                    if (peek() == '"') {
                        std::size_t matched = 0;
                        while (matched < hashes && peek(1 + matched) == '#') ++matched;
                        if (matched == hashes) {
                            advance(1 + hashes);
                            emit(TokenType::String);
                            return;
                        }
                    }
                    advance();
                }
                emit(TokenType::String);
                report(DiagnosticLevel::Warning, "lex.unterminated-string",
                       "Raw string literal is not closed before end of file");
            }

            void scan_cpp_raw_string() {
                std::string delimiter;
                while (!at_end() && peek() != '(' && peek() != '\n' && delimiter.size() < 16) {
                    delimiter.push_back(peek());
                    advance();
                }
                const std::string terminator = ")" + delimiter + "\"";
                while (!at_end()) {
                    if (lookahead(terminator)) {
                        advance(terminator.size());
                        emit(TokenType::String);
                        return;
                    }
                    advance();
                }
                emit(TokenType::String);
                report(DiagnosticLevel::Warning, "lex.unterminated-string",
                       "Raw string literal is not closed before end of file");
            }

            /**
             * Rust strings may span lines; in the C family a newline ends an
             * unterminated literal.
             */
            void scan_string() {
                advance();
                while (!at_end()) {
                    const char c = peek();
                    if (c == '\\') {
                        advance(2);
                        continue;
                    }
                    if (c == '"') {
                        advance();
                        emit(TokenType::String);
                        return;
                    }
                    if (c == '\n' && language_ != Language::Rust) {
                        break;
                    }
                    advance();
                }
                emit(TokenType::String);
                report(DiagnosticLevel::Warning, "lex.unterminated-string",
                       "String literal is not closed");
            }

            /**
             * A single quote starts a char literal, or in Rust a lifetime or
             * loop label ('a, 'outer) which is lexed as an identifier.
             */
            void scan_quote() {
                if (language_ == Language::Rust && peek(1) != '\\') {
                    const std::size_t width = utf8_length(static_cast<unsigned char>(peek(1)));
                    const bool is_char_literal = peek(1 + width) == '\'';
                    if (!is_char_literal && is_ident_start(peek(1))) {
                        advance();
                        while (!at_end() && is_ident_char(peek())) {
                            advance();
                        }
                        emit(TokenType::Identifier);
                        return;
                    }
                }

                advance();
                while (!at_end()) {
                    const char c = peek();
                    if (c == '\\') {
                        advance(2);
                        continue;
                    }
                    if (c == '\'') {
                        advance();
                        emit(TokenType::String);
                        return;
                    }
                    if (c == '\n') {
                        break;
                    }
                    advance();
                }
                emit(TokenType::String);
                report(DiagnosticLevel::Warning, "lex.unterminated-char",
                       "Character literal is not closed");
            }

            void scan_number() {
                if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' ||
                                      peek(1) == 'b' || peek(1) == 'B' ||
                                      peek(1) == 'o' || peek(1) == 'O')) {
                    advance(2);
                    while (!at_end() && (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '\'')) {
                        advance();
                    }
                } else {
                    while (!at_end() && (is_digit(peek()) || peek() == '_' || peek() == '\'')) {
                        advance();
                    }
                    // Fraction, but not a range operator (1..2) or a method call (1.max(2)).
                    if (peek() == '.' && peek(1) != '.' && !is_ident_start(peek(1))) {
                        advance();
                        while (!at_end() && (is_digit(peek()) || peek() == '_')) {
                            advance();
                        }
                    }
                    if ((peek() == 'e' || peek() == 'E') &&
                        (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
                        advance(2);
                        while (!at_end() && is_digit(peek())) {
                            advance();
                        }
                    }
                }
                // Type suffixes: u32, f64, ULL, f.
                while (!at_end() && is_ident_char(peek())) {
                    advance();
                }
                emit(TokenType::Number);
            }

            void scan_identifier() {
                advance();
                const bool assembly = language_ == Language::Assembly;
                while (!at_end() && (is_ident_char(peek()) || (assembly && (peek() == '.' || peek() == '$')))) {
                    advance();
                }
                const std::string_view word = source_.substr(start_pos_, pos_ - start_pos_);
                emit(is_keyword(language_, word) ? TokenType::Keyword : TokenType::Identifier);
            }

            void scan_operator() {
                for (const auto op : kThreeCharOperators) {
                    if (lookahead(op)) {
                        advance(op.size());
                        emit(TokenType::Operator);
                        return;
                    }
                }
                for (const auto op : kTwoCharOperators) {
                    if (lookahead(op)) {
                        advance(op.size());
                        emit(TokenType::Operator);
                        return;
                    }
                }
                advance();
                emit(TokenType::Operator);
            }

            [[nodiscard]] bool starts_known_token() const noexcept {
                const char c = peek();
                return is_space(c) || c == '"' || c == '\'' || is_digit(c) || is_ident_start(c) ||
                       is_operator_char(language_, c);
            }

            void scan_unknown() {
                advance(utf8_length(static_cast<unsigned char>(peek())));
                while (!at_end() && !starts_known_token()) {
                    advance(utf8_length(static_cast<unsigned char>(peek())));
                }
                emit(TokenType::Unknown);
                report(DiagnosticLevel::Info, "lex.unknown-token",
                       "Unrecognized character sequence '" + result_.tokens.back().value + "'");
            }

            std::string_view source_;
            Language language_;
            const std::string& file_path_;
            LexResult result_;

            std::size_t pos_ = 0;
            std::size_t line_ = 1;
            std::size_t col_ = 0;

            std::size_t start_pos_ = 0;
            std::size_t start_line_ = 1;
            std::size_t start_col_ = 0;
        };
    }

    LexResult tokenize(const std::string_view source, const Language language, const std::string& file_path) {
        return Scanner(source, language, file_path).run();
    }

}  // namespace cie::lexer
