//
// Created by gregorian-rayne on 10/7/26.
//

#include "sts/python/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace sts::python {

    namespace {

        constexpr std::array<std::string_view, 35> KEYWORDS = {
            "False", "None", "True", "and", "as", "assert", "async", "await",
            "break", "class", "continue", "def", "del", "elif", "else", "except",
            "finally", "for", "from", "global", "if", "import", "in", "is",
            "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
            "while", "with", "yield"
        };

        constexpr std::array<std::string_view, 5> THREE_CHAR_OPS = {
            "**=", "//=", ">>=", "<<=", "..."
        };

        constexpr std::array<std::string_view, 19> TWO_CHAR_OPS = {
            "!=", "->", ":=", "==", "<=", ">=", "**", "//", "<<", ">>",
            "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="
        };

        constexpr std::string_view SINGLE_CHAR_OPS = "()[]{}:,;.+-*/%&|^~<>=@";

        constexpr std::array<std::string_view, 8> STRING_PREFIXES = {
            "r", "u", "b", "f", "br", "rb", "fr", "rf"
        };

        bool is_ident_start(const char c) noexcept {
            const auto u = static_cast<unsigned char>(c);
            return std::isalpha(u) || c == '_' || u >= 0x80;
        }

        bool is_ident_char(const char c) noexcept {
            const auto u = static_cast<unsigned char>(c);
            return std::isalnum(u) || c == '_' || u >= 0x80;
        }

        bool is_digit(const char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        char closing_for(const char open) noexcept {
            switch (open) {
                case '(': return ')';
                case '[': return ']';
                case '{': return '}';
                default:  return '\0';
            }
        }

        enum LineFlag : unsigned char {
            LineCode    = 1u << 0,
            LineComment = 1u << 1,
            LineDoc     = 1u << 2
        };

        class Lexer {
        public:
            explicit Lexer(const std::string_view source)
                : src_(source) {
                line_flags_.assign(count_lines(source) + 2, 0);
            }

            Result<LexResult, Error> run() {
                bool at_line_start = true;
                bool continuation = false;

                while (!at_end()) {
                    if (at_line_start) {
                        at_line_start = false;
                        if (brackets_.empty() && !continuation) {
                            auto handled = handle_indentation();
                            if (handled.is_err()) {
                                return fail(handled.error());
                            }
                            if (!handled.value()) {
                                at_line_start = true;   // blank or comment-only line
                                continue;
                            }
                        }
                        continuation = false;
                    }

                    const char c = peek();

                    if (c == ' ' || c == '\t' || c == '\f') {
                        ++pos_;
                        continue;
                    }

                    if (c == '#') {
                        skip_comment();
                        continue;
                    }

                    if (c == '\n' || c == '\r') {
                        consume_newline();
                        if (brackets_.empty() && logical_line_open_) {
                            emit(TokenType::Newline, "", line_ - 1, 0, line_ - 1, false);
                            logical_line_open_ = false;
                        }
                        at_line_start = true;
                        continue;
                    }

                    if (c == '\\') {
                        if (is_newline(peek(1))) {
                            ++pos_;
                            consume_newline();
                            continuation = true;
                            at_line_start = true;
                            continue;
                        }
                        if (pos_ + 1 >= src_.size()) {
                            return fail(error_at("unexpected EOF after line continuation character", line_));
                        }
                        return fail(error_at("unexpected character after line continuation character", line_));
                    }

                    Result<void, Error> scanned = Result<void, Error>::success();
                    if (is_ident_start(c)) {
                        scanned = scan_name_or_prefixed_string();
                    } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                        scan_number();
                    } else if (c == '"' || c == '\'') {
                        scanned = scan_string(pos_);
                    } else {
                        scanned = scan_operator();
                    }

                    if (scanned.is_err()) {
                        return fail(scanned.error());
                    }
                }

                if (continuation) {
                    return fail(error_at("unexpected EOF after line continuation character", line_));
                }

                if (!brackets_.empty()) {
                    const auto& [open, open_line] = brackets_.back();
                    return fail(error_at(std::string("'") + open + "' was never closed", open_line));
                }

                if (logical_line_open_) {
                    emit(TokenType::Newline, "", line_, column(), line_, false);
                    logical_line_open_ = false;
                }

                while (indents_.size() > 1) {
                    indents_.pop_back();
                    emit(TokenType::Dedent, "", line_, 0, line_, false);
                }
                emit(TokenType::EndMarker, "", line_, 0, line_, false);

                LexResult result;
                result.raw = compute_raw();
                result.tokens = std::move(tokens_);
                return Result<LexResult, Error>::success(std::move(result));
            }

        private:
            static std::size_t count_lines(const std::string_view text) {
                std::size_t lines = 0;
                for (std::size_t i = 0; i < text.size(); ++i) {
                    if (text[i] == '\n') {
                        ++lines;
                    } else if (text[i] == '\r') {
                        ++lines;
                        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                    }
                }
                if (!text.empty() && text.back() != '\n' && text.back() != '\r') {
                    ++lines;
                }
                return lines;
            }

            static bool is_newline(const char c) noexcept {
                return c == '\n' || c == '\r';
            }

            [[nodiscard]] bool at_end() const noexcept {
                return pos_ >= src_.size();
            }

            [[nodiscard]] char peek(const std::size_t offset = 0) const noexcept {
                return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
            }

            [[nodiscard]] std::size_t column() const noexcept {
                return pos_ - line_start_;
            }

            static Error error_at(std::string message, const std::size_t line) {
                return Error::parse_error(std::move(message), "line " + std::to_string(line));
            }

            static Result<LexResult, Error> fail(const Error& error) {
                return Result<LexResult, Error>::failure(error);
            }

            void consume_newline() {
                if (peek() == '\r' && peek(1) == '\n') {
                    pos_ += 2;
                } else {
                    ++pos_;
                }
                ++line_;
                line_start_ = pos_;
            }

            void mark(const std::size_t first, const std::size_t last, const unsigned char flag) {
                for (std::size_t l = first; l <= last && l < line_flags_.size(); ++l) {
                    line_flags_[l] |= flag;
                }
            }

            void emit(const TokenType type, std::string text, const std::size_t line,
                      const std::size_t col, const std::size_t end_line, const bool is_code) {
                tokens_.push_back(Token{type, std::move(text), line, col});
                token_end_lines_.push_back(end_line);
                if (is_code) {
                    mark(line, end_line, LineCode);
                    logical_line_open_ = true;
                }
            }

            void skip_comment() {
                mark(line_, line_, LineComment);
                while (!at_end() && !is_newline(peek())) {
                    ++pos_;
                }
            }

            /**
             * Measures the indentation of a new logical line and emits
             * INDENT/DEDENT tokens.
             *
             * @return false for blank or comment-only lines, which are
             *         consumed entirely and do not affect indentation.
             */
            Result<bool, Error> handle_indentation() {
                std::size_t col = 0;
                while (!at_end()) {
                    const char c = peek();
                    if (c == ' ') {
                        ++col;
                    } else if (c == '\t') {
                        col = (col / 8 + 1) * 8;
                    } else if (c == '\f') {
                        col = 0;
                    } else {
                        break;
                    }
                    ++pos_;
                }

                if (at_end()) {
                    return Result<bool, Error>::success(false);
                }

                if (peek() == '#' || is_newline(peek())) {
                    if (peek() == '#') {
                        skip_comment();
                    }
                    if (!at_end()) {
                        consume_newline();
                    }
                    return Result<bool, Error>::success(false);
                }

                if (col > indents_.back()) {
                    indents_.push_back(col);
                    emit(TokenType::Indent, "", line_, 0, line_, false);
                } else {
                    while (col < indents_.back()) {
                        indents_.pop_back();
                        emit(TokenType::Dedent, "", line_, 0, line_, false);
                    }
                    if (col != indents_.back()) {
                        return Result<bool, Error>::failure(
                            error_at("unindent does not match any outer indentation level", line_)
                        );
                    }
                }

                return Result<bool, Error>::success(true);
            }

            Result<void, Error> scan_name_or_prefixed_string() {
                const std::size_t start = pos_;
                const std::size_t col = column();
                while (!at_end() && is_ident_char(peek())) {
                    ++pos_;
                }

                const auto text = src_.substr(start, pos_ - start);
                if (peek() == '"' || peek() == '\'') {
                    std::string lowered(text);
                    std::ranges::transform(lowered, lowered.begin(), [](const unsigned char ch) {
                        return static_cast<char>(std::tolower(ch));
                    });
                    if (std::ranges::find(STRING_PREFIXES, lowered) != STRING_PREFIXES.end()) {
                        return scan_string(start);
                    }
                }

                emit(TokenType::Name, std::string(text), line_, col, line_, true);
                return Result<void, Error>::success();
            }

            void scan_number() {
                const std::size_t start = pos_;
                const std::size_t col = column();

                if (peek() == '0' && std::string_view("xXoObB").find(peek(1)) != std::string_view::npos) {
                    pos_ += 2;
                    while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
                        ++pos_;
                    }
                } else {
                    while (is_digit(peek()) || peek() == '_') ++pos_;
                    if (peek() == '.') {
                        ++pos_;
                        while (is_digit(peek()) || peek() == '_') ++pos_;
                    }
                    if ((peek() == 'e' || peek() == 'E') &&
                        (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
                        pos_ += 2;
                        while (is_digit(peek()) || peek() == '_') ++pos_;
                    }
                    if (peek() == 'j' || peek() == 'J') ++pos_;
                }

                emit(TokenType::Number, std::string(src_.substr(start, pos_ - start)), line_, col, line_, true);
            }

            /**
             * Scans a string literal whose prefix (if any) starts at @p start
             * and whose opening quote is at the current position.
             */
            Result<void, Error> scan_string(const std::size_t start) {
                const std::size_t start_line = line_;
                const std::size_t col = start - line_start_;
                const char quote = peek();
                const bool triple = peek(1) == quote && peek(2) == quote;
                pos_ += triple ? 3 : 1;

                while (true) {
                    if (at_end()) {
                        return Result<void, Error>::failure(error_at(
                            triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                            start_line
                        ));
                    }

                    const char c = peek();
                    if (c == '\\') {
                        ++pos_;
                        if (at_end()) {
                            continue;
                        }
                        if (is_newline(peek())) {
                            consume_newline();
                        } else {
                            ++pos_;
                        }
                        continue;
                    }

                    if (is_newline(c)) {
                        if (!triple) {
                            return Result<void, Error>::failure(
                                error_at("unterminated string literal", start_line)
                            );
                        }
                        consume_newline();
                        continue;
                    }

                    if (c == quote) {
                        if (!triple) {
                            ++pos_;
                            break;
                        }
                        if (peek(1) == quote && peek(2) == quote) {
                            pos_ += 3;
                            break;
                        }
                    }
                    ++pos_;
                }

                emit(TokenType::String, std::string(src_.substr(start, pos_ - start)),
                     start_line, col, line_, true);
                return Result<void, Error>::success();
            }

            Result<void, Error> scan_operator() {
                const std::size_t col = column();
                const auto rest = src_.substr(pos_);

                for (const auto op : THREE_CHAR_OPS) {
                    if (rest.starts_with(op)) {
                        pos_ += 3;
                        emit(TokenType::Op, std::string(op), line_, col, line_, true);
                        return Result<void, Error>::success();
                    }
                }

                for (const auto op : TWO_CHAR_OPS) {
                    if (rest.starts_with(op)) {
                        pos_ += 2;
                        emit(TokenType::Op, std::string(op), line_, col, line_, true);
                        return Result<void, Error>::success();
                    }
                }

                const char c = peek();
                if (SINGLE_CHAR_OPS.find(c) == std::string_view::npos) {
                    if (c == '!') {
                        return Result<void, Error>::failure(error_at("invalid syntax '!'", line_));
                    }
                    return Result<void, Error>::failure(
                        error_at(std::string("invalid character '") + c + "'", line_)
                    );
                }

                if (c == '(' || c == '[' || c == '{') {
                    brackets_.emplace_back(c, line_);
                } else if (c == ')' || c == ']' || c == '}') {
                    if (brackets_.empty()) {
                        return Result<void, Error>::failure(
                            error_at(std::string("unmatched '") + c + "'", line_)
                        );
                    }
                    const auto [open, open_line] = brackets_.back();
                    if (closing_for(open) != c) {
                        return Result<void, Error>::failure(error_at(
                            std::string("closing parenthesis '") + c +
                            "' does not match opening parenthesis '" + open + "'",
                            line_
                        ));
                    }
                    brackets_.pop_back();
                }

                ++pos_;
                emit(TokenType::Op, std::string(1, c), line_, col, line_, true);
                return Result<void, Error>::success();
            }

            [[nodiscard]] bool starts_statement(const std::size_t index) const {
                if (index == 0) return true;
                const auto prev = tokens_[index - 1].type;
                return prev == TokenType::Newline || prev == TokenType::Indent || prev == TokenType::Dedent;
            }

            RawMetrics compute_raw() {
                // Standalone string statements are documentation, not code.
                for (std::size_t i = 0; i + 1 < tokens_.size(); ++i) {
                    if (tokens_[i].type == TokenType::String &&
                        tokens_[i + 1].type == TokenType::Newline &&
                        starts_statement(i)) {
                        for (std::size_t l = tokens_[i].line; l <= token_end_lines_[i] && l < line_flags_.size(); ++l) {
                            line_flags_[l] = static_cast<unsigned char>((line_flags_[l] & ~LineCode) | LineDoc);
                        }
                    }
                }

                RawMetrics raw;
                raw.loc = count_lines(src_);

                for (std::size_t l = 1; l <= raw.loc && l < line_flags_.size(); ++l) {
                    const auto flags = line_flags_[l];
                    if (flags & LineCode) ++raw.sloc;
                    if (flags & LineComment) ++raw.comments;
                    if (flags & LineDoc) ++raw.multi;
                    if (flags == 0) ++raw.blank;
                }

                for (std::size_t i = 0; i < tokens_.size(); ++i) {
                    const auto& tok = tokens_[i];
                    if (tok.type == TokenType::Newline) {
                        ++raw.lloc;
                    } else if (tok.is_op(";") && i + 1 < tokens_.size() &&
                               tokens_[i + 1].type != TokenType::Newline) {
                        ++raw.lloc;
                    }
                }

                return raw;
            }

            std::string_view src_;
            std::size_t pos_ = 0;
            std::size_t line_ = 1;
            std::size_t line_start_ = 0;
            bool logical_line_open_ = false;

            std::vector<std::size_t> indents_{0};
            std::vector<std::pair<char, std::size_t>> brackets_;
            std::vector<Token> tokens_;
            std::vector<std::size_t> token_end_lines_;
            std::vector<unsigned char> line_flags_;
        };

    }  // namespace

    const char* to_string(const TokenType type) noexcept {
        switch (type) {
            case TokenType::Name:      return "NAME";
            case TokenType::Number:    return "NUMBER";
            case TokenType::String:    return "STRING";
            case TokenType::Op:        return "OP";
            case TokenType::Newline:   return "NEWLINE";
            case TokenType::Indent:    return "INDENT";
            case TokenType::Dedent:    return "DEDENT";
            case TokenType::EndMarker: return "ENDMARKER";
        }
        return "UNKNOWN";
    }

    bool is_keyword(const std::string_view name) noexcept {
        return std::ranges::find(KEYWORDS, name) != KEYWORDS.end();
    }

    Result<LexResult, Error> tokenize(const std::string_view source) {
        Lexer lexer(source);
        return lexer.run();
    }

}  // namespace sts::python
