//
// Created by gregorian-rayne on 10/7/26.
//

#include "sts/python/module_parser.hpp"

#include <algorithm>
#include <array>
#include <optional>

namespace sts::python {

    namespace {

        constexpr std::array<std::string_view, 11> COMPOUND_KEYWORDS = {
            "if", "elif", "else", "for", "while", "try", "except", "finally", "with", "def", "class"
        };

        /// Operators that may follow a soft `match` keyword.
        constexpr std::array<std::string_view, 6> MATCH_SUBJECT_OPENERS = {
            "(", "[", "{", "-", "*", "~"
        };

        /// Keywords that may only open a statement.
        constexpr std::array<std::string_view, 18> STATEMENT_KEYWORDS = {
            "return", "pass", "break", "continue", "del", "global", "nonlocal", "assert", "raise",
            "def", "class", "while", "with", "try", "elif", "except", "finally", "import"
        };

        /// Soft keywords that lead a statement and may be followed by a name.
        constexpr std::array<std::string_view, 3> SOFT_KEYWORDS = {
            "match", "case", "type"
        };

        /**
         * Names, numbers, strings and the constant keywords: tokens that
         * cannot directly follow one another.
         */
        bool is_operand(const Token& t) noexcept {
            if (t.type == TokenType::Number || t.type == TokenType::String) {
                return true;
            }
            if (t.type != TokenType::Name) {
                return false;
            }
            return !is_keyword(t.text) || t.text == "None" || t.text == "True" || t.text == "False";
        }

        enum class BlockKind {
            Module,
            Function,
            Class,
            Match,
            Plain
        };

        struct Block {
            BlockKind kind = BlockKind::Module;
            std::size_t scope = 0;
            std::string prefix;          // qualification for nested names
        };

        /**
         * Where the clause chain at one nesting depth currently stands.
         */
        enum class Chain {
            None,
            If,
            Loop,
            Try,
            Except,
            TryElse
        };

        Error error_at(std::string message, const std::size_t line) {
            return Error::parse_error(std::move(message), "line " + std::to_string(line));
        }

        Result<void, Error> invalid_syntax(const std::size_t line) {
            return Result<void, Error>::failure(error_at("invalid syntax", line));
        }

        class StructureBuilder {
        public:
            explicit StructureBuilder(LexResult lexed) {
                out_.tokens = std::move(lexed.tokens);
                out_.raw = lexed.raw;
                out_.scopes.push_back(Scope{ScopeKind::Module, "<module>", 1, 1, 0});
                blocks_.push_back(Block{BlockKind::Module, 0, ""});
                chains_.push_back(Chain::None);
            }

            Result<ModuleStructure, Error> run() {
                const auto& tokens = out_.tokens;
                std::size_t i = 0;

                while (i < tokens.size() && tokens[i].type != TokenType::EndMarker) {
                    const Token& tok = tokens[i];

                    if (tok.type == TokenType::Indent) {
                        if (!pending_) {
                            return fail(error_at("unexpected indent", tok.line));
                        }
                        blocks_.push_back(std::move(*pending_));
                        chains_.push_back(Chain::None);
                        pending_.reset();
                        ++i;
                        continue;
                    }

                    if (pending_) {
                        return fail(error_at("expected an indented block", tok.line));
                    }

                    if (tok.type == TokenType::Dedent) {
                        if (auto closed = close_depth(tok.line); closed.is_err()) {
                            return fail(closed.error());
                        }
                        blocks_.pop_back();
                        chains_.pop_back();
                        ++i;
                        continue;
                    }

                    std::size_t end = i;
                    while (tokens[end].type != TokenType::Newline && tokens[end].type != TokenType::EndMarker) {
                        ++end;
                    }

                    if (end > i) {
                        if (auto processed = process_line(i, end); processed.is_err()) {
                            return fail(processed.error());
                        }
                    }

                    i = tokens[end].type == TokenType::Newline ? end + 1 : end;
                }

                const std::size_t last_line = tokens.empty() ? 1 : tokens.back().line;
                if (pending_) {
                    return fail(error_at("expected an indented block", last_line));
                }
                while (!chains_.empty()) {
                    if (auto closed = close_depth(last_line); closed.is_err()) {
                        return fail(closed.error());
                    }
                    chains_.pop_back();
                }

                out_.scopes[0].end_line = std::max<std::size_t>(out_.raw.loc, 1);
                return Result<ModuleStructure, Error>::success(std::move(out_));
            }

        private:
            static Result<ModuleStructure, Error> fail(const Error& error) {
                return Result<ModuleStructure, Error>::failure(error);
            }

            [[nodiscard]] const Token& at(const std::size_t index) const {
                return out_.tokens[index];
            }

            Result<void, Error> close_depth(const std::size_t line) const {
                if (chains_.back() == Chain::Try) {
                    return Result<void, Error>::failure(
                        error_at("expected 'except' or 'finally' block", line)
                    );
                }
                return Result<void, Error>::success();
            }

            /**
             * Finds the ':' that ends a compound header: the first one at
             * bracket depth zero that does not belong to a lambda.
             */
            [[nodiscard]] std::optional<std::size_t> header_colon(const std::size_t begin, const std::size_t end) const {
                int depth = 0;
                int open_lambdas = 0;
                for (std::size_t k = begin; k < end; ++k) {
                    const Token& t = at(k);
                    if (t.type == TokenType::Op) {
                        if (t.text == "(" || t.text == "[" || t.text == "{") {
                            ++depth;
                        } else if (t.text == ")" || t.text == "]" || t.text == "}") {
                            --depth;
                        } else if (t.text == ":" && depth == 0) {
                            if (open_lambdas > 0) {
                                --open_lambdas;
                            } else {
                                return k;
                            }
                        }
                    } else if (depth == 0 && t.is_name("lambda")) {
                        ++open_lambdas;
                    }
                }
                return std::nullopt;
            }

            [[nodiscard]] bool is_match_statement(const std::size_t begin, const std::size_t end) const {
                if (end - begin < 3 || !at(end - 1).is_op(":")) {
                    return false;
                }
                const Token& subject = at(begin + 1);
                if (subject.type == TokenType::Op) {
                    return std::ranges::find(MATCH_SUBJECT_OPENERS, subject.text) != MATCH_SUBJECT_OPENERS.end();
                }
                if (subject.type == TokenType::Name && is_keyword(subject.text)) {
                    return subject.text == "None" || subject.text == "True" ||
                           subject.text == "False" || subject.text == "not" ||
                           subject.text == "lambda" || subject.text == "await";
                }
                const auto colon = header_colon(begin, end);
                return colon.has_value() && *colon == end - 1;
            }

            /**
             * A case pattern is irrefutable when it is a lone `_` or a lone
             * capture name with no guard.
             */
            [[nodiscard]] bool is_irrefutable_case(const std::size_t begin, const std::size_t colon) const {
                if (colon != begin + 2) {
                    return false;
                }
                const Token& pattern = at(begin + 1);
                return pattern.type == TokenType::Name &&
                       (pattern.text == "_" || !is_keyword(pattern.text));
            }

            /**
             * Token-level checks on a statement or header expression:
             * no two operands in a row (implicit string concatenation
             * aside), no statement keyword after the first token, no '= ='.
             *
             * @param opens_statement begin is the first token of a statement
             */
            [[nodiscard]] Result<void, Error> check_tokens(const std::size_t begin, const std::size_t end,
                                                           const bool opens_statement) const {
                std::optional<std::size_t> start;
                if (opens_statement) {
                    start = begin;
                }

                for (std::size_t k = begin; k < end; ++k) {
                    const Token& cur = at(k);
                    if (cur.is_op(";")) {
                        start = k + 1;
                        continue;
                    }

                    const bool leads = start.has_value() && *start == k;
                    if (!leads && cur.type == TokenType::Name &&
                        std::ranges::find(STATEMENT_KEYWORDS, cur.text) != STATEMENT_KEYWORDS.end()) {
                        // from x import y
                        const bool from_import = cur.text == "import" && start.has_value() &&
                                                 at(*start).is_name("from");
                        if (!from_import) {
                            return invalid_syntax(cur.line);
                        }
                    }

                    if (k == begin || leads) {
                        continue;
                    }

                    const Token& prev = at(k - 1);
                    if (prev.is_op("=") && cur.is_op("=")) {
                        return invalid_syntax(cur.line);
                    }

                    if (!is_operand(prev) || !is_operand(cur)) {
                        continue;
                    }
                    if (prev.type == TokenType::String && cur.type == TokenType::String) {
                        continue;
                    }

                    const bool prev_leads = start.has_value() && *start == k - 1;
                    if (prev_leads && std::ranges::find(SOFT_KEYWORDS, prev.text) != SOFT_KEYWORDS.end()) {
                        continue;
                    }
                    if (prev_leads && prev.is_name("print")) {
                        return Result<void, Error>::failure(
                            error_at("Missing parentheses in call to 'print'", prev.line)
                        );
                    }
                    return invalid_syntax(cur.line);
                }

                return Result<void, Error>::success();
            }

            /**
             * A for header needs an 'in' at bracket depth zero with a
             * target before it and an iterable after it.
             */
            [[nodiscard]] bool has_loop_in(const std::size_t begin, const std::size_t colon) const {
                int depth = 0;
                for (std::size_t k = begin; k < colon; ++k) {
                    const Token& t = at(k);
                    if (t.is_op("(") || t.is_op("[") || t.is_op("{")) {
                        ++depth;
                    } else if (t.is_op(")") || t.is_op("]") || t.is_op("}")) {
                        --depth;
                    } else if (depth == 0 && t.is_name("in")) {
                        return k > begin && k + 1 < colon;
                    }
                }
                return false;
            }

            void add_statement(Statement statement) {
                const std::size_t last = statement.end > statement.begin
                    ? at(statement.end - 1).line
                    : statement.line;
                out_.scopes[statement.scope].end_line = std::max(out_.scopes[statement.scope].end_line, last);
                for (const auto& block : blocks_) {
                    auto& scope = out_.scopes[block.scope];
                    scope.end_line = std::max(scope.end_line, last);
                }
                out_.statements.push_back(statement);
            }

            std::string qualify(const std::string& name) const {
                const auto& prefix = blocks_.back().prefix;
                return prefix.empty() ? name : prefix + "." + name;
            }

            Result<void, Error> process_line(const std::size_t begin, const std::size_t end) {
                const Token& first = at(begin);
                const Block& block = blocks_.back();
                Chain& chain = chains_.back();

                std::string_view keyword;
                std::size_t keyword_index = begin;
                bool is_async = false;

                if (first.type == TokenType::Name) {
                    if (first.text == "async" && begin + 1 < end &&
                        (at(begin + 1).is_name("def") || at(begin + 1).is_name("for") ||
                         at(begin + 1).is_name("with"))) {
                        keyword = at(begin + 1).text;
                        keyword_index = begin + 1;
                        is_async = true;
                    } else if (std::ranges::find(COMPOUND_KEYWORDS, first.text) != COMPOUND_KEYWORDS.end()) {
                        keyword = first.text;
                    } else if (first.text == "case" && block.kind == BlockKind::Match) {
                        keyword = "case";
                    } else if (first.text == "match" && is_match_statement(begin, end)) {
                        keyword = "match";
                    }
                }

                if (block.kind == BlockKind::Match && keyword != "case") {
                    return Result<void, Error>::failure(error_at("expected 'case' block", first.line));
                }

                const bool continues_chain = keyword == "elif" || keyword == "else" ||
                                             keyword == "except" || keyword == "finally";
                if (!continues_chain && chain == Chain::Try) {
                    return Result<void, Error>::failure(
                        error_at("expected 'except' or 'finally' block", first.line)
                    );
                }

                if (keyword.empty()) {
                    if (auto checked = check_tokens(begin, end, true); checked.is_err()) {
                        return checked;
                    }
                    add_statement(Statement{ClauseKind::Simple, block.scope, begin, end, first.line});
                    chain = Chain::None;
                    return Result<void, Error>::success();
                }

                const auto colon = header_colon(keyword_index, end);
                if (!colon) {
                    return Result<void, Error>::failure(error_at("expected ':'", first.line));
                }

                ClauseKind kind = ClauseKind::Simple;
                Chain next_chain = Chain::None;
                const bool empty_header = *colon == keyword_index + 1;

                if (keyword == "else" || keyword == "try" || keyword == "finally") {
                    if (!empty_header) {
                        return Result<void, Error>::failure(error_at("expected ':'", first.line));
                    }
                } else if (keyword == "if" || keyword == "elif" || keyword == "while" ||
                           keyword == "for" || keyword == "with") {
                    if (empty_header) {
                        return invalid_syntax(first.line);
                    }
                }

                if (keyword == "if") {
                    kind = ClauseKind::If;
                    next_chain = Chain::If;
                } else if (keyword == "elif") {
                    if (chain != Chain::If) {
                        return Result<void, Error>::failure(error_at("'elif' without matching 'if'", first.line));
                    }
                    kind = ClauseKind::Elif;
                    next_chain = Chain::If;
                } else if (keyword == "else") {
                    switch (chain) {
                        case Chain::If:     kind = ClauseKind::Else; break;
                        case Chain::Loop:   kind = ClauseKind::LoopElse; break;
                        case Chain::Except: kind = ClauseKind::TryElse; next_chain = Chain::TryElse; break;
                        default:
                            return Result<void, Error>::failure(error_at("'else' without matching clause", first.line));
                    }
                } else if (keyword == "for" || keyword == "while") {
                    if (keyword == "for" && !has_loop_in(keyword_index + 1, *colon)) {
                        return invalid_syntax(first.line);
                    }
                    kind = keyword == "for" ? ClauseKind::For : ClauseKind::While;
                    next_chain = Chain::Loop;
                } else if (keyword == "try") {
                    kind = ClauseKind::Try;
                    next_chain = Chain::Try;
                } else if (keyword == "except") {
                    if (chain != Chain::Try && chain != Chain::Except) {
                        return Result<void, Error>::failure(error_at("'except' without matching 'try'", first.line));
                    }
                    kind = ClauseKind::Except;
                    next_chain = Chain::Except;
                } else if (keyword == "finally") {
                    if (chain != Chain::Try && chain != Chain::Except && chain != Chain::TryElse) {
                        return Result<void, Error>::failure(error_at("'finally' without matching 'try'", first.line));
                    }
                    kind = ClauseKind::Finally;
                } else if (keyword == "with") {
                    kind = ClauseKind::With;
                } else if (keyword == "def") {
                    kind = ClauseKind::Def;
                } else if (keyword == "class") {
                    kind = ClauseKind::Class;
                } else if (keyword == "match") {
                    kind = ClauseKind::Match;
                } else if (keyword == "case") {
                    kind = ClauseKind::Case;
                }

                Statement header{kind, block.scope, begin, *colon, first.line, is_async};
                if (kind == ClauseKind::Case) {
                    header.irrefutable = is_irrefutable_case(begin, *colon);
                }

                Block body{BlockKind::Plain, block.scope, block.prefix};

                if (kind == ClauseKind::Def || kind == ClauseKind::Class) {
                    const std::size_t name_index = keyword_index + 1;
                    if (name_index >= *colon || at(name_index).type != TokenType::Name ||
                        is_keyword(at(name_index).text)) {
                        return Result<void, Error>::failure(error_at("invalid syntax", first.line));
                    }
                    const auto qualified = qualify(at(name_index).text);

                    if (kind == ClauseKind::Def) {
                        out_.scopes.push_back(Scope{ScopeKind::Function, qualified, first.line, first.line, block.scope});
                        body = Block{BlockKind::Function, out_.scopes.size() - 1, qualified};
                    } else {
                        body = Block{BlockKind::Class, block.scope, qualified};
                    }
                } else if (kind == ClauseKind::Match) {
                    body.kind = BlockKind::Match;
                }

                if (auto checked = check_tokens(keyword_index + 1, *colon, false); checked.is_err()) {
                    return checked;
                }

                add_statement(header);
                chain = next_chain;

                if (*colon + 1 == end) {
                    pending_ = std::move(body);
                    return Result<void, Error>::success();
                }

                if (kind == ClauseKind::Match) {
                    return Result<void, Error>::failure(error_at("expected an indented block", first.line));
                }

                if (auto checked = check_tokens(*colon + 1, end, true); checked.is_err()) {
                    return checked;
                }
                add_statement(Statement{ClauseKind::Simple, body.scope, *colon + 1, end, at(*colon + 1).line});
                return Result<void, Error>::success();
            }

            ModuleStructure out_;
            std::vector<Block> blocks_;
            std::vector<Chain> chains_;
            std::optional<Block> pending_;
        };

    }  // namespace

    const char* to_string(const ClauseKind kind) noexcept {
        switch (kind) {
            case ClauseKind::Simple:   return "simple";
            case ClauseKind::If:       return "if";
            case ClauseKind::Elif:     return "elif";
            case ClauseKind::Else:     return "else";
            case ClauseKind::LoopElse: return "loop-else";
            case ClauseKind::TryElse:  return "try-else";
            case ClauseKind::For:      return "for";
            case ClauseKind::While:    return "while";
            case ClauseKind::Try:      return "try";
            case ClauseKind::Except:   return "except";
            case ClauseKind::Finally:  return "finally";
            case ClauseKind::With:     return "with";
            case ClauseKind::Def:      return "def";
            case ClauseKind::Class:    return "class";
            case ClauseKind::Match:    return "match";
            case ClauseKind::Case:     return "case";
        }
        return "unknown";
    }

    Result<ModuleStructure, Error> parse_module(const std::string_view source) {
        auto lexed = tokenize(source);
        if (lexed.is_err()) {
            return Result<ModuleStructure, Error>::failure(lexed.error());
        }

        StructureBuilder builder(std::move(lexed).value());
        return builder.run();
    }

}  // namespace sts::python
