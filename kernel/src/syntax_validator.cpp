#include "exec_kernel/syntax_validator.h"
#include "exec_kernel/python_parser.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

namespace exec_kernel {

SyntaxCheck SyntaxCheck::error(std::string message, int line, int column) {
    SyntaxCheck c;
    c.valid = false;
    c.message = std::move(message);
    c.line = line;
    c.column = column;
    return c;
}

std::string SyntaxCheck::describe() const {
    if (valid) return "valid";
    return "Syntax error at line " + std::to_string(line) + ": " + message;
}

namespace {

constexpr int kTabSize = 8;

bool is_compound_keyword(const std::string& word) {
    static const char* const keywords[] = {
        "if", "elif", "else", "for", "while", "try", "except",
        "finally", "with", "def", "class", "async",
    };
    for (const char* kw : keywords) {
        if (word == kw) return true;
    }
    return false;
}

// "match" and "case" are only keywords when they open a block.
bool is_soft_keyword(const std::string& word) {
    return word == "match" || word == "case";
}

bool is_string_prefix(const std::string& word) {
    if (word.empty() || word.size() > 2) return false;
    std::string lower;
    for (char c : word) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
           lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
}

bool is_ident_start(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

char closer_for(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

struct Bracket {
    char ch;
    int line;
    int column;
};

struct Indent {
    int col;  // tabs expanded to kTabSize
    int alt;  // tabs counted as one column
};

class PythonScanner {
public:
    PythonScanner(const std::string& code, int max_nesting)
        : max_nesting_(max_nesting) {
        // Normalise \r\n and lone \r to \n.
        src_.reserve(code.size());
        for (size_t i = 0; i < code.size(); ++i) {
            if (code[i] == '\r') {
                src_ += '\n';
                if (i + 1 < code.size() && code[i + 1] == '\n') ++i;
            } else {
                src_ += code[i];
            }
        }
    }

    SyntaxCheck run() {
        auto nul = src_.find('\0');
        if (nul != std::string::npos) {
            int line = 1 + static_cast<int>(std::count(src_.begin(), src_.begin() + static_cast<long>(nul), '\n'));
            return SyntaxCheck::error("source code cannot contain null bytes", line, 0);
        }

        indents_.push_back({0, 0});
        while (pos_ < src_.size()) {
            Indent ind = measure_indent();
            if (pos_ >= src_.size()) break;

            char c = src_[pos_];
            if (c == '\n' || c == '#') {
                skip_to_next_line();
                continue;
            }

            if (auto err = check_indent(ind)) return *err;
            if (auto err = scan_logical_line()) return *err;
        }

        if (expect_block_) return missing_block(line_);
        return SyntaxCheck::ok();
    }

private:
    int column() const { return static_cast<int>(pos_ - line_start_) + 1; }

    void newline_at(size_t p) {
        ++line_;
        line_start_ = p + 1;
    }

    SyntaxCheck fail(const std::string& msg) const {
        return SyntaxCheck::error(msg, line_, column());
    }

    SyntaxCheck missing_block(int at_line) const {
        return SyntaxCheck::error(
            "expected an indented block after '" + block_keyword_ + "' statement on line " +
                std::to_string(block_line_),
            at_line, 1);
    }

    Indent measure_indent() {
        Indent ind{0, 0};
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == ' ') {
                ++ind.col;
                ++ind.alt;
            } else if (c == '\t') {
                ind.col = (ind.col / kTabSize + 1) * kTabSize;
                ++ind.alt;
            } else if (c == '\f') {
                ind = {0, 0};
            } else {
                break;
            }
            ++pos_;
        }
        return ind;
    }

    void skip_to_next_line() {
        while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        if (pos_ < src_.size()) {
            newline_at(pos_);
            ++pos_;
        }
    }

    std::optional<SyntaxCheck> check_indent(const Indent& ind) {
        static const char* const kTabError = "inconsistent use of tabs and spaces in indentation";
        const Indent top = indents_.back();

        if (expect_block_) {
            if (ind.col <= top.col) return missing_block(line_);
            if (ind.alt <= top.alt) return fail(kTabError);
            indents_.push_back(ind);
            expect_block_ = false;
            return std::nullopt;
        }

        if (ind.col == top.col) {
            if (ind.alt != top.alt) return fail(kTabError);
            return std::nullopt;
        }
        if (ind.col > top.col) return fail("unexpected indent");

        while (indents_.size() > 1 && ind.col < indents_.back().col) indents_.pop_back();
        if (ind.col != indents_.back().col) {
            return fail("unindent does not match any outer indentation level");
        }
        if (ind.alt != indents_.back().alt) return fail(kTabError);
        return std::nullopt;
    }

    std::optional<SyntaxCheck> scan_string(size_t quote_pos, int start_line, int start_col) {
        pos_ = quote_pos;
        const char q = src_[pos_];
        const bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == q && src_[pos_ + 2] == q;
        pos_ += triple ? 3 : 1;

        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\') {
                if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') newline_at(pos_ + 1);
                pos_ += 2;
                continue;
            }
            if (c == '\n') {
                if (!triple) {
                    return SyntaxCheck::error(
                        "unterminated string literal (detected at line " + std::to_string(line_) + ")",
                        start_line, start_col);
                }
                newline_at(pos_);
                ++pos_;
                continue;
            }
            if (c == q) {
                if (!triple) {
                    ++pos_;
                    return std::nullopt;
                }
                if (pos_ + 2 < src_.size() && src_[pos_ + 1] == q && src_[pos_ + 2] == q) {
                    pos_ += 3;
                    return std::nullopt;
                }
            }
            ++pos_;
        }

        std::string what = triple ? "unterminated triple-quoted string literal" : "unterminated string literal";
        return SyntaxCheck::error(what + " (detected at line " + std::to_string(line_) + ")",
                                  start_line, start_col);
    }

    std::optional<SyntaxCheck> scan_logical_line() {
        const int logical_line = line_;
        std::string first_word;
        bool first_token = true;
        bool saw_colon = false;
        char last = 0;  // class of the last significant token

        while (pos_ < src_.size()) {
            const char c = src_[pos_];

            if (c == '\n') {
                newline_at(pos_);
                ++pos_;
                if (!brackets_.empty()) continue;
                return finish_logical_line(logical_line, first_word, saw_colon, last);
            }
            if (c == ' ' || c == '\t' || c == '\f') {
                ++pos_;
                continue;
            }
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
                continue;
            }
            if (c == '\\') {
                if (pos_ + 1 >= src_.size()) return fail("unexpected EOF while parsing");
                if (src_[pos_ + 1] != '\n') {
                    return fail("unexpected character after line continuation character");
                }
                newline_at(pos_ + 1);
                pos_ += 2;
                if (pos_ >= src_.size()) return fail("unexpected EOF while parsing");
                continue;
            }

            if (c == '"' || c == '\'') {
                if (auto err = scan_string(pos_, line_, column())) return err;
                first_token = false;
                last = 's';
                continue;
            }

            if (is_ident_start(c)) {
                const size_t start = pos_;
                const int start_col = column();
                while (pos_ < src_.size() && is_ident_char(src_[pos_])) ++pos_;
                std::string word = src_.substr(start, pos_ - start);
                if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && is_string_prefix(word)) {
                    if (auto err = scan_string(pos_, line_, start_col)) return err;
                    last = 's';
                } else {
                    if (first_token) first_word = word;
                    last = 'a';
                }
                first_token = false;
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && pos_ + 1 < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                ++pos_;
                while (pos_ < src_.size()) {
                    char d = src_[pos_];
                    if (is_ident_char(d) || d == '.') {
                        ++pos_;
                    } else if ((d == '+' || d == '-') && (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')) {
                        ++pos_;
                    } else {
                        break;
                    }
                }
                first_token = false;
                last = '0';
                continue;
            }

            first_token = false;
            switch (c) {
                case '(':
                case '[':
                case '{':
                    if (static_cast<int>(brackets_.size()) >= max_nesting_) {
                        return fail("too many nested parentheses");
                    }
                    brackets_.push_back({c, line_, column()});
                    last = 'o';
                    ++pos_;
                    break;
                case ')':
                case ']':
                case '}': {
                    if (brackets_.empty()) return fail(std::string("unmatched '") + c + "'");
                    const Bracket open = brackets_.back();
                    if (closer_for(open.ch) != c) {
                        std::string msg = std::string("closing parenthesis '") + c +
                                          "' does not match opening parenthesis '" + open.ch + "'";
                        if (open.line != line_) msg += " on line " + std::to_string(open.line);
                        return fail(msg);
                    }
                    brackets_.pop_back();
                    last = ')';
                    ++pos_;
                    break;
                }
                case ':':
                    if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '=') {
                        pos_ += 2;
                        last = 'o';
                    } else {
                        if (brackets_.empty()) saw_colon = true;
                        last = ':';
                        ++pos_;
                    }
                    break;
                case '!':
                    if (pos_ + 1 >= src_.size() || src_[pos_ + 1] != '=') return fail("invalid syntax");
                    pos_ += 2;
                    last = 'o';
                    break;
                case '$':
                case '?':
                case '`':
                    return fail("invalid syntax");
                default:
                    last = 'o';
                    ++pos_;
                    break;
            }
        }

        if (!brackets_.empty()) {
            const Bracket open = brackets_.back();
            return SyntaxCheck::error(std::string("'") + open.ch + "' was never closed", open.line, open.column);
        }
        return finish_logical_line(logical_line, first_word, saw_colon, last);
    }

    std::optional<SyntaxCheck> finish_logical_line(int logical_line, const std::string& first_word,
                                                   bool saw_colon, char last) {
        const bool compound = is_compound_keyword(first_word) ||
                              (is_soft_keyword(first_word) && last == ':');
        if (compound) {
            if (!saw_colon) return SyntaxCheck::error("expected ':'", logical_line, 0);
            if (last == ':') {
                expect_block_ = true;
                block_keyword_ = first_word;
                block_line_ = logical_line;
            }
        } else if (last == ':') {
            return SyntaxCheck::error("invalid syntax", logical_line, 0);
        }
        return std::nullopt;
    }

    std::string src_;
    int max_nesting_;
    size_t pos_ = 0;
    size_t line_start_ = 0;
    int line_ = 1;

    std::vector<Indent> indents_;
    std::vector<Bracket> brackets_;
    bool expect_block_ = false;
    std::string block_keyword_;
    int block_line_ = 0;
};

} // anonymous namespace

PythonSyntaxValidator::PythonSyntaxValidator(int max_nesting)
    : max_nesting_(max_nesting > 0 ? max_nesting : 200) {}

SyntaxCheck PythonSyntaxValidator::check(const std::string& code) const {
    // The scan is cheap, bounds nesting before the parser sees the input and
    // reports the common mistakes; the grammar itself is CPython's.
    PythonScanner scanner(code, max_nesting_);
    SyntaxCheck structural = scanner.run();
    if (!structural.valid) return structural;
    return PythonParser::parse(code);
}

} // namespace exec_kernel
