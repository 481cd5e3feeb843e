#include "src/server/precheck.h"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace aiexec {

namespace {

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentContinue(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {}

    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek(size_t ahead = 0) const { return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0'; }
    size_t pos() const { return pos_; }
    int line() const { return line_; }
    int column() const { return column_; }

    char Advance() {
        char c = text_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    void AdvanceTo(size_t target) {
        while (pos_ < target && !AtEnd()) Advance();
    }

    size_t Find(const std::string& needle) const { return text_.find(needle, pos_); }

    std::string Word() {
        std::string word;
        while (!AtEnd() && IsIdentContinue(Peek())) word += Advance();
        return word;
    }

    void SkipInlineSpace() {
        while (Peek() == ' ' || Peek() == '\t') Advance();
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
};

struct OpenBracket {
    char bracket;
    int line;
    int column;
};

char Closing(char open) {
    return open == '(' ? ')' : open == '[' ? ']' : '}';
}

bool IsOpening(char c) { return c == '(' || c == '[' || c == '{'; }
bool IsClosing(char c) { return c == ')' || c == ']' || c == '}'; }

// Shared bookkeeping for both scanners.
class ScannerBase {
protected:
    ScannerBase(const std::string& source, const std::string& entry) : cur_(source), entry_(entry) {}

    void Fail(int line, int column, const std::string& message) {
        if (failed_) return;
        failed_ = true;
        diagnostics_.push_back(Diagnostic{line, column, message});
    }

    // Returns false after recording a mismatch.
    bool Bracket(char c) {
        if (IsOpening(c)) {
            open_.push_back(OpenBracket{c, cur_.line(), cur_.column()});
            cur_.Advance();
            return true;
        }
        if (open_.empty()) {
            Fail(cur_.line(), cur_.column(), std::string("unmatched '") + c + "'");
            return false;
        }
        if (Closing(open_.back().bracket) != c) {
            Fail(cur_.line(), cur_.column(), std::string("closing bracket '") + c +
                 "' does not match opening bracket '" + open_.back().bracket + "' on line " +
                 std::to_string(open_.back().line));
            return false;
        }
        open_.pop_back();
        cur_.Advance();
        return true;
    }

    Cursor cur_;
    std::string entry_;
    std::vector<OpenBracket> open_;
    std::vector<Diagnostic> diagnostics_;
    bool failed_ = false;
    bool entry_found_ = false;
};

class PythonScanner : public ScannerBase {
public:
    PythonScanner(const std::string& source, const std::string& entry) : ScannerBase(source, entry) {}

    std::vector<Diagnostic> Run() {
        while (!failed_ && !cur_.AtEnd()) {
            if (at_line_start_) {
                StartLine();
                continue;
            }

            char c = cur_.Peek();
            if (c == '\n') {
                EndLine();
                continue;
            }
            if (c == '#') {
                while (!cur_.AtEnd() && cur_.Peek() != '\n') cur_.Advance();
                continue;
            }
            if (c == '\\') {
                int line = cur_.line();
                int column = cur_.column();
                cur_.Advance();
                if (cur_.Peek() == '\r') cur_.Advance();
                if (cur_.Peek() != '\n') {
                    Fail(line, column, "unexpected character after line continuation character");
                    break;
                }
                cur_.Advance();
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
                cur_.Advance();
                continue;
            }

            line_has_content_ = true;
            if (c == '"' || c == '\'') {
                ScanString();
                last_ = '"';
                continue;
            }
            if (IsIdentStart(c)) {
                std::string word = cur_.Word();
                char next = cur_.Peek();
                if ((next == '"' || next == '\'') && IsStringPrefix(word)) {
                    ScanString();
                    last_ = '"';
                } else {
                    last_ = 'a';
                }
                continue;
            }
            if (IsOpening(c) || IsClosing(c)) {
                if (!Bracket(c)) break;
                last_ = c;
                continue;
            }
            last_ = cur_.Advance();
        }

        if (!failed_) Finish();
        return std::move(diagnostics_);
    }

private:
    // Indentation width with tabs to multiples of 8, and with tabs counted as 1.
    // Both orderings must agree, as CPython's tokenizer requires.
    struct Indent {
        int width;
        int alt;
    };

    static bool IsStringPrefix(const std::string& word) {
        if (word.size() > 2) return false;
        std::string lower;
        for (char c : word) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
               lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
    }

    void StartLine() {
        at_line_start_ = false;

        Indent indent{0, 0};
        while (cur_.Peek() == ' ' || cur_.Peek() == '\t' || cur_.Peek() == '\f') {
            char c = cur_.Advance();
            if (c == '\t') {
                indent.width = (indent.width / 8 + 1) * 8;
                indent.alt += 1;
            } else if (c == ' ') {
                indent.width += 1;
                indent.alt += 1;
            } else {
                indent = Indent{0, 0};
            }
        }

        char c = cur_.Peek();
        if (cur_.AtEnd() || c == '\n' || c == '\r' || c == '#') return;

        int line = cur_.line();
        int column = cur_.column();
        const Indent& top = indents_.back();
        if (expect_indent_) {
            expect_indent_ = false;
            if (indent.width <= top.width) {
                Fail(line, column, "expected an indented block");
                return;
            }
            if (indent.alt <= top.alt) {
                Fail(line, 1, "inconsistent use of tabs and spaces in indentation");
                return;
            }
            indents_.push_back(indent);
        } else if (indent.width > top.width) {
            Fail(line, column, "unexpected indent");
            return;
        } else {
            while (indent.width < indents_.back().width) indents_.pop_back();
            if (indent.width != indents_.back().width) {
                Fail(line, column, "unindent does not match any outer indentation level");
                return;
            }
            if (indent.alt != indents_.back().alt) {
                Fail(line, 1, "inconsistent use of tabs and spaces in indentation");
                return;
            }
        }

        if (indent.width == 0) NoteTopLevel();
    }

    void EndLine() {
        cur_.Advance();
        if (!open_.empty()) return;
        if (line_has_content_) expect_indent_ = last_ == ':';
        line_has_content_ = false;
        at_line_start_ = true;
    }

    // def/class/assignment binding the entry point at module level.
    void NoteTopLevel() {
        Cursor look = cur_;
        std::string word = look.Word();
        if (word == "async") {
            look.SkipInlineSpace();
            word = look.Word();
        }
        if (word == "def" || word == "class") {
            look.SkipInlineSpace();
            if (look.Word() == entry_) entry_found_ = true;
            return;
        }
        if (word == entry_) {
            look.SkipInlineSpace();
            if ((look.Peek() == '=' && look.Peek(1) != '=') || look.Peek() == ':') entry_found_ = true;
        }
    }

    void ScanString() {
        int line = cur_.line();
        int column = cur_.column();
        char quote = cur_.Peek();
        bool triple = cur_.Peek(1) == quote && cur_.Peek(2) == quote;

        cur_.Advance();
        if (triple) {
            cur_.Advance();
            cur_.Advance();
        }
        while (!cur_.AtEnd()) {
            char c = cur_.Peek();
            if (c == '\\') {
                cur_.Advance();
                if (!cur_.AtEnd()) cur_.Advance();
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    cur_.Advance();
                    return;
                }
                if (cur_.Peek(1) == quote && cur_.Peek(2) == quote) {
                    cur_.Advance();
                    cur_.Advance();
                    cur_.Advance();
                    return;
                }
            }
            if (c == '\n' && !triple) break;
            cur_.Advance();
        }
        Fail(line, column, triple ? "unterminated triple-quoted string literal" : "unterminated string literal");
    }

    void Finish() {
        if (!open_.empty()) {
            const OpenBracket& open = open_.back();
            Fail(open.line, open.column, std::string("'") + open.bracket + "' was never closed");
            return;
        }
        if (expect_indent_) {
            Fail(cur_.line(), 1, "expected an indented block");
            return;
        }
        if (!entry_found_) {
            diagnostics_.push_back(Diagnostic{0, 0, "entry point '" + entry_ + "' is not defined at module level"});
        }
    }

    std::vector<Indent> indents_{Indent{0, 0}};
    bool at_line_start_ = true;
    bool line_has_content_ = false;
    bool expect_indent_ = false;
    char last_ = '\0';
};

class CppScanner : public ScannerBase {
public:
    CppScanner(const std::string& source, const std::string& entry) : ScannerBase(source, entry) {}

    std::vector<Diagnostic> Run() {
        bool line_start = true;
        while (!failed_ && !cur_.AtEnd()) {
            char c = cur_.Peek();
            if (c == '\n') {
                cur_.Advance();
                line_start = true;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                cur_.Advance();
                continue;
            }
            if (c == '\\' && cur_.Peek(1) == '\n') {
                cur_.Advance();
                cur_.Advance();
                continue;
            }
            if (c == '/' && cur_.Peek(1) == '/') {
                SkipLineComment();
                continue;
            }
            if (c == '/' && cur_.Peek(1) == '*') {
                SkipBlockComment();
                continue;
            }
            if (c == '#' && line_start) {
                Directive();
                continue;
            }

            line_start = false;
            if (c == '"' || c == '\'') {
                ScanQuoted(cur_.line(), cur_.column());
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(cur_.Peek(1))))) {
                ScanNumber();
                continue;
            }
            if (IsIdentStart(c)) {
                Identifier();
                continue;
            }
            if (IsOpening(c) || IsClosing(c)) {
                if (!Bracket(c)) break;
                continue;
            }
            cur_.Advance();
        }

        if (!failed_) Finish();
        return std::move(diagnostics_);
    }

private:
    void Identifier() {
        int line = cur_.line();
        int column = cur_.column();
        std::string word = cur_.Word();
        char next = cur_.Peek();

        if (next == '"' && (word == "R" || word == "LR" || word == "uR" || word == "UR" || word == "u8R")) {
            ScanRawString(line, column);
            return;
        }
        if ((next == '"' || next == '\'') && (word == "L" || word == "u" || word == "U" || word == "u8")) {
            ScanQuoted(line, column);
            return;
        }

        if (open_.empty() && (word == entry_ || word == "main")) {
            Cursor look = cur_;
            while (std::isspace(static_cast<unsigned char>(look.Peek()))) look.Advance();
            if (look.Peek() != '(') return;
            if (word == entry_) {
                entry_found_ = true;
            } else {
                Fail(line, column, "submissions must not define main()");
            }
        }
    }

    void Directive() {
        int line = cur_.line();
        int column = cur_.column();
        cur_.Advance();
        cur_.SkipInlineSpace();
        std::string name = cur_.Word();

        std::string rest;
        while (!failed_ && !cur_.AtEnd() && cur_.Peek() != '\n') {
            char c = cur_.Peek();
            if (c == '\\' && cur_.Peek(1) == '\n') {
                cur_.Advance();
                cur_.Advance();
            } else if (c == '/' && cur_.Peek(1) == '/') {
                SkipLineComment();
            } else if (c == '/' && cur_.Peek(1) == '*') {
                SkipBlockComment();
                rest += ' ';
            } else {
                rest += cur_.Advance();
            }
        }

        if (name == "include" || name == "include_next" || name == "import") {
            CheckInclude(rest, line, column);
        }
    }

    void CheckInclude(const std::string& text, int line, int column) {
        size_t start = text.find_first_not_of(" \t");
        if (start == std::string::npos) {
            Fail(line, column, "#include expects \"FILENAME\" or <FILENAME>");
            return;
        }
        if (text[start] == '"') {
            Fail(line, column, "only system headers may be included; there are no local files to include");
            return;
        }
        if (text[start] != '<') {
            Fail(line, column, "computed #include directives are not allowed");
            return;
        }
        size_t end = text.find('>', start + 1);
        if (end == std::string::npos) {
            Fail(line, column, "missing terminating > character");
            return;
        }
        std::string header = text.substr(start + 1, end - start - 1);
        if (header.empty() || header[0] == '/' || header.find("..") != std::string::npos) {
            Fail(line, column, "include path must name a system header");
        }
    }

    void SkipLineComment() {
        while (!cur_.AtEnd() && cur_.Peek() != '\n') {
            if (cur_.Peek() == '\\' && cur_.Peek(1) == '\n') cur_.Advance();
            cur_.Advance();
        }
    }

    void SkipBlockComment() {
        int line = cur_.line();
        int column = cur_.column();
        cur_.Advance();
        cur_.Advance();
        size_t end = cur_.Find("*/");
        if (end == std::string::npos) {
            Fail(line, column, "unterminated comment");
            return;
        }
        cur_.AdvanceTo(end + 2);
    }

    void ScanQuoted(int line, int column) {
        char quote = cur_.Advance();
        while (!cur_.AtEnd()) {
            char c = cur_.Peek();
            if (c == '\\') {
                cur_.Advance();
                if (!cur_.AtEnd()) cur_.Advance();
                continue;
            }
            if (c == quote) {
                cur_.Advance();
                return;
            }
            if (c == '\n') break;
            cur_.Advance();
        }
        Fail(line, column, std::string("missing terminating ") + quote + " character");
    }

    void ScanRawString(int line, int column) {
        cur_.Advance();
        std::string delimiter;
        while (!cur_.AtEnd() && cur_.Peek() != '(') {
            char c = cur_.Peek();
            if (delimiter.size() >= 16 || c == ' ' || c == ')' || c == '\\' || c == '\n' || c == '\t') {
                Fail(line, column, "invalid raw string delimiter");
                return;
            }
            delimiter += cur_.Advance();
        }
        if (cur_.AtEnd()) {
            Fail(line, column, "unterminated raw string");
            return;
        }
        cur_.Advance();

        std::string terminator = ")" + delimiter + "\"";
        size_t end = cur_.Find(terminator);
        if (end == std::string::npos) {
            Fail(line, column, "unterminated raw string");
            return;
        }
        cur_.AdvanceTo(end + terminator.size());
    }

    // pp-number, including digit separators and signed exponents.
    void ScanNumber() {
        char previous = '\0';
        while (!cur_.AtEnd()) {
            char c = cur_.Peek();
            bool exponent_sign = (c == '+' || c == '-') &&
                                 (previous == 'e' || previous == 'E' || previous == 'p' || previous == 'P');
            bool separator = c == '\'' && std::isalnum(static_cast<unsigned char>(cur_.Peek(1)));
            if (!IsIdentContinue(c) && c != '.' && !exponent_sign && !separator) break;
            previous = cur_.Advance();
        }
    }

    void Finish() {
        if (!open_.empty()) {
            const OpenBracket& open = open_.back();
            Fail(open.line, open.column, std::string("expected '") + Closing(open.bracket) +
                 "' to match this '" + open.bracket + "'");
            return;
        }
        if (!entry_found_) {
            diagnostics_.push_back(Diagnostic{0, 0, "no top-level function named '" + entry_ + "'"});
        }
    }
};

bool ParseNumber(const std::string& text, size_t* pos, int* out) {
    size_t start = *pos;
    while (*pos < text.size() && std::isdigit(static_cast<unsigned char>(text[*pos]))) ++*pos;
    if (*pos == start) return false;
    *out = std::atoi(text.substr(start, *pos - start).c_str());
    return true;
}

} // namespace

bool IsIdentifier(const std::string& name) {
    if (name.empty() || name.size() > 128 || !IsIdentStart(name[0])) return false;
    for (char c : name) {
        if (!IsIdentContinue(c)) return false;
    }
    return true;
}

std::vector<Diagnostic> ScanPythonSource(const std::string& source, const std::string& entry_point) {
    return PythonScanner(source, entry_point).Run();
}

std::vector<Diagnostic> ScanCppSource(const std::string& source, const std::string& entry_point) {
    return CppScanner(source, entry_point).Run();
}

std::vector<Diagnostic> ParseToolDiagnostics(const std::string& output, const std::string& label) {
    std::vector<Diagnostic> diagnostics;
    std::istringstream lines(output);
    std::string line;
    const std::string prefix = label + ":";

    while (std::getline(lines, line)) {
        if (line.compare(0, prefix.size(), prefix) != 0) continue;

        size_t pos = prefix.size();
        Diagnostic diagnostic;
        if (!ParseNumber(line, &pos, &diagnostic.line) || pos >= line.size() || line[pos] != ':') continue;
        ++pos;
        if (!ParseNumber(line, &pos, &diagnostic.column) || line.compare(pos, 2, ": ") != 0) continue;
        pos += 2;

        if (line.compare(pos, 13, "fatal error: ") == 0) {
            pos += 13;
        } else if (line.compare(pos, 7, "error: ") == 0) {
            pos += 7;
        } else {
            continue;
        }
        diagnostic.message = line.substr(pos);
        diagnostics.push_back(std::move(diagnostic));
    }
    return diagnostics;
}

std::string FormatDiagnostic(const Diagnostic& diagnostic) {
    if (diagnostic.line <= 0) return diagnostic.message;
    return "line " + std::to_string(diagnostic.line) + ", column " + std::to_string(diagnostic.column) +
           ": " + diagnostic.message;
}

} // namespace aiexec
