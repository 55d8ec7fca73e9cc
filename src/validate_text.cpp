#include "posixc/validator.hpp"
#include "posixc/features.hpp"
#include "posixc/posix_grammar.hpp"
#include "posixc/shell_scan.hpp"
#include <cstdio>
#include <cstring>

namespace posixc {

namespace {

namespace pegtl = tao::pegtl;

bool is_name_char(char c){ return (c>='a'&&c<='z') || (c>='A'&&c<='Z') || (c>='0'&&c<='9') || c=='_'; }

// True when the token at pos sits where a command name is expected.
bool at_command_start(const std::string& view, size_t pos){
    size_t i = pos;
    while(i > 0 && (view[i-1] == ' ' || view[i-1] == '\t')) --i;
    if(i == 0) return true;
    char p = view[i-1];
    if(p == '\n' || p == ';' || p == '&' || p == '|' || p == '(' || p == '{' || p == '!') return true;
    size_t end = i;
    while(i > 0 && is_name_char(view[i-1])) --i;
    if(i > 0 && view[i-1] != ' ' && view[i-1] != '\t' && view[i-1] != '\n' && view[i-1] != ';') return false;
    const std::string prev = view.substr(i, end - i);
    return prev == "then" || prev == "do" || prev == "else" || prev == "elif" || prev == "if" || prev == "while";
}

bool word_ends(const std::string& view, size_t pos){
    return pos >= view.size() || !is_name_char(view[pos]);
}

class TextChecker {
public:
    explicit TextChecker(const std::string& text) : text_(text) {}
    ValidationReport report;

    void grammar(){
        pegtl::memory_input in(text_.data(), text_.size(), "<generated>");
        try {
            if(!pegtl::parse<posix_grammar::script>(in)) fail_at("E0403", 0, "generated script is not valid POSIX sh");
        } catch(const pegtl::parse_error& e){
            const auto& pos = e.positions().front();
            Diagnostic d = make_error(DiagnosticKind::ValidationFailure, "E0403",
                                      "generated script is not valid POSIX sh",
                                      "this is a compiler bug; please report the input program",
                                      SourceSpan{static_cast<int>(pos.line), static_cast<int>(pos.column), -1, -1});
            report.ok = false;
            report.diagnostics.push_back(std::move(d));
        }
    }

    void constructs(const ShellScan& scan){
        const std::string& code = scan.code;
        static const char* const anywhere[] = {
            "[[", "]]", "<<<", "&>", "|&", "<(", ">(", "$'", "${!", "==", "=(",
            "$RANDOM", "${RANDOM", "$BASH", "${BASH", "$SECONDS", "${SECONDS",
        };
        for(const char* pat : anywhere){
            for(size_t at = code.find(pat); at != std::string::npos; at = code.find(pat, at + 1))
                fail_at("E0404", at, std::string("non-POSIX construct '") + pat + "'");
        }

        static const char* const commands[] = {
            "function", "local", "declare", "typeset", "source", "let", "select", "shopt", "pushd", "popd",
        };
        for(const char* cmd : commands){
            const size_t len = std::strlen(cmd);
            for(size_t at = code.find(cmd); at != std::string::npos; at = code.find(cmd, at + 1)){
                if(at > 0 && is_name_char(code[at-1])) continue;
                if(!word_ends(code, at + len) || !at_command_start(code, at)) continue;
                fail_at("E0404", at, std::string("non-POSIX command '") + cmd + "'");
            }
        }
        for(size_t at = code.find("echo"); at != std::string::npos; at = code.find("echo", at + 1)){
            if(!at_command_start(code, at)) continue;
            if(code.compare(at, 8, "echo -e ") == 0 || code.compare(at, 8, "echo -n ") == 0)
                fail_at("E0404", at, "echo with options is not portable");
        }
        for(size_t at = code.find("(("); at != std::string::npos; at = code.find("((", at + 2)){
            if(at > 0 && code[at-1] == '$') continue;
            if(at_command_start(code, at)) fail_at("E0404", at, "arithmetic command '((...))'");
        }

        // ${name[ ${name/ ${name, ${name^ ${name:N
        for(size_t at = code.find("${"); at != std::string::npos; at = code.find("${", at + 2)){
            size_t j = at + 2;
            while(j < code.size() && is_name_char(code[j])) ++j;
            if(j == at + 2 || j >= code.size()) continue;
            char op = code[j];
            char next = j + 1 < code.size() ? code[j+1] : '\0';
            bool bad = op == '[' || op == '/' || op == ',' || op == '^'
                    || (op == ':' && ((next >= '0' && next <= '9') || next == ' '));
            if(bad) fail_at("E0404", at, "non-POSIX parameter expansion");
        }

        // brace ranges {a..b}
        for(size_t at = code.find('{'); at != std::string::npos; at = code.find('{', at + 1)){
            size_t j = at + 1;
            while(j < code.size() && is_name_char(code[j])) ++j;
            if(j > at + 1 && code.compare(j, 2, "..") == 0) fail_at("E0404", at, "brace range expansion");
        }

        const std::string& arith = scan.arith;
        for(const char* pat : {"**", "++", "--"}){
            for(size_t at = arith.find(pat); at != std::string::npos; at = arith.find(pat, at + 2))
                fail_at("E0404", at, std::string("non-POSIX arithmetic operator '") + pat + "'");
        }
    }

    void quoting(const ShellScan& scan){
        for(const auto& f : scan.unquoted) fail_at("E0408", f.offset, f.message);
    }

private:
    const std::string& text_;

    void fail_at(const char* code, size_t offset, std::string message){
        int line = 0, col = 0;
        offset_to_line_col(text_, offset, line, col);
        report.ok = false;
        report.diagnostics.push_back(make_error(DiagnosticKind::ValidationFailure, code, std::move(message),
                                                "", SourceSpan{line, col, -1, -1}));
    }
};

} // namespace

ValidationReport validate_text(const std::string& script){
    TextChecker checker(script);
    checker.grammar();
    const ShellScan scan = scan_shell_text(script);
    checker.constructs(scan);
    checker.quoting(scan);
    if(debug_validate())
        std::fprintf(stderr, "[dbg][validate] text ok=%d diagnostics=%zu bytes=%zu\n", checker.report.ok ? 1 : 0,
                     checker.report.diagnostics.size(), script.size());
    return std::move(checker.report);
}

} // namespace posixc
