#include "posixc/shell_scan.hpp"

namespace posixc {

namespace {

bool is_name_char(char c){ return (c>='a'&&c<='z') || (c>='A'&&c<='Z') || (c>='0'&&c<='9') || c=='_'; }

class Scanner {
public:
    explicit Scanner(const std::string& t) : t_(t) {
        out_.code = t;
        out_.arith.assign(t.size(), ' ');
    }

    ShellScan run(){
        size_t i = code(0, false);
        // stray ')' at top level: keep scanning past it
        while(i < t_.size()) i = code(i + 1, false);
        return std::move(out_);
    }

private:
    const std::string& t_;
    ShellScan out_;

    char at(size_t i) const { return i < t_.size() ? t_[i] : '\0'; }
    void blank(size_t i){ if(i < t_.size() && t_[i] != '\n') out_.code[i] = ' '; }
    void flag(size_t i, std::string msg){ out_.unquoted.push_back(ScanFinding{i, std::move(msg)}); }

    bool word_start(size_t i) const {
        if(i == 0) return true;
        char p = t_[i-1];
        return p==' ' || p=='\t' || p=='\n' || p==';' || p=='&' || p=='|' || p=='(';
    }

    // Returns the index just past the construct starting at the '$' in i.
    size_t dollar(size_t i, bool quoted){
        if(at(i+1)=='(' && at(i+2)=='(') return arithmetic(i + 3);
        if(at(i+1)=='('){
            if(!quoted && t_.compare(i, 6, "$(seq ") != 0) flag(i, "unquoted command substitution");
            size_t j = code(i + 2, true);
            return j < t_.size() ? j + 1 : j;
        }
        if(at(i+1)=='{'){
            if(!quoted) flag(i, "unquoted parameter expansion");
            return param(i + 2);
        }
        char n = at(i+1);
        if(n=='@' || n=='*'){
            if(!quoted) flag(i, "unquoted special parameter");
            return i + 2;
        }
        if(is_name_char(n) || n=='#' || n=='?' || n=='!' || n=='$' || n=='-'){
            flag(i, quoted ? "unbraced parameter expansion" : "unquoted parameter expansion");
            size_t j = i + 1;
            if(is_name_char(n) && !(n>='0'&&n<='9')) while(is_name_char(at(j))) ++j;
            else ++j;
            return j;
        }
        return i + 1;
    }

    size_t code(size_t i, bool in_subst){
        int depth = 0;
        while(i < t_.size()){
            char c = t_[i];
            if(c == ')'){
                if(in_subst && depth == 0) return i;
                --depth; ++i; continue;
            }
            if(c == '(' ){ ++depth; ++i; continue; }
            if(c == '\''){
                size_t j = i + 1;
                while(j < t_.size() && t_[j] != '\'') blank(j++);
                i = j + 1;
                continue;
            }
            if(c == '"'){ i = dquote(i + 1); continue; }
            if(c == '\\'){ blank(i + 1); i += 2; continue; }
            if(c == '#' && word_start(i)){
                while(i < t_.size() && t_[i] != '\n') blank(i++);
                continue;
            }
            if(c == '$'){ i = dollar(i, false); continue; }
            ++i;
        }
        return i;
    }

    size_t dquote(size_t i){
        while(i < t_.size()){
            char c = t_[i];
            if(c == '"') return i + 1;
            if(c == '\\'){ blank(i); blank(i + 1); i += 2; continue; }
            if(c == '$'){ i = dollar(i, true); continue; }
            blank(i);
            ++i;
        }
        return i;
    }

    size_t param(size_t i){
        // keep the name and the operator character after it, blank the operand text
        size_t j = i;
        if(at(j)=='#' || at(j)=='!') ++j;
        while(is_name_char(at(j)) || at(j)=='@' || at(j)=='*' || at(j)=='?') ++j;
        if(at(j) != '}' && j < t_.size()) ++j;
        if(at(j-1) == ':' && j < t_.size() && at(j) != '}') ++j;
        i = j;
        while(i < t_.size()){
            char c = t_[i];
            if(c == '}') return i + 1;
            if(c == '\\'){ blank(i); blank(i + 1); i += 2; continue; }
            if(c == '"'){ blank(i); i = dquote(i + 1); blank(i - 1); continue; }
            if(c == '$'){ i = dollar(i, true); continue; }
            blank(i);
            ++i;
        }
        return i;
    }

    size_t arithmetic(size_t i){
        int depth = 0;
        while(i < t_.size()){
            char c = t_[i];
            if(c == '$' && (at(i+1)=='(' || at(i+1)=='{')){
                i = dollar(i, true);
                continue;
            }
            if(c == '('){ ++depth; }
            else if(c == ')'){
                if(depth == 0 && at(i+1) == ')') return i + 2;
                --depth;
            }
            out_.arith[i] = c;
            blank(i);
            ++i;
        }
        return i;
    }
};

} // namespace

ShellScan scan_shell_text(const std::string& text){
    Scanner s(text);
    return s.run();
}

void offset_to_line_col(const std::string& text, size_t offset, int& line, int& col){
    line = 1; col = 1;
    for(size_t i = 0; i < offset && i < text.size(); ++i){
        if(text[i] == '\n'){ ++line; col = 1; }
        else ++col;
    }
}

} // namespace posixc
