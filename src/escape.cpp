#include "posixc/escape.hpp"

namespace posixc {

bool is_shell_safe_char(char c){
    if((c>='a'&&c<='z') || (c>='A'&&c<='Z') || (c>='0'&&c<='9')) return true;
    switch(c){
        case '_': case '.': case '/': case ':': case ',': case '+': case '=': case '@': case '%': case '-':
            return true;
        default:
            return false;
    }
}

bool is_shell_safe(std::string_view s){
    if(s.empty()) return false;
    for(char c : s) if(!is_shell_safe_char(c)) return false;
    return true;
}

std::string single_quote(std::string_view s){
    std::string out = "'";
    for(char c : s){
        if(c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string quote_literal(std::string_view s){
    if(is_shell_safe(s)) return std::string(s);
    return single_quote(s);
}

std::string escape_double_quoted(std::string_view s, bool in_param_default){
    std::string out;
    out.reserve(s.size());
    for(char c : s){
        if(c=='$' || c=='`' || c=='"' || c=='\\' || (in_param_default && c=='}')) out += '\\';
        out += c;
    }
    return out;
}

std::string sanitize_comment(std::string_view s){
    std::string out;
    for(char c : s) out += (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) ? '?' : c;
    return out;
}

} // namespace posixc
