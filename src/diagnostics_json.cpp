#include "posixc/diagnostics_json.hpp"
#include "posixc/features.hpp"
#include <sstream>
#include <cstdio>

namespace posixc {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes_json(std::ostringstream& os, const std::vector<DiagnosticNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

static void append_diagnostics_json(std::ostringstream& os, bool success, const std::vector<Diagnostic>& diags){
    os<<"\"success\":"<<(success?"true":"false")<<",\"diagnostics\":[";
    for(size_t i=0;i<diags.size(); ++i){
        const auto& d=diags[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"kind\":"<<json_escape(kind_name(d.kind))
            <<",\"severity\":"<<json_escape(severity_name(d.severity))
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.span.line
            <<",\"col\":"<<d.span.col
            <<",\"end_line\":"<<d.span.end_line
            <<",\"end_col\":"<<d.span.end_col
            <<",\"notes\":";
        append_notes_json(os,d.notes);
        os<<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& diags){
    std::ostringstream os;
    os<<"{";
    append_diagnostics_json(os, success, diags);
    os<<"}";
    return os.str();
}

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& diags, const IrMetrics& m){
    std::ostringstream os;
    os<<"{";
    append_diagnostics_json(os, success, diags);
    os<<",\"metrics\":{"
        "\"node_count\":"<<m.node_count
      <<",\"branch_count\":"<<m.branch_count
      <<",\"max_nesting_depth\":"<<m.max_nesting_depth
      <<",\"function_count\":"<<m.function_count
      <<"}}";
    return os.str();
}

void maybe_print_json(bool success, const std::vector<Diagnostic>& diags, const IrMetrics& metrics){
    if(flag_enabled("POSIXC_DIAG_JSON")){
        auto js=diagnostics_to_json(success, diags, metrics);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace posixc
