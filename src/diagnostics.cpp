#include "posixc/diagnostics.hpp"
#include <sstream>

namespace posixc {

const char* kind_name(DiagnosticKind k){
    switch(k){
        case DiagnosticKind::ParseError: return "ParseError";
        case DiagnosticKind::UnsupportedFeature: return "UnsupportedFeature";
        case DiagnosticKind::LoweringError: return "LoweringError";
        case DiagnosticKind::EmissionError: return "EmissionError";
        case DiagnosticKind::ValidationFailure: return "ValidationFailure";
        case DiagnosticKind::Warning: return "Warning";
    }
    return "Unknown";
}

const char* severity_name(Severity s){
    switch(s){
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Note: return "note";
    }
    return "error";
}

bool DiagnosticSink::emit(Diagnostic d){
    if(!out) return false;
    if(out->size() >= limit){
        if(!truncated){
            truncated = true;
            Diagnostic n;
            n.code = d.code;
            n.kind = d.kind;
            n.severity = Severity::Note;
            n.message = "too many diagnostics; further diagnostics suppressed";
            out->push_back(std::move(n));
        }
        return false;
    }
    out->push_back(std::move(d));
    return true;
}

Diagnostic make_error(DiagnosticKind kind, std::string code, std::string message, std::string hint, SourceSpan span){
    Diagnostic d;
    d.code = std::move(code); d.kind = kind; d.severity = Severity::Error;
    d.message = std::move(message); d.hint = std::move(hint); d.span = span;
    return d;
}

Diagnostic make_warning(std::string code, std::string message, std::string hint, SourceSpan span){
    Diagnostic d;
    d.code = std::move(code); d.kind = DiagnosticKind::Warning; d.severity = Severity::Warning;
    d.message = std::move(message); d.hint = std::move(hint); d.span = span;
    return d;
}

bool has_errors(const std::vector<Diagnostic>& ds){
    for(const auto& d : ds) if(d.severity == Severity::Error) return true;
    return false;
}

bool has_warnings(const std::vector<Diagnostic>& ds){
    for(const auto& d : ds) if(d.severity == Severity::Warning) return true;
    return false;
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os << severity_name(d.severity) << "[" << d.code << "]: " << d.message;
    if(d.span.line >= 0) os << " (line " << d.span.line << ":" << d.span.col << ")";
    os << "\n";
    if(!d.hint.empty()) os << "  hint: " << d.hint << "\n";
    for(const auto& n : d.notes){
        os << "  note: " << n.message;
        if(n.line >= 0) os << " (line " << n.line << ":" << n.col << ")";
        os << "\n";
    }
    return os.str();
}

} // namespace posixc
