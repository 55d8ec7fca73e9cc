// Diagnostics shared by every compilation stage
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace posixc {

enum class DiagnosticKind { ParseError, UnsupportedFeature, LoweringError, EmissionError, ValidationFailure, Warning };
enum class Severity { Error, Warning, Note };

struct SourceSpan { int line=-1; int col=-1; int end_line=-1; int end_col=-1; };
struct DiagnosticNote { std::string message; int line=-1; int col=-1; };

struct Diagnostic {
    std::string code;
    DiagnosticKind kind = DiagnosticKind::ParseError;
    Severity severity = Severity::Error;
    std::string message;
    std::string hint; // suggested fix, may be empty
    SourceSpan span;
    std::vector<DiagnosticNote> notes;
};

const char* kind_name(DiagnosticKind k);
const char* severity_name(Severity s);

// Collects diagnostics up to a bound; the parser is the only aggregating stage.
struct DiagnosticSink {
    std::vector<Diagnostic>* out=nullptr;
    size_t limit=20;
    bool truncated=false;
    bool emit(Diagnostic d);
    bool full() const { return out && out->size() >= limit; }
};

Diagnostic make_error(DiagnosticKind kind, std::string code, std::string message, std::string hint, SourceSpan span);
Diagnostic make_warning(std::string code, std::string message, std::string hint, SourceSpan span);

bool has_errors(const std::vector<Diagnostic>& ds);
bool has_warnings(const std::vector<Diagnostic>& ds);

// "error[E0201]: message (line L:C)" plus indented hint/note lines.
std::string format_diagnostic(const Diagnostic& d);

// Raised inside fail-fast stages and converted at the stage boundary.
class stage_error : public std::runtime_error {
public:
    explicit stage_error(Diagnostic d) : std::runtime_error(d.message), diag_(std::move(d)) {}
    const Diagnostic& diagnostic() const { return diag_; }
private:
    Diagnostic diag_;
};

class LoweringError : public stage_error {
public:
    using stage_error::stage_error;
};

class EmissionError : public stage_error {
public:
    using stage_error::stage_error;
};

} // namespace posixc
