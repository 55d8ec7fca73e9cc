#include "rustlite/pipeline.hpp"
#include "../parser/parser.hpp"
#include "rustlite/lower.hpp"
#include "posixc/analyzer.hpp"
#include "posixc/artifact.hpp"
#include "posixc/digest.hpp"
#include "posixc/emitter.hpp"
#include "posixc/features.hpp"
#include "posixc/optimize.hpp"
#include "posixc/validator.hpp"
#include <cstdio>

using namespace posixc;

namespace rustlite {

static void append(std::vector<Diagnostic>& out, const std::vector<Diagnostic>& more){
    out.insert(out.end(), more.begin(), more.end());
}

// One pass of every in-process stage; the analyzer and determinism check run outside.
static CompileResult run_stages(const std::string& source, const Config& config){
    CompileResult r;
    Parser parser;
    ParseResult parsed = parser.parse_string(source, config.source_name, config.max_diagnostics);
    append(r.diagnostics, parsed.diagnostics);
    if(!parsed.success) return r;

    LowerResult lowered = lower_program(parsed.program);
    append(r.diagnostics, lowered.diagnostics);
    if(!lowered.success) return r;

    OptimizeStats stats;
    r.ir = optimize(lowered.ir, config, &stats);
    r.metrics = compute_metrics(r.ir);

    ValidationReport ir_report = validate_ir(r.ir);
    append(r.diagnostics, ir_report.diagnostics);
    if(!ir_report.ok) return r;

    try {
        PosixEmitter emitter(EmitOptions{config.source_name, sha256_hex(source)});
        r.script = emitter.emit(r.ir);
    } catch(const EmissionError& e){
        r.diagnostics.push_back(e.diagnostic());
        r.script.clear();
        return r;
    }

    ValidationReport text_report = validate_text(r.script);
    append(r.diagnostics, text_report.diagnostics);
    if(!text_report.ok){
        r.script.clear();
        return r;
    }
    r.digest = sha256_hex(r.script);
    r.success = true;
    return r;
}

CompileResult compile(const std::string& source, const Config& config){
    CompileResult r = run_stages(source, config);
    if(!r.success) return r;

    auto fail = [&r]{
        r.success = false;
        r.script.clear();
        r.digest.clear();
    };

    ValidationReport analyzer = run_analyzer(config.analyzer, r.script);
    append(r.diagnostics, analyzer.diagnostics);
    if(!analyzer.ok){
        fail();
        return r;
    }

    if(config.verify_determinism){
        CompileResult again = run_stages(source, config);
        if(!again.success || again.digest != r.digest){
            r.diagnostics.push_back(make_error(DiagnosticKind::ValidationFailure, "E0407",
                                               "compiling the same input twice produced different output (sha256 " +
                                               r.digest + " vs " + (again.digest.empty() ? std::string("none") : again.digest) + ")",
                                               "this is a compiler bug; please report the input program", SourceSpan{}));
            fail();
            return r;
        }
    }

    if(config.strict_mode && has_warnings(r.diagnostics)){
        size_t warnings = 0;
        for(const auto& d : r.diagnostics) if(d.severity == Severity::Warning) ++warnings;
        r.diagnostics.push_back(make_error(DiagnosticKind::ValidationFailure, "E0412",
                                           "strict mode: " + std::to_string(warnings) + " warning(s) treated as errors",
                                           "fix the warnings or unset POSIXC_STRICT", SourceSpan{}));
        fail();
        return r;
    }
    if(debug_validate())
        std::fprintf(stderr, "[dbg][validate] compile ok digest=%s\n", r.digest.c_str());
    return r;
}

CompileResult compile_to_file(const std::string& source, const Config& config, const std::string& path){
    CompileResult r = compile(source, config);
    if(!r.success) return r;
    if(auto failure = write_artifact(path, r.script)){
        r.diagnostics.push_back(*failure);
        r.success = false;
        r.script.clear();
        r.digest.clear();
    }
    return r;
}

} // namespace rustlite
