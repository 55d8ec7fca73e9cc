#include "posixc/analyzer.hpp"
#include "posixc/features.hpp"
#include <llvm/ADT/Optional.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Program.h>
#include <llvm/Support/raw_ostream.h>
#include <cstdio>
#include <cstdlib>

namespace posixc {

static bool parse_int(const std::string& s, int& out){
    if(s.empty()) return false;
    for(char c : s) if(c < '0' || c > '9') return false;
    out = std::atoi(s.c_str());
    return true;
}

std::vector<AnalyzerFinding> parse_analyzer_output(const std::string& output){
    std::vector<AnalyzerFinding> out;
    size_t start = 0;
    while(start < output.size()){
        size_t end = output.find('\n', start);
        if(end == std::string::npos) end = output.size();
        const std::string line = output.substr(start, end - start);
        start = end + 1;

        // the file name may itself contain ':'; anchor on ": <severity>: "
        size_t sev_sep = line.find(": ");
        if(sev_sep == std::string::npos) continue;
        size_t c2 = line.rfind(':', sev_sep - 1);
        if(c2 == std::string::npos || c2 == 0) continue;
        size_t c1 = line.rfind(':', c2 - 1);
        if(c1 == std::string::npos) continue;
        AnalyzerFinding f;
        if(!parse_int(line.substr(c1 + 1, c2 - c1 - 1), f.line) || !parse_int(line.substr(c2 + 1, sev_sep - c2 - 1), f.col))
            continue;
        std::string rest = line.substr(sev_sep + 2);
        size_t colon = rest.find(": ");
        if(colon == std::string::npos) continue;
        f.severity = rest.substr(0, colon);
        f.message = rest.substr(colon + 2);
        if(f.message.size() > 2 && f.message.back() == ']'){
            size_t open = f.message.rfind(" [");
            if(open != std::string::npos){
                f.code = f.message.substr(open + 2, f.message.size() - open - 3);
                f.message.resize(open);
            }
        }
        out.push_back(std::move(f));
    }
    return out;
}

static Diagnostic analyzer_failure(std::string message){
    return make_error(DiagnosticKind::ValidationFailure, "E0406", std::move(message),
                      "install the analyzer or unset POSIXC_ANALYZER", SourceSpan{});
}

ValidationReport run_analyzer(const AnalyzerConfig& cfg, const std::string& script){
    ValidationReport report;
    if(!cfg.enabled) return report;
    auto fail = [&](Diagnostic d){ report.ok = false; report.diagnostics.push_back(std::move(d)); return report; };

    std::string program = cfg.program;
    if(program.find('/') == std::string::npos){
        auto found = llvm::sys::findProgramByName(program);
        if(!found) return fail(analyzer_failure("analyzer '" + cfg.program + "' not found on PATH"));
        program = *found;
    }

    int fd = -1;
    llvm::SmallString<128> script_path;
    if(auto ec = llvm::sys::fs::createTemporaryFile("posixc-analyze", "sh", fd, script_path))
        return fail(analyzer_failure("cannot create temporary script: " + ec.message()));
    llvm::FileRemover script_remover(script_path);
    {
        llvm::raw_fd_ostream os(fd, /*shouldClose*/true);
        os << script;
        os.close();
        if(os.has_error()){
            std::error_code ec = os.error();
            os.clear_error();
            return fail(analyzer_failure("cannot write temporary script: " + ec.message()));
        }
    }

    llvm::SmallString<128> out_path;
    if(auto ec = llvm::sys::fs::createTemporaryFile("posixc-analyze", "txt", out_path))
        return fail(analyzer_failure("cannot create output file: " + ec.message()));
    llvm::FileRemover out_remover(out_path);

    const std::string severity_arg = "--severity=" + cfg.severity;
    llvm::StringRef args[] = {program, "--shell=sh", "--format=gcc", severity_arg, script_path};
    llvm::Optional<llvm::StringRef> redirects[] = {llvm::StringRef(""), llvm::StringRef(out_path), llvm::StringRef(out_path)};
    std::string err;
    bool exec_failed = false;
    const int rc = llvm::sys::ExecuteAndWait(program, args, llvm::None, redirects, cfg.timeout_seconds, 0, &err, &exec_failed);

    if(debug_validate())
        std::fprintf(stderr, "[dbg][validate] analyzer=%s rc=%d\n", program.c_str(), rc);

    if(exec_failed) return fail(analyzer_failure("cannot run analyzer '" + program + "': " + err));
    if(rc < 0){
        if(rc == -2) return fail(analyzer_failure("analyzer '" + program + "' timed out or crashed" + (err.empty() ? "" : ": " + err)));
        return fail(analyzer_failure("analyzer '" + program + "' failed: " + err));
    }

    std::string output;
    if(auto buf = llvm::MemoryBuffer::getFile(out_path)) output = (*buf)->getBuffer().str();
    else return fail(analyzer_failure("cannot read analyzer output: " + buf.getError().message()));

    for(const auto& f : parse_analyzer_output(output)){
        std::string message = f.severity + ": " + f.message;
        if(!f.code.empty()) message += " [" + f.code + "]";
        report.ok = false;
        report.diagnostics.push_back(make_error(DiagnosticKind::ValidationFailure, "E0405", std::move(message), "",
                                                SourceSpan{f.line, f.col, -1, -1}));
    }
    if(rc != 0 && report.ok)
        return fail(make_error(DiagnosticKind::ValidationFailure, "E0405",
                               "analyzer exited with status " + std::to_string(rc) + " without findings", "",
                               SourceSpan{}));
    return report;
}

} // namespace posixc
