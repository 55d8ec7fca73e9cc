#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "rustlite/pipeline.hpp"
#include "posixc/config.hpp"
#include "posixc/diagnostics_json.hpp"
#include "posixc/features.hpp"
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

static void posixcFatalHandler(void*, const char* reason, bool){
    fprintf(stderr, "[fatal][llvm] %s\n", reason ? reason : "<null reason>");
    llvm::sys::PrintStackTrace(llvm::errs());
}

static void installCrashHandlersIfRequested(const char* argv0){
    if(!posixc::flag_enabled("POSIXC_STACKTRACE")) return;
    llvm::install_fatal_error_handler(posixcFatalHandler);
    llvm::EnablePrettyStackTrace();
    llvm::sys::PrintStackTraceOnErrorSignal(argv0);
    llvm::sys::AddSignalHandler([](void*){
        fprintf(stderr, "[fatal][signal] caught fatal signal, printing stack trace...\n");
        llvm::sys::PrintStackTrace(llvm::errs());
    }, nullptr);
}

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static void print_diagnostics(const std::string& path, const std::vector<posixc::Diagnostic>& diags){
    for(const auto& d : diags){
        if(d.kind == posixc::DiagnosticKind::ParseError)
            std::cerr << path << ":" << d.span.line << ":" << d.span.col << ": parse error: " << d.message << "\n";
        else
            std::cerr << posixc::format_diagnostic(d);
    }
}

int main(int argc, char** argv){
    installCrashHandlersIfRequested(argv[0]);
    try{
        std::string path, out_path;
        for(int i = 1; i < argc; ++i){
            std::string a = argv[i];
            if(a == "-o" && i + 1 < argc) out_path = argv[++i];
            else if(path.empty() && !a.empty() && a[0] != '-') path = a;
            else { path.clear(); break; }
        }
        if(path.empty()){
            std::cerr << "usage: posixc <input-file> [-o <output-file>]\n";
            return 2;
        }
        std::ifstream f(path, std::ios::binary);
        if(!f){ std::cerr << "posixc: cannot open '" << path << "'\n"; return 2; }
        const auto src = read_all(f);

        posixc::Config cfg = posixc::detect_config();
        cfg.source_name = path;
        auto res = out_path.empty() ? rustlite::compile(src, cfg) : rustlite::compile_to_file(src, cfg, out_path);

        if(res.ir && posixc::flag_enabled("POSIXC_EMIT_IR"))
            std::cerr << posixc::to_sexpr(res.ir) << "\n";
        print_diagnostics(path, res.diagnostics);
        posixc::maybe_print_json(res.success, res.diagnostics, res.metrics);
        if(!res.success) return 1;
        if(out_path.empty()) std::cout << res.script;
        return 0;
    } catch(const std::exception& e){
        std::cerr << "posixc: exception: " << e.what() << "\n";
        return 1;
    }
}
