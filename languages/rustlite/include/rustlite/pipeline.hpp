// Source text -> validated POSIX sh text
#pragma once
#include "posixc/config.hpp"
#include "posixc/diagnostics.hpp"
#include "posixc/ir_metrics.hpp"
#include "posixc/shell_ir.hpp"
#include <string>
#include <vector>

namespace rustlite {

struct CompileResult {
    bool success=false;
    std::string script; // empty unless success
    std::string digest; // sha256 of script
    posixc::IrPtr ir;   // optimized IR, when lowering succeeded
    std::vector<posixc::Diagnostic> diagnostics;
    posixc::IrMetrics metrics;
};

// Parse, lower, optimize, validate the IR, emit, validate the text, run the
// configured analyzer and, when enabled, repeat the chain to verify determinism.
CompileResult compile(const std::string& source, const posixc::Config& config);

// As compile, then promotes the script to path. Nothing exists at path unless
// the result is successful.
CompileResult compile_to_file(const std::string& source, const posixc::Config& config, const std::string& path);

} // namespace rustlite
