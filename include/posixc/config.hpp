// Compilation options; read-only once a compile starts
#pragma once
#include <string>

#ifndef POSIXC_VERSION
#define POSIXC_VERSION "0.1.0"
#endif

namespace posixc {

struct AnalyzerConfig {
    bool enabled=false;
    std::string program;          // name on PATH or absolute path
    std::string severity="warning";
    unsigned timeout_seconds=10;
};

struct Config {
    bool strict_mode=false;
    bool enable_dead_code_elimination=true;
    bool enable_constant_folding=true;
    bool enable_inlining=false;
    unsigned inline_branch_threshold=10;
    size_t max_diagnostics=20;
    bool verify_determinism=true;
    AnalyzerConfig analyzer;
    std::string source_name="<memory>";
};

// Defaults overridden by POSIXC_* environment variables.
Config detect_config();

inline const char* generator_version(){ return POSIXC_VERSION; }

} // namespace posixc
