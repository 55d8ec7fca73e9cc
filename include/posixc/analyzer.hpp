// External static shell analyzer (shellcheck-compatible command line)
#pragma once
#include "posixc/config.hpp"
#include "posixc/validator.hpp"
#include <string>
#include <vector>

namespace posixc {

struct AnalyzerFinding {
    int line=0;
    int col=0;
    std::string severity;
    std::string code; // e.g. SC2086
    std::string message;
};

// Parses gcc-format lines: file:line:col: severity: message [SCnnnn]
std::vector<AnalyzerFinding> parse_analyzer_output(const std::string& output);

// Runs the configured analyzer on script. Findings are E0405; a missing
// program, a crash or a timeout is E0406.
ValidationReport run_analyzer(const AnalyzerConfig& cfg, const std::string& script);

} // namespace posixc
