#pragma once
#include "rustlite/ast.hpp"
#include "posixc/diagnostics.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace rustlite {

struct ParseResult {
    bool success{false};
    Program program;                            // valid only when success
    std::vector<posixc::Diagnostic> diagnostics; // parse errors, unsupported features, warnings
};

class Parser {
public:
    // Syntax errors stop the parse; unsupported features are collected up to
    // max_diagnostics so one run reports all of them.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>",
                             size_t max_diagnostics = 20) const;
};

} // namespace rustlite
