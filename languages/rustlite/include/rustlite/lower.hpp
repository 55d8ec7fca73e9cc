// AST -> ShellIR
#pragma once
#include "rustlite/ast.hpp"
#include "posixc/diagnostics.hpp"
#include "posixc/shell_ir.hpp"
#include <vector>

namespace rustlite {

struct LowerResult {
    bool success=false;
    posixc::IrPtr ir; // Seq of FunctionDef, main last
    std::vector<posixc::Diagnostic> diagnostics; // the failing error, if any, plus warnings
};

// Pure: lowering the same program twice yields IR equal under ir_equal.
LowerResult lower_program(const Program& program);

} // namespace rustlite
