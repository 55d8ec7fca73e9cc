// Independent safety checks before and after emission
#pragma once
#include "posixc/diagnostics.hpp"
#include "posixc/shell_ir.hpp"
#include <string>
#include <vector>

namespace posixc {

struct ValidationReport {
    bool ok=true;
    std::vector<Diagnostic> diagnostics;
};

// IR phase: env names, dynamic evaluation, command substitution shape,
// arithmetic operands and identifiers.
ValidationReport validate_ir(const IrPtr& program);

// Text phase: POSIX grammar re-parse, non-POSIX construct scan and quoting scan.
ValidationReport validate_text(const std::string& script);

// A call that would hand text back to a shell parser (eval, ., source, sh -c ...).
bool is_dynamic_evaluation(const ir::Call& call);

// Programs exec() refuses even with literal arguments.
bool is_evaluating_builtin(const std::string& program);

} // namespace posixc
