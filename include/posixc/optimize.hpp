// IR-to-IR rewrites gated by Config; each returns a fresh tree.
#pragma once
#include "posixc/config.hpp"
#include "posixc/shell_ir.hpp"

namespace posixc {

struct OptimizeStats {
    size_t folded=0;
    size_t removed_statements=0;
    size_t removed_functions=0;
    size_t inlined_calls=0;
};

ValuePtr fold_value(const ValuePtr& v, bool arithmetic_context = false);
IrPtr fold_constants(const IrPtr& n, OptimizeStats* stats = nullptr);
IrPtr eliminate_dead_code(const IrPtr& program, OptimizeStats* stats = nullptr);
IrPtr inline_calls(const IrPtr& program, unsigned branch_threshold, OptimizeStats* stats = nullptr);

// Runs the enabled passes in order: inlining, folding, dead-code elimination.
IrPtr optimize(const IrPtr& program, const Config& cfg, OptimizeStats* stats = nullptr);

} // namespace posixc
