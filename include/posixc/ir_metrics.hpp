#pragma once
#include "posixc/shell_ir.hpp"
#include <cstddef>

namespace posixc {

// Size and complexity figures exposed to reporting layers.
struct IrMetrics {
    size_t node_count=0;        // statements plus values
    size_t branch_count=0;      // if/case arms/loops/short-circuit tests
    size_t max_nesting_depth=0; // nested control structures
    size_t function_count=0;
};

IrMetrics compute_metrics(const IrPtr& root);

} // namespace posixc
