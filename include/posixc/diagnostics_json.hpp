#pragma once
#include <string>
#include <vector>
#include "posixc/diagnostics.hpp"
#include "posixc/ir_metrics.hpp"

namespace posixc {
// Serialize diagnostics to a compact JSON object
std::string json_escape(const std::string& s);
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& diags);
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& diags, const IrMetrics& metrics);
// Print JSON to stderr when POSIXC_DIAG_JSON=1
void maybe_print_json(bool success, const std::vector<Diagnostic>& diags, const IrMetrics& metrics);
}
