// Promotion of a validated script to its final path
#pragma once
#include "posixc/diagnostics.hpp"
#include <optional>
#include <string>

namespace posixc {

// Writes text to a unique temporary file beside path, marks it executable and
// renames it over path. On failure nothing is left at path and an E0413
// diagnostic is returned.
std::optional<Diagnostic> write_artifact(const std::string& path, const std::string& text);

} // namespace posixc
