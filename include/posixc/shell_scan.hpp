// Quote-aware scan of shell text
#pragma once
#include <string>
#include <vector>

namespace posixc {

struct ScanFinding {
    size_t offset=0;
    std::string message;
};

// Views have the input's length so offsets line up with the source text.
struct ShellScan {
    std::string code;  // unquoted text; quoted literal text, comments and arithmetic bodies blanked
    std::string arith; // arithmetic bodies only
    std::vector<ScanFinding> unquoted; // expansions that escape double quotes
};

ShellScan scan_shell_text(const std::string& text);

// 1-based line and column of a byte offset.
void offset_to_line_col(const std::string& text, size_t offset, int& line, int& col);

} // namespace posixc
