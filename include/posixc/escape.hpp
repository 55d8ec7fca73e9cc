// Literal-level quoting primitives used by the emitter's escape routine
#pragma once
#include <string>
#include <string_view>

namespace posixc {

// Characters that never need quoting: A-Z a-z 0-9 _ . / : , + = @ % -
bool is_shell_safe_char(char c);
bool is_shell_safe(std::string_view s); // false for the empty string

// 'text' with embedded quotes written as '\''
std::string single_quote(std::string_view s);

// Bare when shell-safe, single-quoted otherwise.
std::string quote_literal(std::string_view s);

// Backslash-escapes $ ` " \ for a double-quoted context; inside a ${VAR:-...}
// default the closing brace is escaped as well.
std::string escape_double_quoted(std::string_view s, bool in_param_default);

// Replaces control characters so text can sit in a comment line.
std::string sanitize_comment(std::string_view s);

} // namespace posixc
