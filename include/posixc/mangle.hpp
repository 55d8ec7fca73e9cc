// Identifier mangling for names that reach shell output
#pragma once
#include <string>

namespace posixc {

inline constexpr const char* kManglePrefix = "_rl_";
inline constexpr const char* kRuntimePrefix = "posixc_";

// True for reserved words, special builtins and utilities the generated script
// relies on, special or sensitive shell variables, and reserved prefixes.
bool needs_mangling(const std::string& name);

// Injective: a name is returned unchanged unless needs_mangling(name).
std::string mangle(const std::string& name);

} // namespace posixc
