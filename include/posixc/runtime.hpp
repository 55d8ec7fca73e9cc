// Shell helper functions backing the stdlib allow-list
#pragma once
#include <string>
#include <vector>

namespace posixc {

struct RuntimeFunction {
    const char* name;
    const char* text; // full definition, newline terminated
};

// Sorted by name.
const std::vector<RuntimeFunction>& runtime_functions();
const RuntimeFunction* find_runtime(const std::string& name);

} // namespace posixc
