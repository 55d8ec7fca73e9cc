// Allow-listed library surface of the source subset
#pragma once
#include "rustlite/ast.hpp"
#include <string_view>

namespace rustlite {

enum class StdlibOp {
    Env,       // env(name)
    EnvOr,     // env_var_or(name, default)
    Arg,       // arg(n)
    Args,      // args()
    ArgCount,  // arg_count()
    ExitCode,  // exit_code()
    Exit,      // exit(code)
    Exec,      // exec(program, args...)
    Identity,  // String::from(s)
    Empty,     // String::new()
    Runtime,   // shell helper from the runtime library
};

struct StdlibFunction {
    const char* name;     // callee path as written, e.g. "std::process::exit"
    StdlibOp op;
    int min_args;
    int max_args;         // -1 for variadic
    ValueKind result;     // Unit for statement-only functions
    const char* runtime;  // helper name for StdlibOp::Runtime
};

const StdlibFunction* find_stdlib(std::string_view callee);

// Methods accepted on strings and arrays.
struct StdlibMethod {
    const char* name;
    int args;
    ValueKind result;     // Unknown: same as the receiver
    const char* runtime;  // nullptr for identity conversions and len on arrays
};

const StdlibMethod* find_method(std::string_view name);

} // namespace rustlite
