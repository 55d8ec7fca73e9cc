#include "rustlite/stdlib.hpp"

namespace rustlite {

namespace {

const StdlibFunction kFunctions[] = {
    {"env", StdlibOp::Env, 1, 1, ValueKind::Str, nullptr},
    {"env_var_or", StdlibOp::EnvOr, 2, 2, ValueKind::Str, nullptr},
    {"arg", StdlibOp::Arg, 1, 1, ValueKind::Str, nullptr},
    {"args", StdlibOp::Args, 0, 0, ValueKind::Str, nullptr},
    {"arg_count", StdlibOp::ArgCount, 0, 0, ValueKind::Int, nullptr},
    {"exit_code", StdlibOp::ExitCode, 0, 0, ValueKind::Int, nullptr},
    {"exit", StdlibOp::Exit, 1, 1, ValueKind::Unit, nullptr},
    {"process::exit", StdlibOp::Exit, 1, 1, ValueKind::Unit, nullptr},
    {"std::process::exit", StdlibOp::Exit, 1, 1, ValueKind::Unit, nullptr},
    {"exec", StdlibOp::Exec, 1, -1, ValueKind::Str, nullptr},
    {"String::from", StdlibOp::Identity, 1, 1, ValueKind::Str, nullptr},
    {"String::new", StdlibOp::Empty, 0, 0, ValueKind::Str, nullptr},
    {"string_trim", StdlibOp::Runtime, 1, 1, ValueKind::Str, "posixc_string_trim"},
    {"string_contains", StdlibOp::Runtime, 2, 2, ValueKind::Bool, "posixc_string_contains"},
    {"string_starts_with", StdlibOp::Runtime, 2, 2, ValueKind::Bool, "posixc_string_starts_with"},
    {"string_ends_with", StdlibOp::Runtime, 2, 2, ValueKind::Bool, "posixc_string_ends_with"},
    {"string_len", StdlibOp::Runtime, 1, 1, ValueKind::Int, "posixc_string_len"},
    {"string_replace", StdlibOp::Runtime, 3, 3, ValueKind::Str, "posixc_string_replace"},
    {"string_to_upper", StdlibOp::Runtime, 1, 1, ValueKind::Str, "posixc_string_to_upper"},
    {"string_to_lower", StdlibOp::Runtime, 1, 1, ValueKind::Str, "posixc_string_to_lower"},
    {"fs_exists", StdlibOp::Runtime, 1, 1, ValueKind::Bool, "posixc_fs_exists"},
    {"fs_is_file", StdlibOp::Runtime, 1, 1, ValueKind::Bool, "posixc_fs_is_file"},
    {"fs_is_dir", StdlibOp::Runtime, 1, 1, ValueKind::Bool, "posixc_fs_is_dir"},
    {"fs_read_file", StdlibOp::Runtime, 1, 1, ValueKind::Str, "posixc_fs_read_file"},
    {"fs_write_file", StdlibOp::Runtime, 2, 2, ValueKind::Unit, "posixc_fs_write_file"},
    {"fs_mkdir", StdlibOp::Runtime, 1, 1, ValueKind::Unit, "posixc_fs_mkdir"},
    {"fs_remove", StdlibOp::Runtime, 1, 1, ValueKind::Unit, "posixc_fs_remove"},
    {"fs_copy", StdlibOp::Runtime, 2, 2, ValueKind::Unit, "posixc_fs_copy"},
    {"require", StdlibOp::Runtime, 1, 1, ValueKind::Unit, "posixc_require"},
};

const StdlibMethod kMethods[] = {
    {"to_string", 0, ValueKind::Str, nullptr},
    {"to_owned", 0, ValueKind::Unknown, nullptr},
    {"clone", 0, ValueKind::Unknown, nullptr},
    {"as_str", 0, ValueKind::Str, nullptr},
    {"into", 0, ValueKind::Unknown, nullptr},
    {"len", 0, ValueKind::Int, "posixc_string_len"},
    {"trim", 0, ValueKind::Str, "posixc_string_trim"},
    {"contains", 1, ValueKind::Bool, "posixc_string_contains"},
    {"starts_with", 1, ValueKind::Bool, "posixc_string_starts_with"},
    {"ends_with", 1, ValueKind::Bool, "posixc_string_ends_with"},
    {"replace", 2, ValueKind::Str, "posixc_string_replace"},
    {"to_uppercase", 0, ValueKind::Str, "posixc_string_to_upper"},
    {"to_lowercase", 0, ValueKind::Str, "posixc_string_to_lower"},
};

} // namespace

const StdlibFunction* find_stdlib(std::string_view callee){
    for(const auto& f : kFunctions) if(callee == f.name) return &f;
    return nullptr;
}

const StdlibMethod* find_method(std::string_view name){
    for(const auto& m : kMethods) if(name == m.name) return &m;
    return nullptr;
}

} // namespace rustlite
